#include "./iterator_reader.hpp"

#include <neo/assert.hpp>

using namespace sluice;

function_reader::function_reader(generator_fn fn)
    : _next(std::move(fn)) {
    neo_assert(expects, !!_next, "function_reader was constructed with an empty function");
}

std::optional<std::string> function_reader::do_next_chunk() {
    if (_exhausted) {
        return std::nullopt;
    }
    auto chunk = _next();
    if (!chunk) {
        _exhausted = true;
        // Release whatever state the function was holding
        _next = nullptr;
    }
    return chunk;
}

void function_reader::do_close() noexcept { _next = nullptr; }
