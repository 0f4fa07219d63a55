#pragma once

#include "./chunked_reader.hpp"

#include <neo/fwd.hpp>

#include <concepts>
#include <functional>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>

namespace sluice {

/**
 * @brief A readable stream over any range of text chunks.
 *
 * Each element of the range is one chunk. Elements are only pulled from the range as reads
 * require them, so lazily-generated ranges are consumed lazily. This is the simple, thread-free
 * way to read from a producer that can *return* its output rather than *write* it; prefer it to
 * pipe_stream wherever the producer can be shaped that way.
 *
 * @tparam R An input range whose elements are convertible to std::string_view
 */
template <std::ranges::input_range R>
requires std::convertible_to<std::ranges::range_reference_t<R>, std::string_view>  //
    class iterator_reader : public chunked_reader {
    using iterator_type = std::ranges::iterator_t<R>;
    using sentinel_type = std::ranges::sentinel_t<R>;

    R                            _range;
    std::optional<iterator_type> _iter;

    std::optional<std::string> do_next_chunk() override {
        if (!_iter) {
            // Begin iteration on the first request
            _iter.emplace(std::ranges::begin(_range));
        }
        if (*_iter == std::ranges::end(_range)) {
            return std::nullopt;
        }
        std::string chunk{std::string_view(**_iter)};
        ++*_iter;
        return chunk;
    }

public:
    /// Take ownership of (or a view of) the given range of chunks
    explicit iterator_reader(R&& range)
        : _range(NEO_FWD(range)) {}

    /// Close the reader on destruction
    ~iterator_reader() { close(); }
};

template <typename R>
iterator_reader(R&&) -> iterator_reader<R>;

/**
 * @brief A readable stream over chunks returned from successive calls to a function.
 *
 * The function returns each chunk in turn, and std::nullopt once it has no more. It is not called
 * again after returning nullopt. Exceptions thrown by the function propagate out of the read
 * operation that requested the chunk.
 */
class function_reader : public chunked_reader {
public:
    /// The type of the chunk-generating function
    using generator_fn = std::function<std::optional<std::string>()>;

private:
    generator_fn _next;
    bool         _exhausted = false;

    std::optional<std::string> do_next_chunk() override;
    void                       do_close() noexcept override;

public:
    /// Read chunks from `fn`
    explicit function_reader(generator_fn fn);

    /// Close the reader on destruction
    ~function_reader() { close(); }
};

}  // namespace sluice
