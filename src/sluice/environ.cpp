#include "./environ.hpp"

#include "./error.hpp"

#include <charconv>
#include <cstdlib>

using namespace sluice;

std::optional<std::string> sluice::getenv(std::string_view key) noexcept {
    // std::getenv needs a null-terminated name
    const std::string name(key);
    auto              ptr = std::getenv(name.data());
    if (ptr) {
        return std::make_optional(std::string(ptr));
    } else {
        return std::nullopt;
    }
}

std::optional<std::size_t> sluice::getenv_size(std::string_view key) {
    auto value = sluice::getenv(key);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    std::size_t ret   = 0;
    const auto  first = value->data();
    const auto  last  = first + value->size();
    auto [ptr, ec]    = std::from_chars(first, last, ret);
    if (ec != std::errc{} || ptr != last || ret == 0) {
        throw_bad_config(key, *value, "a positive integer");
    }
    return ret;
}
