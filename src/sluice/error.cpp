#include "./error.hpp"

#include <neo/ufmt.hpp>

using namespace sluice;

void sluice::throw_closed(std::string_view operation) {
    throw closed_stream_error(
        neo::ufmt("{} ({}() was called)", closed_stream_error::default_message, operation));
}

void sluice::throw_bad_config(std::string_view key,
                              std::string_view value,
                              std::string_view expected) {
    throw config_error(
        neo::ufmt("Invalid value '{}' for configuration [{}]: expected {}", value, key, expected));
}
