#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace sluice {

/**
 * @brief Exception thrown when an I/O operation is attempted on a stream that has been closed.
 *
 * This is an expected, checkable condition: reading from a closed reader, or writing into a pipe
 * whose reader has gone away. Derives from std::logic_error.
 */
struct closed_stream_error : std::logic_error {
    /// The message used when no other message is given
    static constexpr const char* default_message = "I/O operation on closed stream";

    closed_stream_error()
        : logic_error(default_message) {}

    using logic_error::logic_error;
};

/**
 * @brief Exception thrown if a configuration value (e.g. from an environment variable) cannot be
 * understood.
 *
 * Derives from std::runtime_error
 */
struct config_error : std::runtime_error {
    using runtime_error::runtime_error;
};

/**
 * @brief Throw a closed_stream_error for an attempted operation
 *
 * @param operation The name of the operation that was attempted (e.g. "read")
 */
[[noreturn]] void throw_closed(std::string_view operation);

/**
 * @brief Throw a config_error for a configuration key that holds an unusable value
 *
 * @param key The name of the setting
 * @param value The value that was given
 * @param expected A short description of what was expected instead
 */
[[noreturn]] void
throw_bad_config(std::string_view key, std::string_view value, std::string_view expected);

}  // namespace sluice
