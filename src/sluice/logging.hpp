#pragma once

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/trivial.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace sluice {

/// Severity levels of the Boost.Log trivial logger, which sluice logs through
using log_level = boost::log::trivial::severity_level;

/// The name of the environment variable consulted by configure_logging_from_environment()
inline constexpr const char* log_level_env = "SLUICE_LOG_LEVEL";

/// The value of the Boost.Log "Channel" attribute on every record that sluice emits
inline constexpr const char* log_channel = "sluice";

/// The logger type that sluice emits its records through
using logger_type = boost::log::sources::severity_channel_logger_mt<log_level, std::string>;

/**
 * @brief Enable sluice's log records at the given severity and above.
 *
 * sluice is silent until this is called. It logs pipe producer lifecycle events at `debug` and
 * individual chunks at `trace`. Records carry the "Severity" attribute (compatible with
 * `boost::log::trivial::severity`) and a "Channel" attribute of `log_channel`, so applications
 * may filter them further with their own sinks.
 */
void set_log_level(log_level level) noexcept;

/// Stop emitting log records. This is the initial state.
void disable_logging() noexcept;

/// Whether records of the given severity are currently emitted
[[nodiscard]] bool log_enabled(log_level level) noexcept;

/**
 * @brief Parse a severity name ("trace", "debug", "info", "warning", "error", "fatal")
 *
 * @return std::optional<log_level> nullopt if the name is not recognized
 */
[[nodiscard]] std::optional<log_level> parse_log_level(std::string_view name) noexcept;

/**
 * @brief Set the log level from the `SLUICE_LOG_LEVEL` environment variable.
 *
 * The variable holds a severity name, or "off" to disable logging. If it is unset or empty, the
 * current setting is left alone.
 *
 * @throws config_error if the variable names an unknown severity
 */
void configure_logging_from_environment();

namespace detail {

/// The logger shared by all of sluice
logger_type& logger() noexcept;

}  // namespace detail

}  // namespace sluice

/**
 * @brief Begin a sluice log record at the named severity, e.g. `SLUICE_LOG(debug) << "text"`.
 *
 * The streamed expression is not evaluated unless the severity is enabled with set_log_level().
 */
#define SLUICE_LOG(Level)                                                                          \
    if (!::sluice::log_enabled(::sluice::log_level::Level)) {                                      \
    } else                                                                                         \
        BOOST_LOG_SEV(::sluice::detail::logger(), ::sluice::log_level::Level)
