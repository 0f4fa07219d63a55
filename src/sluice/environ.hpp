#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace sluice {

/**
 * @brief Get the environment variable named by the given key
 *
 * @param key The name of an environment variable to get
 */
std::optional<std::string> getenv(std::string_view key) noexcept;

/**
 * @brief Get an environment variable as a positive integer.
 *
 * @param key The name of the variable to get
 * @return std::optional<std::size_t> nullopt if the variable is unset or empty
 *
 * @throws config_error if the variable is set to anything other than a positive decimal integer
 */
std::optional<std::size_t> getenv_size(std::string_view key);

}  // namespace sluice
