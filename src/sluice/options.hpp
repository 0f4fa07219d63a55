#pragma once

#include <cstddef>

namespace sluice {

/**
 * @brief Construction options for a pipe_stream.
 */
struct pipe_options {
    /// The queue capacity used when none is given
    static constexpr std::size_t default_buffer_size = 10;

    /// The name of the environment variable consulted by from_environment()
    static constexpr const char* buffer_size_env = "SLUICE_PIPE_BUFFER_SIZE";

    /**
     * @brief The number of chunks that the producer may write ahead of the reader.
     *
     * Once this many chunks are waiting to be read, the producer's next write() will block until
     * the reader takes one. Smaller values bound memory more tightly; larger values let a bursty
     * producer run further ahead. Zero selects `default_buffer_size`.
     */
    std::size_t buffer_size = default_buffer_size;

    /// The buffer_size that will actually be used (substitutes the default for zero)
    [[nodiscard]] constexpr std::size_t effective_buffer_size() const noexcept {
        return buffer_size ? buffer_size : default_buffer_size;
    }

    /**
     * @brief Load options from the process environment, falling back to the defaults for unset
     * variables.
     *
     * Reads `SLUICE_PIPE_BUFFER_SIZE` (a positive integer).
     *
     * @throws config_error if a variable is set to an invalid value
     */
    [[nodiscard]] static pipe_options from_environment();
};

}  // namespace sluice
