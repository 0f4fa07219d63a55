#pragma once

#include "./chunked_reader.hpp"
#include "./handoff_queue.hpp"
#include "./options.hpp"

#include <neo/fwd.hpp>

#include <atomic>
#include <concepts>
#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

namespace sluice {

/**
 * @brief A readable stream of the text written by a producer function.
 *
 * Some producers can only *write* their output into a sink that they are handed (e.g. a library
 * callback that wants a writable stream). A pipe_stream runs such a producer on a thread of its
 * own, handing it the pipe_stream as its sink, and makes everything it writes available to be
 * *read* from the calling thread, as if from the read-end of an OS pipe.
 *
 * The producer is started by the first read. Each write() from the producer is one chunk, which
 * is passed to the reader through a queue of at most `buffer_size` chunks. When the queue is
 * full, write() blocks until the reader catches up, so the producer can never get more than
 * `buffer_size` chunks ahead.
 *
 * If the producer throws, the exception is caught on the producer thread and rethrown from the
 * reader's next read that reaches the end of the chunks the producer managed to write.
 *
 * Closing the pipe (explicitly, or by destroying it) makes any pending or future write() from the
 * producer throw closed_stream_error, which a producer may simply let propagate. The producer
 * thread is then joined. A producer that never writes again and never returns will hold up
 * close(): stopping the producer is cooperative.
 *
 * close() belongs to the reader, and must not be called by the producer. A producer that wants
 * to refuse any further writes to the pipe (its own, or from code it hands the pipe to) calls
 * close_write() instead.
 *
 * If at all possible, have the producer return its chunks instead, and read them through an
 * iterator_reader or function_reader. No thread is needed for those.
 *
 * This type is immobile, since the producer holds a reference to it. Use the pipe_text()
 * functions to create pipes in place.
 */
class pipe_stream : public chunked_reader {
public:
    /// The type of a producer function
    using producer_fn = std::function<void(pipe_stream&)>;

private:
    producer_fn                _producer;
    handoff_queue<std::string> _queue;
    std::thread                _thread;
    /// Whether the producer thread has been started. Only touched by the reader.
    bool _started = false;
    /// Exception thrown by the producer. Published to the reader by _queue.finish()
    std::exception_ptr _producer_error;
    /// Set by close_write()
    std::atomic<bool> _write_closed{false};

    /// Start the producer thread, if it has not been started
    void _ensure_started();
    /// Body of the producer thread
    void _run_producer() noexcept;
    /// Join the producer thread
    void _join() noexcept;

    std::optional<std::string> do_next_chunk() override;
    void                       do_close() noexcept override;

public:
    /**
     * @brief Create a pipe that will read the output of the given producer.
     *
     * The producer is not started until the first read.
     *
     * @param producer A function that writes into the pipe_stream it is given, and then returns
     * @param opts Options for the pipe
     */
    explicit pipe_stream(producer_fn producer, pipe_options opts = {});

    /// Close the pipe and join the producer thread
    ~pipe_stream();

    // This type is immobile
    pipe_stream(pipe_stream&&) = delete;
    pipe_stream& operator=(pipe_stream&&) = delete;

    /**
     * @brief Write a chunk of text into the pipe. Must only be called by the producer.
     *
     * Blocks while the pipe's buffer is full.
     *
     * @param chunk The text to write. May be empty.
     * @return std::size_t The number of characters written (always `chunk.size()`)
     *
     * @throws closed_stream_error if the pipe has been closed, including while waiting for room, or
     * if the producer has called close_write()
     */
    std::size_t write(std::string_view chunk);

    /**
     * @brief End the producer's output. Must only be called by the producer.
     *
     * Every later write() throws closed_stream_error. Chunks already written are still delivered,
     * and the reader sees the end of the stream once the producer returns.
     */
    void close_write();

    /**
     * @brief Check that the pipe can be written to.
     *
     * @return true always
     * @throws closed_stream_error if the pipe has been closed, by either side
     */
    bool writable() const;

    /// Whether the producer thread has been started
    [[nodiscard]] bool started() const noexcept { return _started; }

    /// Whether the producer has been started and has not yet returned
    [[nodiscard]] bool producer_running() const noexcept {
        return _started && !_queue.finished();
    }

    /// The number of chunks the producer may write ahead of the reader
    [[nodiscard]] std::size_t buffer_size() const noexcept { return _queue.capacity(); }
};

/**
 * @brief Create a pipe_stream that reads the output of `fn(pipe, args...)`
 *
 * The extra arguments are copied (or moved) into the pipe and passed to the producer as lvalues
 * after the pipe itself. The function and the arguments must be copy-constructible, since the
 * producer is held in a std::function.
 *
 * @param opts Options for the new pipe
 * @param fn The producer function
 * @param args Additional arguments to the producer function
 */
template <typename F, typename... Args>
requires std::invocable<std::decay_t<F>&, pipe_stream&, std::decay_t<Args>&...>  //
    && std::copy_constructible<std::decay_t<F>>                                     //
    && (std::copy_constructible<std::decay_t<Args>> && ...)                         //
    pipe_stream pipe_text(pipe_options opts, F&& fn, Args&&... args) {
    return pipe_stream(
        [fn = NEO_FWD(fn), ... args = NEO_FWD(args)](pipe_stream& pipe) mutable {
            std::invoke(fn, pipe, args...);
        },
        opts);
}

/**
 * @brief Create a pipe_stream with default options that reads the output of `fn(pipe, args...)`
 */
template <typename F, typename... Args>
requires std::invocable<std::decay_t<F>&, pipe_stream&, std::decay_t<Args>&...>  //
    && std::copy_constructible<std::decay_t<F>>                                     //
    && (std::copy_constructible<std::decay_t<Args>> && ...)                         //
    pipe_stream pipe_text(F&& fn, Args&&... args) {
    return pipe_text(pipe_options{}, NEO_FWD(fn), NEO_FWD(args)...);
}

}  // namespace sluice
