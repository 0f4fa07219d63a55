#include "./pipe.hpp"

#include "./error.hpp"
#include "./logging.hpp"

#include <neo/assert.hpp>

using namespace sluice;

pipe_stream::pipe_stream(producer_fn producer, pipe_options opts)
    : _producer(std::move(producer))
    , _queue(opts.effective_buffer_size()) {
    neo_assert(expects, !!_producer, "pipe_stream was constructed with an empty producer");
}

pipe_stream::~pipe_stream() {
    neo_assert(expects,
               !_thread.joinable() || _thread.get_id() != std::this_thread::get_id(),
               "A pipe_stream was destroyed from within its own producer");
    close();
}

void pipe_stream::_ensure_started() {
    if (_started) {
        return;
    }
    _thread  = std::thread([this] { _run_producer(); });
    _started = true;
}

void pipe_stream::_run_producer() noexcept {
    SLUICE_LOG(debug) << "pipe producer started";
    try {
        _producer(*this);
        SLUICE_LOG(debug) << "pipe producer finished";
    } catch (const closed_stream_error& e) {
        if (_queue.closed()) {
            // The reader went away. This is how a producer is told to stop.
            SLUICE_LOG(debug) << "pipe producer stopped by close()";
        } else {
            // A write after close_write(), or some other stream closed on the producer.
            // That's the producer's problem.
            SLUICE_LOG(debug) << "pipe producer failed: " << e.what();
            _producer_error = std::current_exception();
        }
    } catch (const std::exception& e) {
        SLUICE_LOG(debug) << "pipe producer failed: " << e.what();
        _producer_error = std::current_exception();
    } catch (...) {
        SLUICE_LOG(debug) << "pipe producer failed with a non-standard exception";
        _producer_error = std::current_exception();
    }
    // Must come last: this publishes _producer_error to the reader
    _queue.finish();
}

void pipe_stream::_join() noexcept {
    if (_thread.joinable()) {
        _thread.join();
    }
}

std::optional<std::string> pipe_stream::do_next_chunk() {
    _ensure_started();
    auto chunk = _queue.pop();
    if (chunk) {
        SLUICE_LOG(trace) << "pipe read chunk of " << chunk->size()
                                 << " characters";
        return chunk;
    }
    // The producer has returned, and everything it wrote has been read
    if (_producer_error) {
        std::rethrow_exception(_producer_error);
    }
    return std::nullopt;
}

void pipe_stream::do_close() noexcept {
    neo_assert(expects,
               !_thread.joinable() || _thread.get_id() != std::this_thread::get_id(),
               "pipe_stream::close() was called by the producer. Use close_write() instead.");
    // Wakes a producer that is waiting in write(), which will then throw closed_stream_error
    _queue.close();
    _join();
    SLUICE_LOG(debug) << "pipe closed";
}

std::size_t pipe_stream::write(std::string_view chunk) {
    if (_write_closed.load()) {
        throw_closed("write");
    }
    SLUICE_LOG(trace) << "pipe write of " << chunk.size() << " characters";
    if (!_queue.push(std::string(chunk))) {
        throw_closed("write");
    }
    return chunk.size();
}

void pipe_stream::close_write() {
    _write_closed.store(true);
    SLUICE_LOG(debug) << "pipe output closed by the producer";
}

bool pipe_stream::writable() const {
    if (_write_closed.load() || _queue.closed()) {
        throw_closed("writable");
    }
    return true;
}
