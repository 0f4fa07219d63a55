#pragma once

#include <neo/iterator_facade.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sluice {

/**
 * @brief Abstract base class of readable text streams that are assembled from a sequence of
 * chunks.
 *
 * Concrete classes supply the chunks by implementing do_next_chunk(). The base class turns those
 * opaquely-sized chunks into ordinary blocking stream semantics: sized reads, line reads, and
 * iteration over lines. Text that was produced but not yet read is held in a remainder buffer,
 * which is always consumed before another chunk is requested.
 *
 * A reader is owned by a single consumer and is not safe for concurrent use.
 */
class chunked_reader {
    /// The chunk currently being consumed
    std::string _remainder;
    /// How much of `_remainder` has already been handed out
    std::size_t _offset = 0;
    /// Whether close() has been called
    bool _closed = false;

    /**
     * @brief Produce the next chunk of the stream. Provided by concrete derived classes.
     *
     * @return std::optional<std::string> The next chunk, or nullopt if the source is exhausted.
     *
     * @note An empty string is a valid chunk, and must not be used to signal exhaustion.
     */
    virtual std::optional<std::string> do_next_chunk() = 0;

    /// View of the not-yet-consumed part of the remainder
    [[nodiscard]] std::string_view _pending() const noexcept {
        return std::string_view(_remainder).substr(_offset);
    }

    /// Drop 'n' characters from the front of the remainder
    void _consume(std::size_t n) noexcept;

    /// Refill the remainder with a fresh chunk. Returns false if the source is exhausted.
    bool _refill();

    /// Throw closed_stream_error if the reader is closed
    void _check_open(std::string_view operation) const;

protected:
    chunked_reader() = default;

    /**
     * @brief Release resources held by the chunk source. Called exactly once, from the first call
     * to close(), before the reader's own state is cleared.
     */
    virtual void do_close() noexcept {}

public:
    virtual ~chunked_reader() = default;

    chunked_reader(const chunked_reader&) = delete;
    chunked_reader& operator=(const chunked_reader&) = delete;

    class line_iterator;

    /**
     * @brief Read all data until the end of the stream
     *
     * @return std::string The concatenation of every remaining chunk
     *
     * @throws closed_stream_error if the reader has been closed
     */
    std::string read();

    /**
     * @brief Read *at most* `count` characters.
     *
     * Chunks are requested until `count` characters have been gathered or the stream is
     * exhausted, so the result is only shorter than `count` at the end of the stream. If `count`
     * is negative, reads until the end of the stream (as with read()).
     *
     * @param count The number of characters to read
     *
     * @throws closed_stream_error if the reader has been closed
     */
    std::string read(std::ptrdiff_t count);

    /**
     * @brief Read at most `max` characters without waiting for more than one new chunk.
     *
     * If any unread text remains from a prior chunk, only that text is used. Otherwise, chunks are
     * requested until a non-empty one arrives.
     *
     * @return std::string The text that was read. Only empty at the end of the stream (or if
     * `max` is zero)
     *
     * @throws closed_stream_error if the reader has been closed
     */
    std::string read_some(std::size_t max);

    /**
     * @brief Read one line of text, including its trailing newline.
     *
     * @return std::string The line. If the stream ends before a newline is found, returns the
     * remaining text, and returns an empty string once the stream is exhausted.
     *
     * @throws closed_stream_error if the reader has been closed
     */
    std::string readline();

    /**
     * @brief Read all remaining lines
     *
     * @throws closed_stream_error if the reader has been closed
     */
    std::vector<std::string> readlines();

    /**
     * @brief Check that the stream can be read from.
     *
     * @return true always
     * @throws closed_stream_error if the reader has been closed
     */
    bool readable() const;

    /// Whether the reader has been closed
    [[nodiscard]] bool closed() const noexcept { return _closed; }

    /**
     * @brief Close the reader. Any further reads will throw closed_stream_error.
     *
     * Closing an already-closed reader does nothing.
     */
    void close() noexcept;

    /// Iterate over the remaining lines of the stream
    line_iterator lines();
    /// Begin iterating lines (for use with range-for)
    line_iterator begin();
    /// End-of-lines sentinel
    struct line_sentinel {};
    line_sentinel end() const noexcept { return {}; }
};

/**
 * @brief An input iterator over the lines of a chunked_reader, as returned by readline().
 */
class chunked_reader::line_iterator : public neo::iterator_facade<line_iterator> {
    chunked_reader* _reader = nullptr;
    std::string     _line;

public:
    line_iterator() = default;
    /// Begin reading lines from `reader`. Reads the first line immediately.
    explicit line_iterator(chunked_reader& reader);

    /// Obtain the current line
    const std::string& dereference() const noexcept { return _line; }
    /// Read the next line, or finish
    void increment();

    using sentinel_type = line_sentinel;

    bool operator==(sentinel_type) const noexcept { return at_end(); }
    /// Check whether the stream's lines have been exhausted
    bool at_end() const noexcept { return _reader == nullptr; }

    /// Returns *this (for use with range-for and range-algorithms)
    line_iterator begin() const { return *this; }
    /// Return a sentinel (for use with range-for and range-algorithms)
    sentinel_type end() const noexcept { return {}; }
};

}  // namespace sluice
