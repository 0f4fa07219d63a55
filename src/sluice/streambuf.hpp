#pragma once

#include "./chunked_reader.hpp"
#include "./pipe.hpp"

#include <cstddef>
#include <istream>
#include <ostream>
#include <streambuf>
#include <string>
#include <vector>

namespace sluice {

/// Buffer size used by the stream buffers when none is given
inline constexpr std::size_t default_streambuf_size = 1024 * 4;

/**
 * @brief A std::streambuf that reads from a chunked_reader.
 *
 * Lets any chunked_reader (including a pipe_stream) be consumed through std::istream.
 * Exceptions thrown by the reader escape underflow() unchanged.
 */
class reader_streambuf : public std::streambuf {
    chunked_reader& _reader;
    std::size_t     _buffer_size;
    /// The text currently exposed as the get area
    std::string _current;

protected:
    int_type underflow() override;

public:
    /**
     * @param reader The reader to pull text from. Must outlive the streambuf
     * @param buffer_size The most text that will be pulled from the reader at once
     */
    explicit reader_streambuf(chunked_reader& reader,
                              std::size_t     buffer_size = default_streambuf_size);
};

/**
 * @brief A std::istream over a chunked_reader.
 *
 * `badbit` exceptions are enabled, so errors from the reader (such as a pipe producer's
 * exception, or closed_stream_error) are rethrown from the stream operation rather than being
 * turned into a silent stream failure. Reaching the end of the stream sets eofbit/failbit as
 * usual.
 */
class reader_istream : public std::istream {
    reader_streambuf _buf;

public:
    explicit reader_istream(chunked_reader& reader,
                            std::size_t     buffer_size = default_streambuf_size);
};

/**
 * @brief A std::streambuf that writes into a pipe_stream.
 *
 * Characters are collected into a buffer and written to the pipe as one chunk when the buffer
 * fills, when the stream is flushed, and on destruction.
 */
class pipe_streambuf : public std::streambuf {
    pipe_stream&      _pipe;
    std::vector<char> _buffer;

    /// Write the buffered characters as one chunk
    void _flush();

protected:
    int_type overflow(int_type ch) override;
    int      sync() override;

public:
    /**
     * @param pipe The pipe to write into. Must outlive the streambuf
     * @param buffer_size The number of characters to collect before writing a chunk
     */
    explicit pipe_streambuf(pipe_stream& pipe, std::size_t buffer_size = default_streambuf_size);

    /// Write any remaining buffered characters
    ~pipe_streambuf();
};

/**
 * @brief A std::ostream that writes into a pipe_stream, for producers that only know how to
 * write into an std::ostream.
 *
 * `badbit` exceptions are enabled, so once the pipe is closed, writing to the stream throws
 * closed_stream_error and unwinds the producer.
 */
class pipe_ostream : public std::ostream {
    pipe_streambuf _buf;

public:
    explicit pipe_ostream(pipe_stream& pipe, std::size_t buffer_size = default_streambuf_size);
};

}  // namespace sluice
