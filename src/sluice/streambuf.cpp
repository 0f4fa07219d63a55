#include "./streambuf.hpp"

#include "./error.hpp"

#include <neo/assert.hpp>

#include <string_view>

using namespace sluice;

reader_streambuf::reader_streambuf(chunked_reader& reader, std::size_t buffer_size)
    : _reader(reader)
    , _buffer_size(buffer_size) {
    neo_assert(expects, buffer_size > 0, "reader_streambuf needs a non-zero buffer size");
}

reader_streambuf::int_type reader_streambuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    // Blocks until the reader has more text, or reaches its end
    _current = _reader.read_some(_buffer_size);
    if (_current.empty()) {
        return traits_type::eof();
    }
    char* data = _current.data();
    setg(data, data, data + _current.size());
    return traits_type::to_int_type(*gptr());
}

reader_istream::reader_istream(chunked_reader& reader, std::size_t buffer_size)
    : std::istream(nullptr)
    , _buf(reader, buffer_size) {
    rdbuf(&_buf);
    exceptions(std::ios::badbit);
}

pipe_streambuf::pipe_streambuf(pipe_stream& pipe, std::size_t buffer_size)
    : _pipe(pipe)
    , _buffer(buffer_size) {
    neo_assert(expects, buffer_size > 0, "pipe_streambuf needs a non-zero buffer size");
    setp(_buffer.data(), _buffer.data() + _buffer.size());
}

pipe_streambuf::~pipe_streambuf() {
    try {
        _flush();
    } catch (const closed_stream_error&) {
        // The reader has closed the pipe, so there is no one left to receive this text
    }
}

void pipe_streambuf::_flush() {
    const auto nbuffered = static_cast<std::size_t>(pptr() - pbase());
    if (nbuffered != 0) {
        _pipe.write(std::string_view(pbase(), nbuffered));
    }
    setp(_buffer.data(), _buffer.data() + _buffer.size());
}

pipe_streambuf::int_type pipe_streambuf::overflow(int_type ch) {
    _flush();
    if (!traits_type::eq_int_type(ch, traits_type::eof())) {
        *pptr() = traits_type::to_char_type(ch);
        pbump(1);
    }
    return traits_type::not_eof(ch);
}

int pipe_streambuf::sync() {
    _flush();
    return 0;
}

pipe_ostream::pipe_ostream(pipe_stream& pipe, std::size_t buffer_size)
    : std::ostream(nullptr)
    , _buf(pipe, buffer_size) {
    rdbuf(&_buf);
    exceptions(std::ios::badbit);
}
