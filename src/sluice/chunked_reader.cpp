#include "./chunked_reader.hpp"

#include "./error.hpp"

#include <neo/assert.hpp>

using namespace sluice;

void chunked_reader::_check_open(std::string_view operation) const {
    if (_closed) {
        throw_closed(operation);
    }
}

void chunked_reader::_consume(std::size_t n) noexcept {
    neo_assert(expects,
               n <= _pending().size(),
               "Attempted to consume more text than is pending in the chunk remainder",
               n,
               _pending().size());
    _offset += n;
    if (_offset == _remainder.size()) {
        // Everything has been handed out. Drop the chunk.
        _remainder.clear();
        _offset = 0;
    }
}

bool chunked_reader::_refill() {
    auto chunk = do_next_chunk();
    _offset    = 0;
    if (!chunk) {
        _remainder.clear();
        return false;
    }
    _remainder = std::move(*chunk);
    return true;
}

std::string chunked_reader::read() {
    _check_open("read");
    std::string ret{_pending()};
    _remainder.clear();
    _offset = 0;
    while (auto chunk = do_next_chunk()) {
        ret.append(*chunk);
    }
    return ret;
}

std::string chunked_reader::read(std::ptrdiff_t count) {
    if (count < 0) {
        return read();
    }
    _check_open("read");
    const auto  want = static_cast<std::size_t>(count);
    std::string ret;
    while (ret.size() < want) {
        auto pending = _pending();
        if (pending.empty()) {
            if (!_refill()) {
                // End of the stream
                break;
            }
            continue;
        }
        auto part = pending.substr(0, want - ret.size());
        ret.append(part);
        _consume(part.size());
    }
    return ret;
}

std::string chunked_reader::read_some(std::size_t max) {
    _check_open("read");
    if (max == 0) {
        return {};
    }
    // Empty chunks are valid, but give us nothing to return. Keep asking.
    while (_pending().empty()) {
        if (!_refill()) {
            return {};
        }
    }
    std::string ret{_pending().substr(0, max)};
    _consume(ret.size());
    return ret;
}

std::string chunked_reader::readline() {
    _check_open("readline");
    std::string ret;
    while (true) {
        auto pending = _pending();
        auto nl_pos  = pending.find('\n');
        if (nl_pos != pending.npos) {
            ret.append(pending.substr(0, nl_pos + 1));
            _consume(nl_pos + 1);
            break;
        }
        ret.append(pending);
        _consume(pending.size());
        if (!_refill()) {
            break;
        }
    }
    return ret;
}

std::vector<std::string> chunked_reader::readlines() {
    std::vector<std::string> ret;
    for (auto& line : *this) {
        ret.push_back(line);
    }
    return ret;
}

bool chunked_reader::readable() const {
    _check_open("readable");
    return true;
}

void chunked_reader::close() noexcept {
    if (_closed) {
        return;
    }
    // Runs first, so a derived class can reject the call before any state changes
    do_close();
    _closed = true;
    _remainder.clear();
    _offset = 0;
}

chunked_reader::line_iterator chunked_reader::lines() { return line_iterator(*this); }

chunked_reader::line_iterator chunked_reader::begin() { return lines(); }

chunked_reader::line_iterator::line_iterator(chunked_reader& reader)
    : _reader(&reader) {
    increment();
}

void chunked_reader::line_iterator::increment() {
    neo_assert(expects,
               _reader != nullptr,
               "Advanced a line iterator that has already reached the end of its stream");
    _line = _reader->readline();
    if (_line.empty()) {
        _reader = nullptr;
    }
}
