#pragma once

#include <lz4s/lz4_io.hpp>
#include <lz4s/options.hpp>

#include <neo/const_buffer.hpp>
#include <neo/mutable_buffer.hpp>

#include <array>
#include <cstddef>
#include <streambuf>

namespace lz4s {

/**
 * A std::streambuf that reads decompressed data from an lz4_reader (or an
 * lz4_io). Wrap it in a std::istream to use the formatted input operations.
 * The reader must outlive the streambuf.
 */
template <typename Reader>
class lz4_istreambuf : public std::streambuf {
    Reader&                              _reader;
    std::array<char, lz4_max_chunk_size> _buf;

public:
    explicit lz4_istreambuf(Reader& r)
        : _reader(r) {
        setg(_buf.data(), _buf.data(), _buf.data());
    }

    Reader& reader() const noexcept { return _reader; }

protected:
    int_type underflow() override {
        if (gptr() < egptr()) {
            return traits_type::to_int_type(*gptr());
        }
        // An empty frame reads as nothing, but more frames may follow it
        auto n_read = read_frames(
            _reader,
            neo::mutable_buffer(reinterpret_cast<std::byte*>(_buf.data()), _buf.size()));
        if (n_read == 0) {
            return traits_type::eof();
        }
        setg(_buf.data(), _buf.data(), _buf.data() + n_read);
        return traits_type::to_int_type(*gptr());
    }
};

/**
 * A std::streambuf that compresses everything written to it through an
 * lz4_writer (or an lz4_io). `pubsync()` (std::ostream::flush) flushes the
 * writer as well. Ending the frame is left to the writer: sync, then call
 * `close()` on the writer. Destroying the streambuf hands any characters still
 * in the put area to an open writer. A failure of the writer at that point
 * terminates the program, so flush the std::ostream first to see it as an
 * exception.
 */
template <typename Writer>
class lz4_ostreambuf : public std::streambuf {
    Writer&                              _writer;
    std::array<char, lz4_max_chunk_size> _buf;

    void _drain() {
        auto n_pending = static_cast<std::size_t>(pptr() - pbase());
        if (n_pending != 0) {
            _writer.write(neo::const_buffer(reinterpret_cast<const std::byte*>(pbase()), n_pending));
        }
        setp(_buf.data(), _buf.data() + _buf.size());
    }

public:
    explicit lz4_ostreambuf(Writer& w)
        : _writer(w) {
        setp(_buf.data(), _buf.data() + _buf.size());
    }

    ~lz4_ostreambuf() {
        if (!_writer.is_closed()) {
            _drain();
        }
    }

    Writer& writer() const noexcept { return _writer; }

protected:
    int_type overflow(int_type c) override {
        _drain();
        if (!traits_type::eq_int_type(c, traits_type::eof())) {
            *pptr() = traits_type::to_char_type(c);
            pbump(1);
        }
        return traits_type::not_eof(c);
    }

    std::streamsize xsputn(const char* s, std::streamsize n) override {
        if (n >= static_cast<std::streamsize>(_buf.size())) {
            // Too big to be worth buffering
            _drain();
            _writer.write(
                neo::const_buffer(reinterpret_cast<const std::byte*>(s), static_cast<std::size_t>(n)));
            return n;
        }
        return std::streambuf::xsputn(s, n);
    }

    int sync() override {
        _drain();
        _writer.flush();
        return 0;
    }
};

}  // namespace lz4s
