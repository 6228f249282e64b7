#pragma once

#include <lz4s/error.hpp>
#include <lz4s/options.hpp>
#include <lz4s/stream.hpp>

#include "./detail/stream_state.hpp"

#include <neo/assert.hpp>
#include <neo/buffer_algorithm/copy.hpp>
#include <neo/buffer_sink.hpp>
#include <neo/buffer_source.hpp>
#include <neo/const_buffer.hpp>
#include <neo/fwd.hpp>
#include <neo/iostream_io.hpp>
#include <neo/mutable_buffer.hpp>
#include <neo/ref.hpp>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

namespace lz4s {

/**
 * Read from `r` (an lz4_reader or an lz4_io) until at least one byte arrives,
 * continuing past the ends of frames. Returns zero only if `out` is empty or
 * the input is exhausted.
 */
template <typename Reader>
std::size_t read_frames(Reader& r, neo::mutable_buffer out) {
    while (true) {
        auto n_read = r.read(out);
        if (n_read != 0 || out.empty() || r.at_end()) {
            return n_read;
        }
    }
}

/**
 * @brief Adapt a buffer_source holding LZ4 frames into a source of decompressed
 * bytes.
 *
 * `read()` stops at the end of each frame. The reader is also a buffer_source
 * itself: `next()` and `consume()` run across frame boundaries, and throw
 * `lz4_error` if the input ends partway through a frame.
 *
 * If constructed from an lvalue, the source is referenced. If constructed from
 * an rvalue, the reader holds the source itself.
 *
 * @tparam Source The underlying buffer source (A file, socket, string buffer, etc.)
 */
template <neo::buffer_source Source>
class lz4_reader {
    [[no_unique_address]] neo::wrap_refs_t<Source> _source;

    detail::decode_state _decode;

    // Decoded bytes handed out by next() and not yet consumed
    std::unique_ptr<std::byte[]> _ready_storage;
    neo::const_buffer            _ready;

    close_mode _close_mode;
    bool       _closed = false;

    void _check_open(const char* op) const {
        if (_closed) {
            detail::throw_closed(op);
        }
    }

public:
    explicit lz4_reader(Source&& in, close_mode mode = close_mode::keep_open)
        : _source(NEO_FWD(in))
        , _close_mode(mode) {}

    NEO_DECL_UNREF_GETTER(source, _source);

    /**
     * Read decompressed data into `out`. Returns the number of bytes written,
     * which is zero if `out` is empty, the input is exhausted, or the current
     * frame ended without producing more data.
     */
    std::size_t read(neo::mutable_buffer out) {
        _check_open("read from");
        if (!_ready.empty()) {
            auto n = neo::buffer_copy(out, _ready);
            _ready += n;
            return n;
        }
        return _decode.read(source(), out);
    }

    /// Whether the last read stopped because the source had nothing more to give
    bool at_end() const noexcept { return _ready.empty() && _decode.source_drained(); }

    /// Whether the input read so far stops partway through a frame
    bool mid_frame() const noexcept { return _decode.mid_frame(); }

    neo::const_buffer next(std::size_t n) {
        if (_ready.empty()) {
            if (!_ready_storage) {
                _ready_storage = std::make_unique_for_overwrite<std::byte[]>(lz4_max_chunk_size);
            }
            auto n_read = read_frames(*this,
                                      neo::mutable_buffer(_ready_storage.get(),
                                                          lz4_max_chunk_size));
            if (n_read == 0 && mid_frame()) {
                throw lz4_error("Input ended partway through an LZ4 frame", truncated_frame_error);
            }
            _ready = neo::const_buffer(_ready_storage.get(), n_read);
        }
        return _ready.first(std::min(n, _ready.size()));
    }

    void consume(std::size_t n) noexcept {
        neo_assert(expects,
                   n <= _ready.size(),
                   "Consumed more decompressed bytes than were made available",
                   n,
                   _ready.size());
        _ready += n;
    }

    /// Start over from the beginning of the underlying stream
    void rewind() requires rewindable_source<Source> {
        _check_open("rewind");
        detail::rewind_source(source());
        _decode.reset();
        _ready = neo::const_buffer();
    }

    /**
     * Close the underlying stream if this reader was created with
     * `close_mode::close_stream`. Otherwise, does nothing and the reader remains
     * usable.
     */
    void close() {
        if (_close_mode == close_mode::close_stream && !_closed) {
            _closed = true;
            detail::close_io(source());
        }
    }

    bool is_closed() const noexcept { return _closed; }

    /// Compressed bytes read from the source but not yet decoded
    std::size_t buffered_size() const noexcept { return _decode.pending_size(); }

    std::uint64_t compressed_bytes_in() const noexcept { return _decode.compressed_bytes(); }
    std::uint64_t uncompressed_bytes_in() const noexcept { return _decode.uncompressed_bytes(); }

    /// Uncompressed bytes produced per compressed byte read so far
    double compression_ratio() const noexcept {
        return detail::compression_ratio(uncompressed_bytes_in(), compressed_bytes_in());
    }
};

template <neo::buffer_source S>
explicit lz4_reader(S&&) -> lz4_reader<S>;

template <neo::buffer_source S>
explicit lz4_reader(S&&, close_mode) -> lz4_reader<S>;

/**
 * @brief Adapt a buffer_sink with LZ4 frame compression.
 *
 * The first write starts a frame. `close()` must be called to end the frame:
 * the destructor does not do it. Unless the writer closes the stream along with
 * itself, another write after `close()` starts a new frame.
 *
 * The writer is a buffer_sink itself. Each `commit()` compresses the committed
 * bytes.
 *
 * @tparam Sink The underlying buffer sink (A file, socket, string buffer, etc.)
 */
template <neo::buffer_sink Sink>
class lz4_writer {
    [[no_unique_address]] neo::wrap_refs_t<Sink> _sink;

    detail::encode_state _encode;

    std::vector<std::byte> _prepared;

    close_mode _close_mode;
    bool       _closed = false;

    void _check_open(const char* op) const {
        if (_closed) {
            detail::throw_closed(op);
        }
    }

public:
    explicit lz4_writer(Sink&&                   out,
                        const lz4_frame_options& opts = {},
                        close_mode               mode = close_mode::keep_open)
        : _sink(NEO_FWD(out))
        , _encode(opts)
        , _close_mode(mode) {}

    NEO_DECL_UNREF_GETTER(sink, _sink);

    /// Compress all of `data` into the sink
    void write(neo::const_buffer data) {
        _check_open("write to");
        _encode.write(sink(), data);
    }

    neo::mutable_buffer prepare(std::size_t n) {
        _check_open("write to");
        _prepared.resize(n);
        return neo::mutable_buffer(_prepared.data(), n);
    }

    void commit(std::size_t n) {
        neo_assert(expects,
                   n <= _prepared.size(),
                   "Committed more bytes than were prepared",
                   n,
                   _prepared.size());
        write(neo::const_buffer(_prepared.data(), n));
    }

    /// Push out all data held by the compressor without ending the frame
    void flush() {
        _check_open("flush");
        _encode.flush(sink());
    }

    /**
     * End the current frame. If the writer was created with
     * `close_mode::close_stream`, also close the stream (even if ending the
     * frame failed), after which the writer can no longer be used.
     */
    void close() {
        _check_open("close");
        try {
            _encode.end_frame(sink());
        } catch (...) {
            _close_owned();
            throw;
        }
        _close_owned();
    }

    /**
     * End the current frame (if any), reset the counters, and seek the stream
     * back to its beginning. New frames will overwrite the old data.
     */
    void rewind() requires rewindable_sink<Sink> {
        _check_open("rewind");
        if (_encode.frame_open()) {
            _encode.end_frame(sink());
        }
        _encode.reset_counters();
        detail::rewind_sink(sink());
    }

    bool is_closed() const noexcept { return _closed; }
    bool frame_open() const noexcept { return _encode.frame_open(); }

    const lz4_frame_options& options() const noexcept { return _encode.options(); }

    std::uint64_t compressed_bytes_out() const noexcept { return _encode.compressed_bytes(); }
    std::uint64_t uncompressed_bytes_out() const noexcept { return _encode.uncompressed_bytes(); }

    /// Uncompressed bytes accepted per compressed byte written so far
    double compression_ratio() const noexcept {
        return detail::compression_ratio(uncompressed_bytes_out(), compressed_bytes_out());
    }

private:
    void _close_owned() {
        if (_close_mode == close_mode::close_stream) {
            _closed = true;
            detail::close_io(sink());
        }
    }
};

template <neo::buffer_sink S>
explicit lz4_writer(S&&) -> lz4_writer<S>;

template <neo::buffer_sink S>
explicit lz4_writer(S&&, const lz4_frame_options&) -> lz4_writer<S>;

template <neo::buffer_sink S>
explicit lz4_writer(S&&, const lz4_frame_options&, close_mode) -> lz4_writer<S>;

/**
 * @brief Read and write LZ4 frames over a single object that is both a
 * buffer_source and a buffer_sink.
 *
 * The two directions share nothing but the underlying I/O object: each has its
 * own context, buffer, counters, and frame state.
 */
template <duplex_io IO>
class lz4_io {
    [[no_unique_address]] neo::wrap_refs_t<IO> _io;

    detail::decode_state _decode;
    detail::encode_state _encode;

    close_mode _close_mode;
    bool       _closed = false;

    void _check_open(const char* op) const {
        if (_closed) {
            detail::throw_closed(op);
        }
    }

public:
    explicit lz4_io(IO&&                     io,
                    const lz4_frame_options& opts = {},
                    close_mode               mode = close_mode::keep_open)
        : _io(NEO_FWD(io))
        , _encode(opts)
        , _close_mode(mode) {}

    NEO_DECL_UNREF_GETTER(io, _io);

    std::size_t read(neo::mutable_buffer out) {
        _check_open("read from");
        return _decode.read(io(), out);
    }

    bool at_end() const noexcept { return _decode.source_drained(); }
    bool mid_frame() const noexcept { return _decode.mid_frame(); }

    void write(neo::const_buffer data) {
        _check_open("write to");
        _encode.write(io(), data);
    }

    void flush() {
        _check_open("flush");
        _encode.flush(io());
    }

    /**
     * End the outgoing frame. With `close_mode::close_stream` the stream is
     * closed too, which ends both directions.
     */
    void close() {
        _check_open("close");
        try {
            _encode.end_frame(io());
        } catch (...) {
            _close_owned();
            throw;
        }
        _close_owned();
    }

    /// End the outgoing frame (if any), then restart both directions at the start of the stream
    void rewind() requires rewindable_source<IO> && rewindable_sink<IO> {
        _check_open("rewind");
        if (_encode.frame_open()) {
            _encode.end_frame(io());
        }
        _encode.reset_counters();
        _decode.reset();
        detail::rewind_io(io());
    }

    bool is_closed() const noexcept { return _closed; }
    bool frame_open() const noexcept { return _encode.frame_open(); }

    std::uint64_t compressed_bytes_in() const noexcept { return _decode.compressed_bytes(); }
    std::uint64_t uncompressed_bytes_in() const noexcept { return _decode.uncompressed_bytes(); }
    std::uint64_t compressed_bytes_out() const noexcept { return _encode.compressed_bytes(); }
    std::uint64_t uncompressed_bytes_out() const noexcept { return _encode.uncompressed_bytes(); }

    double compression_ratio_in() const noexcept {
        return detail::compression_ratio(uncompressed_bytes_in(), compressed_bytes_in());
    }
    double compression_ratio_out() const noexcept {
        return detail::compression_ratio(uncompressed_bytes_out(), compressed_bytes_out());
    }

private:
    void _close_owned() {
        if (_close_mode == close_mode::close_stream) {
            _closed = true;
            detail::close_io(io());
        }
    }
};

template <duplex_io S>
explicit lz4_io(S&&) -> lz4_io<S>;

template <duplex_io S>
explicit lz4_io(S&&, const lz4_frame_options&) -> lz4_io<S>;

template <duplex_io S>
explicit lz4_io(S&&, const lz4_frame_options&, close_mode) -> lz4_io<S>;

using lz4_file_reader = lz4_reader<neo::iostream_io<std::ifstream>>;
using lz4_file_writer = lz4_writer<neo::iostream_io<std::ofstream>>;

/// Open `path` for reading LZ4 frames. The reader owns and closes the file.
lz4_file_reader open_lz4_reader(const std::filesystem::path& path);

/// Create or truncate `path` for writing LZ4 frames. The writer owns and closes the file.
lz4_file_writer open_lz4_writer(const std::filesystem::path& path,
                                const lz4_frame_options&     opts = {});

/**
 * @brief Compress the given input as a single LZ4 frame and write it to the given output.
 *
 * @returns the number of bytes written to the output.
 */
template <neo::buffer_output Out, neo::buffer_input In>
std::uint64_t lz4_compress(Out&& out, In&& in, const lz4_frame_options& opts = {}) {
    lz4_writer lz4_out{neo::ensure_buffer_sink(out), opts};
    neo::buffer_copy(lz4_out, in);
    lz4_out.close();
    return lz4_out.compressed_bytes_out();
}

/**
 * @brief Decompress every LZ4 frame in the given input, and write the
 * decompressed data to the given output.
 *
 * Throws `lz4_error` if the input ends partway through a frame.
 *
 * @returns The number of bytes written to the output.
 */
template <neo::buffer_output Out, neo::buffer_input In>
std::uint64_t lz4_decompress(Out&& out, In&& in) {
    lz4_reader lz4_in{neo::ensure_buffer_source(in)};
    return neo::buffer_copy(out, lz4_in);
}

}  // namespace lz4s
