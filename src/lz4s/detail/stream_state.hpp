#pragma once

#include <lz4s/compress.hpp>
#include <lz4s/decompress.hpp>
#include <lz4s/options.hpp>
#include <lz4s/stream.hpp>

#include <neo/assert.hpp>
#include <neo/buffer_sink.hpp>
#include <neo/buffer_source.hpp>
#include <neo/const_buffer.hpp>
#include <neo/mutable_buffer.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace lz4s::detail {

/// uncompressed / compressed, or zero if nothing has been compressed yet
constexpr double compression_ratio(std::uint64_t uncompressed, std::uint64_t compressed) noexcept {
    if (compressed == 0) {
        return 0.0;
    }
    return static_cast<double>(uncompressed) / static_cast<double>(compressed);
}

/**
 * Everything one reading direction needs: the decompression context, the
 * buffer of compressed input that has been read but not yet decoded, and the
 * inbound byte counters.
 */
class decode_state {
public:
    static constexpr std::size_t pending_capacity = 64 * 1024;

private:
    lz4f_decompressor            _decompress;
    std::unique_ptr<std::byte[]> _storage
        = std::make_unique_for_overwrite<std::byte[]>(pending_capacity);
    // The part of _storage that holds input not yet consumed by the engine
    neo::const_buffer _pending;

    std::uint64_t _compressed_bytes   = 0;
    std::uint64_t _uncompressed_bytes = 0;

    // Some of the current frame has been decoded, but not its end
    bool _mid_frame = false;
    // The last read() stopped because the source had nothing more to give
    bool _source_drained = false;

    template <neo::buffer_source Source>
    void _refill(Source& in) {
        neo_assert(invariant,
                   _pending.empty(),
                   "Attempted to refill the pending input while it still holds unconsumed bytes",
                   _pending.size());
        auto n_read = read_some(in, neo::mutable_buffer(_storage.get(), pending_capacity));
        _compressed_bytes += n_read;
        _pending = neo::const_buffer(_storage.get(), n_read);
        if (n_read == 0) {
            settle_source(in);
        }
    }

public:
    decode_state() = default;

    /**
     * Decode from `in` into `out` until `out` is full, a frame ends, or `in` is
     * exhausted. Returns the number of bytes written to `out`.
     */
    template <neo::buffer_source Source>
    std::size_t read(Source& in, neo::mutable_buffer out) {
        if (out.empty()) {
            return 0;
        }
        _source_drained = false;

        std::size_t n_decompressed = 0;
        // The engine's estimate of how much more input it wants. Zero: no estimate yet.
        std::size_t hint = 0;
        while (true) {
            auto src = _pending;
            if (hint != 0) {
                // Don't give the engine more than it asked for, or it will buffer
                // the excess internally
                src = src.first(std::min(hint, src.size()));
            }

            auto res = _decompress(out, src);
            hint     = res.hint;

            _pending += res.bytes_read;
            out += res.bytes_written;
            n_decompressed += res.bytes_written;
            if (res.bytes_read != 0 || res.bytes_written != 0) {
                _mid_frame = true;
            }

            if (out.empty()) {
                break;
            }
            if (res.frame_done()) {
                _mid_frame = false;
                break;
            }
            if (_pending.empty()) {
                _refill(in);
            }
            if (_pending.empty()) {
                _source_drained = true;
                break;
            }
        }
        _uncompressed_bytes += n_decompressed;
        return n_decompressed;
    }

    /// Drop pending input, zero the counters and reset the decompression context
    void reset() noexcept;

    /// Whether the source ran dry during the last read
    bool source_drained() const noexcept { return _source_drained; }
    /// Whether the input so far ends partway through a frame
    bool mid_frame() const noexcept { return _mid_frame; }

    std::size_t   pending_size() const noexcept { return _pending.size(); }
    std::uint64_t compressed_bytes() const noexcept { return _compressed_bytes; }
    std::uint64_t uncompressed_bytes() const noexcept { return _uncompressed_bytes; }
};

/**
 * Everything one writing direction needs: the compression context, a scratch
 * buffer large enough for the worst-case output of one chunk, the frame
 * lifecycle flag and the outbound byte counters.
 */
class encode_state {
    lz4f_compressor              _compress;
    std::size_t                  _scratch_size;
    std::unique_ptr<std::byte[]> _scratch;

    bool _header_written = false;

    std::uint64_t _compressed_bytes   = 0;
    std::uint64_t _uncompressed_bytes = 0;

    neo::mutable_buffer _scratch_buf() const noexcept {
        return neo::mutable_buffer(_scratch.get(), _scratch_size);
    }

    template <neo::buffer_sink Sink>
    void _emit(Sink& out, std::size_t n) {
        neo_assert(invariant,
                   n <= _scratch_size,
                   "Compressor wrote beyond the end of the scratch buffer",
                   n,
                   _scratch_size);
        write_all(out, _scratch_buf().first(n));
        _compressed_bytes += n;
    }

public:
    explicit encode_state(const lz4_frame_options& opts);

    /// Emit the frame header if the current frame has not been started
    template <neo::buffer_sink Sink>
    void begin_frame(Sink& out) {
        if (_header_written) {
            return;
        }
        _emit(out, _compress.begin(_scratch_buf()));
        _header_written = true;
    }

    /// Compress all of `in`, writing compressed blocks to `out` as they appear
    template <neo::buffer_sink Sink>
    void write(Sink& out, neo::const_buffer in) {
        begin_frame(out);
        _uncompressed_bytes += in.size();
        while (!in.empty()) {
            auto chunk = in.first(std::min(in.size(), lz4_max_chunk_size));
            // More input follows this chunk in the same buffer, so it stays put
            bool stable = in.size() > lz4_max_chunk_size;
            _emit(out, _compress.update(_scratch_buf(), chunk, stable));
            in += chunk.size();
        }
    }

    /// Push out everything the engine holds, then flush `out`
    template <neo::buffer_sink Sink>
    void flush(Sink& out) {
        begin_frame(out);
        _emit(out, _compress.flush(_scratch_buf()));
        flush_sink(out);
    }

    /// Write the end of the current frame (starting one first if needed), then flush `out`
    template <neo::buffer_sink Sink>
    void end_frame(Sink& out) {
        begin_frame(out);
        _emit(out, _compress.end(_scratch_buf()));
        _header_written = false;
        flush_sink(out);
    }

    /// Zero the counters. Does not touch the frame state.
    void reset_counters() noexcept;

    bool                     frame_open() const noexcept { return _header_written; }
    const lz4_frame_options& options() const noexcept { return _compress.options(); }
    std::size_t              scratch_size() const noexcept { return _scratch_size; }
    std::uint64_t            compressed_bytes() const noexcept { return _compressed_bytes; }
    std::uint64_t            uncompressed_bytes() const noexcept { return _uncompressed_bytes; }
};

}  // namespace lz4s::detail
