#pragma once

#include <neo/buffer_algorithm/copy.hpp>
#include <neo/buffer_sink.hpp>
#include <neo/buffer_source.hpp>
#include <neo/const_buffer.hpp>
#include <neo/mutable_buffer.hpp>
#include <neo/ufmt.hpp>

#include <cstddef>
#include <ios>
#include <stdexcept>
#include <type_traits>

namespace lz4s {

// clang-format off
/**
 * An I/O object that sits on top of a standard stream and hands it out through
 * `stream()`, as neo::iostream_io does.
 */
template <typename T>
concept stream_backed = requires(std::remove_reference_t<T>& io) {
    io.stream().rdstate();
};

template <typename T>
concept rewindable_source = neo::buffer_source<T> && requires(std::remove_reference_t<T>& io) {
    io.stream().seekg(0);
};

template <typename T>
concept rewindable_sink = neo::buffer_sink<T> && requires(std::remove_reference_t<T>& io) {
    io.stream().seekp(0);
};

template <typename T>
concept duplex_io = neo::buffer_source<T> && neo::buffer_sink<T>;
// clang-format on

/**
 * Whether an adapter takes the underlying stream down with it when the adapter
 * is closed.
 */
enum class close_mode {
    keep_open,
    close_stream,
};

namespace detail {

/**
 * Take at most one batch of bytes from `in` into `out`. Never waits for more
 * than the source offers at once. Returns zero only when the source is drained.
 */
template <typename Source>
std::size_t read_some(Source& in, neo::mutable_buffer out) {
    if (out.empty()) {
        return 0;
    }
    auto&& avail  = in.next(out.size());
    auto   n_read = neo::buffer_copy(out, avail);
    in.consume(n_read);
    return n_read;
}

/**
 * After `in` reports the end of its data, clear the eof/fail state of the
 * stream beneath it, so a stream shared with a writer keeps accepting writes
 * and a later read may see data that arrived since.
 */
template <typename Source>
void settle_source(Source& in) {
    if constexpr (stream_backed<Source>) {
        auto& strm = in.stream();
        if (!strm.bad()) {
            strm.clear(strm.rdstate() & std::ios::badbit);
        }
    }
}

/// Write all of `cb`. Throws if the sink takes less, or if its stream enters a failed state.
template <typename Sink>
void write_all(Sink& out, neo::const_buffer cb) {
    if (cb.empty()) {
        return;
    }
    auto n_written = neo::buffer_copy(out, cb);
    if (n_written != cb.size()) {
        throw std::runtime_error(
            neo::ufmt("Failed to write compressed data: the output accepted {} of {} bytes",
                      n_written,
                      cb.size()));
    }
    if constexpr (stream_backed<Sink>) {
        if (out.stream().fail()) {
            throw std::ios_base::failure("Failed to write compressed data to the output stream");
        }
    }
}

/// Push everything written to `out` down to its stream, if it has one
template <typename Sink>
void flush_sink(Sink& out) {
    if constexpr (requires { out.stream().flush(); }) {
        out.stream().flush();
        if (out.stream().fail()) {
            throw std::ios_base::failure("Failed to flush the output stream");
        }
    }
}

/// Seek back to the beginning. Throws std::ios_base::failure if not seekable.
template <typename Source>
void rewind_source(Source& in) {
    auto& strm = in.stream();
    strm.clear();
    strm.seekg(0);
    if (strm.fail()) {
        throw std::ios_base::failure("Failed to rewind the input stream");
    }
}

template <typename Sink>
void rewind_sink(Sink& out) {
    auto& strm = out.stream();
    strm.clear();
    strm.seekp(0);
    if (strm.fail()) {
        throw std::ios_base::failure("Failed to rewind the output stream");
    }
}

template <typename IO>
void rewind_io(IO& io) {
    auto& strm = io.stream();
    strm.clear();
    strm.seekg(0);
    strm.seekp(0);
    if (strm.fail()) {
        throw std::ios_base::failure("Failed to rewind the stream");
    }
}

/**
 * Close the stream beneath `io` if it can be closed. Otherwise flush it, so
 * that anything held in the stream reaches its destination.
 */
template <typename IO>
void close_io(IO& io) {
    if constexpr (requires { io.stream().close(); }) {
        io.stream().close();
    } else {
        flush_sink(io);
    }
}

}  // namespace detail

}  // namespace lz4s
