#pragma once

#include <lz4s/options.hpp>

#include "./detail/lz4f_base.hpp"

#include <neo/const_buffer.hpp>
#include <neo/fwd.hpp>
#include <neo/mutable_buffer.hpp>

#include <cstddef>

namespace lz4s {

/**
 * Owns one LZ4 frame compression context and the preferences it was created
 * with. Each member maps onto one step of the frame engine. Every output
 * buffer must be at least `bound(n)` bytes for the `n` bytes of input being
 * passed (or `bound(0)` for `begin`, `flush` and `end`).
 *
 * All members throw `lz4_error` if the engine reports a failure.
 */
class lz4f_compressor : public detail::lz4f_base {
    lz4_frame_options _opts;

public:
    explicit lz4f_compressor(const lz4_frame_options& opts);
    lz4f_compressor()
        : lz4f_compressor(lz4_frame_options{}) {}
    ~lz4f_compressor();

    lz4f_compressor(lz4f_compressor&& o) noexcept
        : lz4f_base(NEO_FWD(o))
        , _opts(o._opts) {}

    const lz4_frame_options& options() const noexcept { return _opts; }

    /// Worst-case output size of a single `update()` of `src_size` bytes
    std::size_t bound(std::size_t src_size) const noexcept;

    /// Write the frame header into `out`. Returns the number of bytes written.
    std::size_t begin(neo::mutable_buffer out);

    /**
     * Compress `in` into `out`. Returns the number of bytes written, which may
     * be zero if the engine only buffered the input. `stable_src` promises the
     * engine that `in` remains valid until the next call, so it may skip
     * copying it into its own buffer.
     */
    std::size_t update(neo::mutable_buffer out, neo::const_buffer in, bool stable_src = false);

    /// Emit any data that the engine is holding back, without ending the frame
    std::size_t flush(neo::mutable_buffer out);

    /**
     * Emit buffered data, the end mark, and the content checksum (if enabled).
     * The context is ready for a new `begin()` afterwards.
     */
    std::size_t end(neo::mutable_buffer out);
};

}  // namespace lz4s
