#pragma once

#include "./detail/lz4f_base.hpp"

#include <neo/const_buffer.hpp>
#include <neo/fwd.hpp>
#include <neo/mutable_buffer.hpp>

#include <cstddef>

namespace lz4s {

struct lz4f_decompress_result {
    std::size_t bytes_written = 0;
    std::size_t bytes_read    = 0;
    /// How many more input bytes the engine would like on the next call. Zero
    /// means the current frame has been completely decoded.
    std::size_t hint = 0;

    constexpr bool frame_done() const noexcept { return hint == 0; }
};

/**
 * Owns one LZ4 frame decompression context. Decodes any number of consecutive
 * frames; a new frame begins as soon as the previous one is done.
 */
class lz4f_decompressor : public detail::lz4f_base {
public:
    lz4f_decompressor();
    ~lz4f_decompressor();

    lz4f_decompressor(lz4f_decompressor&& o) noexcept
        : lz4f_base(NEO_FWD(o)) {}

    /**
     * Decode from `in` into `out`. The engine may consume less than all of `in`
     * and may produce nothing. Unconsumed input must be presented again on the
     * next call.
     *
     * Throws `lz4_error` on corrupt input. The context is reset before the
     * exception is thrown.
     */
    lz4f_decompress_result operator()(neo::mutable_buffer out, neo::const_buffer in);

    /// Abandon any partially decoded frame and start over at a frame header
    void reset() noexcept;
};

}  // namespace lz4s
