#include "./compress.hpp"

#include "./detail/lz4f_prefs.hpp"
#include "./error.hpp"

#include <neo/assert.hpp>

#include <lz4frame.h>

#include <memory>

using namespace lz4s;

namespace {

struct cctx_state {
    ::LZ4F_cctx*             cctx  = nullptr;
    ::LZ4F_preferences_t     prefs = {};
    ::LZ4F_compressOptions_t copts = {};
};

}  // namespace

#define MY_STATE (*static_cast<cctx_state*>(_state_ptr))

lz4f_compressor::lz4f_compressor(const lz4_frame_options& opts)
    : _opts(opts) {
    auto st   = std::make_unique<cctx_state>();
    st->prefs = detail::to_lz4f_preferences(opts);
    detail::check_lz4f(::LZ4F_createCompressionContext(&st->cctx, LZ4F_VERSION),
                       "Failed to create compression context");
    _state_ptr = st.release();
}

lz4f_compressor::~lz4f_compressor() {
    if (_state_ptr) {
        ::LZ4F_freeCompressionContext(MY_STATE.cctx);
        delete &MY_STATE;
    }
}

std::size_t lz4f_compressor::bound(std::size_t src_size) const noexcept {
    return ::LZ4F_compressBound(src_size, &MY_STATE.prefs);
}

std::size_t lz4f_compressor::begin(neo::mutable_buffer out) {
    auto& st = MY_STATE;
    auto  n  = detail::check_lz4f(::LZ4F_compressBegin(st.cctx, out.data(), out.size(), &st.prefs),
                                "Failed to begin compression");
    neo_assert(ensures, n <= out.size(), "Frame header overran the output buffer", n, out.size());
    return n;
}

std::size_t
lz4f_compressor::update(neo::mutable_buffer out, neo::const_buffer in, bool stable_src) {
    auto& st           = MY_STATE;
    st.copts.stableSrc = stable_src ? 1u : 0u;
    return detail::check_lz4f(::LZ4F_compressUpdate(st.cctx,
                                                    out.data(),
                                                    out.size(),
                                                    in.data(),
                                                    in.size(),
                                                    &st.copts),
                              "Failed to compress");
}

std::size_t lz4f_compressor::flush(neo::mutable_buffer out) {
    auto& st = MY_STATE;
    return detail::check_lz4f(::LZ4F_flush(st.cctx, out.data(), out.size(), &st.copts),
                              "Failed to flush");
}

std::size_t lz4f_compressor::end(neo::mutable_buffer out) {
    auto& st = MY_STATE;
    return detail::check_lz4f(::LZ4F_compressEnd(st.cctx, out.data(), out.size(), &st.copts),
                              "Failed to end frame");
}
