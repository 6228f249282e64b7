#include "./decompress.hpp"

#include "./error.hpp"

#include <neo/assert.hpp>

#include <lz4frame.h>

#include <memory>

using namespace lz4s;

namespace {

struct dctx_state {
    ::LZ4F_dctx*               dctx  = nullptr;
    ::LZ4F_decompressOptions_t dopts = {};
};

}  // namespace

#define MY_STATE (*static_cast<dctx_state*>(_state_ptr))

lz4f_decompressor::lz4f_decompressor() {
    auto st = std::make_unique<dctx_state>();
    detail::check_lz4f(::LZ4F_createDecompressionContext(&st->dctx, LZ4F_VERSION),
                       "Failed to create decompression context");
    _state_ptr = st.release();
}

lz4f_decompressor::~lz4f_decompressor() {
    if (_state_ptr) {
        ::LZ4F_freeDecompressionContext(MY_STATE.dctx);
        delete &MY_STATE;
    }
}

void lz4f_decompressor::reset() noexcept { ::LZ4F_resetDecompressionContext(MY_STATE.dctx); }

lz4f_decompress_result lz4f_decompressor::operator()(neo::mutable_buffer out,
                                                     neo::const_buffer   in) {
    auto&       st       = MY_STATE;
    std::size_t dst_size = out.size();
    std::size_t src_size = in.size();

    auto ret = ::LZ4F_decompress(st.dctx, out.data(), &dst_size, in.data(), &src_size, &st.dopts);
    if (::LZ4F_isError(ret)) {
        // The context is unusable after an error until it is reset
        ::LZ4F_resetDecompressionContext(st.dctx);
        detail::check_lz4f(ret, "Failed to decompress");
    }
    neo_assert(ensures,
               dst_size <= out.size() && src_size <= in.size(),
               "LZ4F_decompress() reported more bytes than it was given",
               dst_size,
               out.size(),
               src_size,
               in.size());
    return {
        .bytes_written = dst_size,
        .bytes_read    = src_size,
        .hint          = ret,
    };
}
