#include "./stream_state.hpp"

using namespace lz4s;
using namespace lz4s::detail;

void decode_state::reset() noexcept {
    _pending            = neo::const_buffer();
    _compressed_bytes   = 0;
    _uncompressed_bytes = 0;
    _mid_frame          = false;
    _source_drained     = false;
    _decompress.reset();
}

encode_state::encode_state(const lz4_frame_options& opts)
    : _compress(opts)
    , _scratch_size(_compress.bound(lz4_max_chunk_size))
    , _scratch(std::make_unique_for_overwrite<std::byte[]>(_scratch_size)) {}

void encode_state::reset_counters() noexcept {
    _compressed_bytes   = 0;
    _uncompressed_bytes = 0;
}
