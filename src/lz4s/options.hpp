#pragma once

#include <cstddef>

namespace lz4s {

/**
 * Maximum size of one uncompressed block in an LZ4 frame. `default_size` lets
 * the engine pick (64KB).
 */
enum class lz4_block_size : int {
    default_size = 0,
    max_64kb     = 4,
    max_256kb    = 5,
    max_1mb      = 6,
    max_4mb      = 7,
};

/**
 * Compression level. The named values are the levels liblz4 documents, but any
 * value may be given, e.g. `lz4_level{5}`. Levels from `min` up select the
 * high-compression coder.
 */
enum class lz4_level : int {
    fast    = 0,
    min     = 3,
    normal  = 9,
    opt_min = 10,
    max     = 12,
};

struct lz4_frame_options {
    lz4_block_size block_size    = lz4_block_size::default_size;
    bool           linked_blocks = true;
    /// Append a checksum of the uncompressed content to the end of each frame
    bool      checksum                  = false;
    lz4_level level                     = lz4_level::fast;
    bool      auto_flush                = false;
    bool      favor_decompression_speed = false;
};

/// Uncompressed input is handed to the engine in chunks of at most this many bytes
constexpr inline std::size_t lz4_max_chunk_size = 64 * 1024;

}  // namespace lz4s
