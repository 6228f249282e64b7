#pragma once

#include <lz4s/options.hpp>

#include <cstdint>
#include <filesystem>

namespace lz4s {

/**
 * Compress the file at `source` into a single LZ4 frame written to
 * `lz4_destination`, replacing anything already there.
 *
 * @returns the size of the compressed file.
 */
std::uint64_t compress_file(const std::filesystem::path& source,
                            const std::filesystem::path& lz4_destination,
                            const lz4_frame_options&     opts = {});

/**
 * Decompress every frame of `lz4_source` into `destination`.
 *
 * @returns the size of the decompressed file.
 */
std::uint64_t decompress_file(const std::filesystem::path& lz4_source,
                              const std::filesystem::path& destination);

}  // namespace lz4s
