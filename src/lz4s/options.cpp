#include "./options.hpp"

#include "./detail/lz4f_prefs.hpp"

using namespace lz4s;

::LZ4F_preferences_t lz4s::detail::to_lz4f_preferences(const lz4_frame_options& opts) noexcept {
    ::LZ4F_preferences_t prefs{};

    auto& info               = prefs.frameInfo;
    info.blockSizeID         = static_cast<::LZ4F_blockSizeID_t>(opts.block_size);
    info.blockMode           = opts.linked_blocks ? LZ4F_blockLinked : LZ4F_blockIndependent;
    info.contentChecksumFlag = opts.checksum ? LZ4F_contentChecksumEnabled : LZ4F_noContentChecksum;
    info.frameType           = LZ4F_frame;
    // We stream, so the content size is never known up front
    info.contentSize       = 0;
    info.dictID            = 0;
    info.blockChecksumFlag = LZ4F_noBlockChecksum;

    prefs.compressionLevel = static_cast<int>(opts.level);
    prefs.autoFlush        = opts.auto_flush ? 1u : 0u;
    prefs.favorDecSpeed    = opts.favor_decompression_speed ? 1u : 0u;
    return prefs;
}
