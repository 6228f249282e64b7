#pragma once

#include <lz4s/options.hpp>

#include <lz4frame.h>

namespace lz4s::detail {

/**
 * Translate the user-facing frame options into the preferences structure that
 * liblz4 consumes. Pure: the same options always give the same preferences.
 */
::LZ4F_preferences_t to_lz4f_preferences(const lz4_frame_options& opts) noexcept;

}  // namespace lz4s::detail
