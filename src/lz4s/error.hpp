#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lz4s {

/// The error_name() of an lz4_error for input that ends partway through a frame
constexpr inline std::string_view truncated_frame_error = "frame_truncated";

/**
 * Thrown when liblz4 reports a failure. `error_name()` is the engine's own name
 * for the error code (e.g. "ERROR_frameType_unknown"), or `truncated_frame_error`.
 */
class lz4_error : public std::runtime_error {
    std::string _error_name;

public:
    lz4_error(std::string_view what_failed, std::string_view error_name);

    const std::string& error_name() const noexcept { return _error_name; }
};

namespace detail {

/**
 * Check a return value from an LZ4F_* function. Returns `ret` unchanged if it
 * is not an error code, otherwise throws `lz4_error` with `what_failed` as the
 * message prefix.
 */
std::size_t check_lz4f(std::size_t ret, std::string_view what_failed);

/// Throws std::logic_error for an operation attempted on a closed adapter
[[noreturn]] void throw_closed(std::string_view operation);

}  // namespace detail

}  // namespace lz4s
