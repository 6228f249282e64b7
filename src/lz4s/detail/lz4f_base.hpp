#pragma once

#include <utility>

namespace lz4s::detail {

/**
 * Common base of the engine wrappers. Owns a pointer to an engine state object
 * whose concrete type is only known to the wrapper's source file, so that
 * lz4frame.h never leaks into our public headers.
 */
class lz4f_base {
protected:
    void* _state_ptr = nullptr;

    lz4f_base() = default;
    lz4f_base(lz4f_base&& other) noexcept
        : _state_ptr(std::exchange(other._state_ptr, nullptr)) {}
    lz4f_base& operator=(lz4f_base&&) = delete;
    ~lz4f_base()                      = default;

public:
    /// Whether this object still owns an engine context (false once moved-from)
    bool has_context() const noexcept { return _state_ptr != nullptr; }
};

}  // namespace lz4s::detail
