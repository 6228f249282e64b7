#include "./error.hpp"

#include <neo/ufmt.hpp>

#include <lz4frame.h>

using namespace lz4s;

lz4_error::lz4_error(std::string_view what_failed, std::string_view error_name)
    : runtime_error(neo::ufmt("{}: {}", what_failed, error_name))
    , _error_name(error_name) {}

std::size_t lz4s::detail::check_lz4f(std::size_t ret, std::string_view what_failed) {
    if (::LZ4F_isError(ret)) {
        throw lz4_error(what_failed, ::LZ4F_getErrorName(ret));
    }
    return ret;
}

void lz4s::detail::throw_closed(std::string_view operation) {
    throw std::logic_error(
        neo::ufmt("Attempted to {} an LZ4 stream that has already been closed", operation));
}
