#include "./lz4_io.hpp"

#include <cerrno>
#include <system_error>

using namespace lz4s;

namespace fs = std::filesystem;

lz4_file_reader lz4s::open_lz4_reader(const fs::path& path) {
    std::ifstream in;
    in.exceptions(in.exceptions() | std::ios::badbit);
    in.open(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::system_error(std::error_code(errno, std::system_category()),
                                "Failed to open [" + path.string() + "] for reading");
    }
    return lz4_file_reader{neo::iostream_io{std::move(in)}, close_mode::close_stream};
}

lz4_file_writer lz4s::open_lz4_writer(const fs::path& path, const lz4_frame_options& opts) {
    std::ofstream out;
    out.exceptions(out.exceptions() | std::ios::badbit | std::ios::failbit);
    out.open(path, std::ios::binary);
    return lz4_file_writer{neo::iostream_io{std::move(out)}, opts, close_mode::close_stream};
}
