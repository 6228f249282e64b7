#include "./util.hpp"

#include "./lz4_io.hpp"

#include <neo/buffer_algorithm/copy.hpp>
#include <neo/iostream_io.hpp>
#include <neo/ufmt.hpp>

#include <cerrno>
#include <fstream>
#include <system_error>

using namespace lz4s;

namespace fs = std::filesystem;

std::uint64_t
lz4s::compress_file(const fs::path& source, const fs::path& lz4_dest, const lz4_frame_options& opts) {
    std::ifstream in;
    in.exceptions(in.exceptions() | std::ios::badbit);
    in.open(source, std::ios::binary);
    if (!in.is_open()) {
        throw std::system_error(std::error_code(errno, std::system_category()),
                                neo::ufmt("Failed to open [{}] for compression", source.string()));
    }

    neo::iostream_io file_in{in};
    auto             lz4_out = open_lz4_writer(lz4_dest, opts);
    neo::buffer_copy(lz4_out, file_in);
    lz4_out.close();
    return lz4_out.compressed_bytes_out();
}

std::uint64_t lz4s::decompress_file(const fs::path& lz4_source, const fs::path& dest) {
    std::ifstream in;
    in.exceptions(in.exceptions() | std::ios::badbit);
    in.open(lz4_source, std::ios::binary);
    if (!in.is_open()) {
        throw std::system_error(std::error_code(errno, std::system_category()),
                                neo::ufmt("Failed to open [{}] for decompression",
                                          lz4_source.string()));
    }

    std::ofstream out;
    out.exceptions(out.exceptions() | std::ios::badbit | std::ios::failbit);
    out.open(dest, std::ios::binary);
    neo::iostream_io file_in{in};
    neo::iostream_io file_out{out};
    try {
        auto n_written = lz4_decompress(file_out, file_in);
        out.close();
        return n_written;
    } catch (const lz4_error& e) {
        throw lz4_error(neo::ufmt("Failure while decompressing [{}] to [{}]",
                                  lz4_source.string(),
                                  dest.string()),
                        e.error_name());
    }
}
