#include <lz4s/util.hpp>

#include <lz4s/error.hpp>
#include <lz4s/lz4_io.hpp>
#include <lz4s/testing/data.hpp>

#include <neo/string_io.hpp>

#include <catch2/catch.hpp>

#include <fstream>
#include <iterator>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace {

const auto TEST_DIR = fs::temp_directory_path() / "lz4s-test" / "util";

void write_file(const fs::path& p, const std::string& content) {
    std::ofstream out{p, std::ios::binary};
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

std::string slurp_file(const fs::path& p) {
    std::ifstream in{p, std::ios::binary};
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

TEST_CASE("Compress and decompress a file") {
    fs::create_directories(TEST_DIR);
    auto size = GENERATE(std::size_t(0), std::size_t(100), std::size_t(300000));
    auto text = lz4s::testing::sample_text(size);

    auto source = TEST_DIR / "source.txt";
    auto comp   = TEST_DIR / "source.txt.lz4";
    auto plain  = TEST_DIR / "source.out.txt";
    write_file(source, text);

    auto n_comp = lz4s::compress_file(source, comp, {.checksum = true});
    CHECK(n_comp == fs::file_size(comp));

    auto n_plain = lz4s::decompress_file(comp, plain);
    CHECK(n_plain == size);
    CHECK(slurp_file(plain) == text);
}

TEST_CASE("Decompress a file holding several frames") {
    fs::create_directories(TEST_DIR);
    auto comp  = TEST_DIR / "multi.lz4";
    auto plain = TEST_DIR / "multi.txt";

    std::string one = "one, ";
    std::string two = lz4s::testing::sample_text(90000);
    neo::string_dynbuf_io frames;
    lz4s::lz4_compress(frames, neo::const_buffer(one));
    lz4s::lz4_compress(frames, neo::const_buffer(two), {.linked_blocks = false});
    write_file(comp, std::string(frames.read_area_view()));

    CHECK(lz4s::decompress_file(comp, plain) == one.size() + two.size());
    CHECK(slurp_file(plain) == one + two);
}

TEST_CASE("Compress a file that doesn't exist") {
    fs::create_directories(TEST_DIR);
    auto missing = TEST_DIR / "no-such-file.txt";
    fs::remove(missing);
    CHECK_THROWS_AS(lz4s::compress_file(missing, TEST_DIR / "never.lz4"), std::system_error);
    CHECK_THROWS_AS(lz4s::decompress_file(missing, TEST_DIR / "never.txt"), std::system_error);
}

TEST_CASE("Decompress a file that isn't LZ4") {
    fs::create_directories(TEST_DIR);
    auto bogus = TEST_DIR / "bogus.lz4";
    write_file(bogus, "Definitely not compressed");
    try {
        lz4s::decompress_file(bogus, TEST_DIR / "bogus.txt");
        FAIL("Expected an exception");
    } catch (const lz4s::lz4_error& e) {
        CHECK(e.error_name() == "ERROR_frameType_unknown");
        CHECK(std::string_view(e.what()).starts_with("Failure while decompressing ["));
    }
}

TEST_CASE("Decompress a file whose last frame was cut short") {
    fs::create_directories(TEST_DIR);
    auto comp  = TEST_DIR / "short.lz4";
    auto plain = TEST_DIR / "short.txt";

    neo::string_dynbuf_io frames;
    lz4s::lz4_compress(frames, neo::const_buffer(lz4s::testing::sample_text(5000)));
    auto bytes = std::string(frames.read_area_view());
    bytes.resize(bytes.size() - 4);
    write_file(comp, bytes);

    try {
        lz4s::decompress_file(comp, plain);
        FAIL("Expected an exception");
    } catch (const lz4s::lz4_error& e) {
        CHECK(e.error_name() == lz4s::truncated_frame_error);
        CHECK(std::string_view(e.what()).starts_with("Failure while decompressing ["));
    }
}
