#include <lz4s/decompress.hpp>

#include <lz4s/error.hpp>
#include <lz4s/lz4_io.hpp>
#include <lz4s/testing/data.hpp>

#include <neo/string_io.hpp>

#include <catch2/catch.hpp>

#include <string>

namespace {

std::string compress_to_string(const std::string& text, const lz4s::lz4_frame_options& opts = {}) {
    neo::string_dynbuf_io out;
    lz4s::lz4_compress(out, neo::const_buffer(text), opts);
    return std::string(out.read_area_view());
}

}  // namespace

TEST_CASE("Decompress a whole frame in one call") {
    auto text = lz4s::testing::sample_text(5000);
    auto comp = compress_to_string(text);

    lz4s::lz4f_decompressor d;
    CHECK(d.has_context());
    std::string plain;
    plain.resize(text.size());
    auto res = d(neo::mutable_buffer(plain), neo::const_buffer(comp));
    CHECK(res.frame_done());
    CHECK(res.bytes_read == comp.size());
    CHECK(res.bytes_written == text.size());
    CHECK(plain == text);
}

TEST_CASE("A partial header asks for more input") {
    auto comp = compress_to_string("Hello!");

    lz4s::lz4f_decompressor d;
    std::string             plain;
    plain.resize(16);
    auto res = d(neo::mutable_buffer(plain), neo::const_buffer(comp).first(1));
    CHECK(res.bytes_read == 1);
    CHECK(res.bytes_written == 0);
    CHECK_FALSE(res.frame_done());
    CHECK(res.hint > 0);
}

TEST_CASE("Decompress one byte of input at a time") {
    auto text = lz4s::testing::sample_text(3000);
    auto comp = compress_to_string(text, {.checksum = true});

    lz4s::lz4f_decompressor d;
    std::string             plain;
    plain.resize(text.size());
    auto out = neo::mutable_buffer(plain);
    auto in  = neo::const_buffer(comp);

    lz4s::lz4f_decompress_result res;
    while (!in.empty()) {
        res = d(out, in.first(1));
        CHECK(res.bytes_read == 1);
        out += res.bytes_written;
        in += res.bytes_read;
    }
    CHECK(res.frame_done());
    CHECK(out.empty());
    CHECK(plain == text);
}

TEST_CASE("Decompress garbage") {
    std::string garbage = "I am not an LZ4 frame";

    lz4s::lz4f_decompressor d;
    std::string             plain;
    plain.resize(64);
    try {
        d(neo::mutable_buffer(plain), neo::const_buffer(garbage));
        FAIL("Expected an exception");
    } catch (const lz4s::lz4_error& e) {
        CHECK(e.error_name() == "ERROR_frameType_unknown");
        CHECK(std::string(e.what()) == "Failed to decompress: ERROR_frameType_unknown");
    }

    // The context was reset, so a good frame decodes fine afterwards
    auto comp = compress_to_string("Still works");
    auto res  = d(neo::mutable_buffer(plain), neo::const_buffer(comp));
    CHECK(res.frame_done());
    plain.resize(res.bytes_written);
    CHECK(plain == "Still works");
}

TEST_CASE("Reset abandons a partially decoded frame") {
    auto first  = compress_to_string(lz4s::testing::sample_text(2000));
    auto second = compress_to_string("Second frame");

    lz4s::lz4f_decompressor d;
    std::string             plain;
    plain.resize(4096);
    auto res = d(neo::mutable_buffer(plain), neo::const_buffer(first).first(first.size() / 2));
    CHECK_FALSE(res.frame_done());

    d.reset();
    res = d(neo::mutable_buffer(plain), neo::const_buffer(second));
    CHECK(res.frame_done());
    plain.resize(res.bytes_written);
    CHECK(plain == "Second frame");
}

TEST_CASE("A moved-from decompressor has no context") {
    lz4s::lz4f_decompressor a;
    lz4s::lz4f_decompressor b = std::move(a);
    CHECK_FALSE(a.has_context());
    CHECK(b.has_context());
}
