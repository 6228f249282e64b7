#include <lz4s/compress.hpp>

#include <lz4s/decompress.hpp>
#include <lz4s/error.hpp>
#include <lz4s/testing/data.hpp>

#include <catch2/catch.hpp>

#include <string>
#include <string_view>

using namespace std::literals;

TEST_CASE("Frame header starts with the LZ4 magic number") {
    lz4s::lz4f_compressor c;
    CHECK(c.has_context());

    std::string out;
    out.resize(c.bound(0));
    auto n = c.begin(neo::mutable_buffer(out));
    REQUIRE(n >= 7);
    CHECK(std::string_view(out).substr(0, 4) == "\x04\x22\x4d\x18"sv);
}

TEST_CASE("Compress and end a frame by hand") {
    lz4s::lz4f_compressor c{{.checksum = true}};
    CHECK(c.options().checksum);

    std::string text = lz4s::testing::sample_text(10000);
    std::string comp;
    comp.resize(c.bound(0) + c.bound(text.size()) + c.bound(0));

    auto out = neo::mutable_buffer(comp);
    auto n   = c.begin(out);
    n += c.update(out + n, neo::const_buffer(text));
    n += c.end(out + n);
    comp.resize(n);
    CHECK(comp.size() < text.size());

    lz4s::lz4f_decompressor d;
    std::string             plain;
    plain.resize(text.size());
    auto res = d(neo::mutable_buffer(plain), neo::const_buffer(comp));
    CHECK(res.frame_done());
    CHECK(res.bytes_read == comp.size());
    CHECK(res.bytes_written == text.size());
    CHECK(plain == text);
}

TEST_CASE("The bound covers at least one full chunk") {
    lz4s::lz4f_compressor c;
    CHECK(c.bound(lz4s::lz4_max_chunk_size) > lz4s::lz4_max_chunk_size);
    CHECK(c.bound(0) > 0);
}

TEST_CASE("Compressing into a buffer that is too small fails") {
    lz4s::lz4f_compressor c;

    std::string header;
    header.resize(c.bound(0));
    c.begin(neo::mutable_buffer(header));

    std::string text = lz4s::testing::sample_noise(1000);
    std::string out;
    out.resize(4);
    try {
        c.update(neo::mutable_buffer(out), neo::const_buffer(text));
        FAIL("Expected an exception");
    } catch (const lz4s::lz4_error& e) {
        CHECK(e.error_name() == "ERROR_dstMaxSize_tooSmall");
        CHECK(std::string_view(e.what()).starts_with("Failed to compress: "));
    }
}

TEST_CASE("A moved-from compressor has no context") {
    lz4s::lz4f_compressor a{{.level = lz4s::lz4_level::normal}};
    lz4s::lz4f_compressor b = std::move(a);
    CHECK_FALSE(a.has_context());
    CHECK(b.has_context());
    CHECK(b.options().level == lz4s::lz4_level::normal);
}

TEST_CASE("A compressor can produce several frames in a row") {
    lz4s::lz4f_compressor c;
    std::string           text = "Hello, LZ4!";
    std::string           buf;
    buf.resize(c.bound(0) + c.bound(text.size()));

    for (int i = 0; i < 3; ++i) {
        auto out = neo::mutable_buffer(buf);
        auto n   = c.begin(out);
        n += c.update(out + n, neo::const_buffer(text));
        n += c.end(out + n);

        lz4s::lz4f_decompressor d;
        std::string             plain;
        plain.resize(64);
        auto res = d(neo::mutable_buffer(plain), neo::const_buffer(buf).first(n));
        CHECK(res.frame_done());
        plain.resize(res.bytes_written);
        CHECK(plain == text);
    }
}
