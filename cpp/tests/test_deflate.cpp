#include "nspack/deflate.hpp"
#include "nspack/error.hpp"

#include <gtest/gtest.h>

#include <string>

using nspack::deflate::Bytes;

namespace {

Bytes FromString(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

}  // namespace

TEST(Deflate, EmptyInputRoundTrips) {
    Bytes compressed = nspack::deflate::Compress({});
    EXPECT_FALSE(compressed.empty());
    EXPECT_TRUE(nspack::deflate::Decompress(compressed).empty());
}

TEST(Deflate, ShortStringRoundTrips) {
    const Bytes original = FromString("Hello, World! This is a test of compression.");
    EXPECT_EQ(nspack::deflate::Decompress(nspack::deflate::Compress(original)), original);
}

TEST(Deflate, RepeatedBytesCompressWell) {
    const Bytes original(1000, 'A');
    Bytes compressed = nspack::deflate::Compress(original);
    EXPECT_LT(compressed.size(), original.size() / 2);
    EXPECT_EQ(nspack::deflate::Decompress(compressed), original);
}

TEST(Deflate, OutputIsRawWithoutZlibHeader) {
    // A zlib stream would start with 0x78; a gzip stream with 1f 8b.
    Bytes compressed = nspack::deflate::Compress(FromString("<prob><test/></prob>"));
    ASSERT_GE(compressed.size(), 2u);
    EXPECT_NE(compressed[0], 0x78);
    EXPECT_FALSE(compressed[0] == 0x1f && compressed[1] == 0x8b);
}

TEST(Deflate, InvalidDataFailsWithDecompressionError) {
    try {
        nspack::deflate::Decompress(FromString("This is not compressed data"));
        FAIL() << "expected DecompressionFailed";
    } catch (const nspack::Error& err) {
        EXPECT_EQ(err.kind(), nspack::ErrorKind::DecompressionFailed);
    }
}

TEST(Deflate, TruncatedStreamFails) {
    Bytes compressed = nspack::deflate::Compress(Bytes(4096, 'x'));
    compressed.resize(compressed.size() / 2);
    EXPECT_THROW(nspack::deflate::Decompress(compressed), nspack::Error);
}

TEST(Deflate, Crc32MatchesKnownValue) {
    EXPECT_EQ(nspack::deflate::Crc32(FromString("123456789")), 0xCBF43926u);
    EXPECT_EQ(nspack::deflate::Crc32({}), 0u);
}
