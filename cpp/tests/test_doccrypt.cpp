#include "nspack/doccrypt.hpp"
#include "nspack/error.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

using nspack::doccrypt::Bytes;
using nspack::doccrypt::Protect;

namespace {

Bytes Block(const Bytes& data, std::size_t index) {
    return Bytes(data.begin() + static_cast<std::ptrdiff_t>(index * 8),
                 data.begin() + static_cast<std::ptrdiff_t>(index * 8 + 8));
}

}  // namespace

TEST(DocCrypt, EmptyBufferIsAccepted) {
    Bytes data;
    EXPECT_NO_THROW(Protect(data));
    EXPECT_TRUE(data.empty());
}

TEST(DocCrypt, RejectsPartialBlockWithoutTouchingData) {
    Bytes data = {1, 2, 3, 4, 5, 6, 7};
    const Bytes original = data;
    try {
        Protect(data);
        FAIL() << "expected InvalidBlockLength";
    } catch (const nspack::Error& err) {
        EXPECT_EQ(err.kind(), nspack::ErrorKind::InvalidBlockLength);
    }
    EXPECT_EQ(data, original);
}

TEST(DocCrypt, FirstMasksMatchTripleDesOfCounterBlocks) {
    // 3DES-ECB of 00000000 07 13 e2 6f and 00000000 08 13 e2 6f.
    Bytes data(16, 0x00);
    Protect(data);
    EXPECT_EQ(Block(data, 0), (Bytes{0x5c, 0x8a, 0x87, 0x13, 0xeb, 0x07, 0xf0, 0x5d}));
    EXPECT_EQ(Block(data, 1), (Bytes{0x74, 0x53, 0x29, 0xc3, 0xee, 0x6a, 0x18, 0x72}));
}

TEST(DocCrypt, IsDeterministic) {
    Bytes first = {0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77};
    Bytes second = first;
    Protect(first);
    Protect(second);
    EXPECT_EQ(first, second);
}

TEST(DocCrypt, DifferentBlocksGiveDifferentCiphertext) {
    Bytes zeros(8, 0x00);
    Bytes ones(8, 0xFF);
    Protect(zeros);
    Protect(ones);
    EXPECT_NE(zeros, ones);
    EXPECT_NE(zeros, Bytes(8, 0x00));
    EXPECT_NE(ones, Bytes(8, 0xFF));
    for (std::size_t i = 0; i < 8; ++i) {
        EXPECT_EQ(static_cast<std::uint8_t>(zeros[i] ^ ones[i]), 0xFF);
    }
}

TEST(DocCrypt, CounterWrapsAfter1024Blocks) {
    Bytes data(1025 * 8, 0x00);
    ASSERT_NO_THROW(Protect(data));
    EXPECT_EQ(Block(data, 1024), Block(data, 0));
    EXPECT_NE(Block(data, 1), Block(data, 0));
    EXPECT_NE(Block(data, 1023), Block(data, 0));
}

TEST(DocCrypt, ApplyingTwiceRestoresInput) {
    Bytes data;
    for (int i = 0; i < 64; ++i) {
        data.push_back(static_cast<std::uint8_t>(i * 7 + 3));
    }
    const Bytes original = data;
    Protect(data);
    EXPECT_NE(data, original);
    Protect(data);
    EXPECT_EQ(data, original);
}
