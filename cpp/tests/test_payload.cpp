#include "nspack/constants.hpp"
#include "nspack/deflate.hpp"
#include "nspack/doccrypt.hpp"
#include "nspack/error.hpp"
#include "nspack/payload.hpp"
#include "nspack/templates.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using nspack::payload::Bytes;

namespace {

Bytes ToBytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

}  // namespace

TEST(Payload, PadToBlockRoundsUpWithZeros) {
    Bytes three = {1, 2, 3};
    nspack::payload::PadToBlock(three);
    ASSERT_EQ(three.size(), 8u);
    EXPECT_EQ(three[2], 3);
    for (std::size_t i = 3; i < 8; ++i) {
        EXPECT_EQ(three[i], 0);
    }

    Bytes eight(8, 0xEE);
    nspack::payload::PadToBlock(eight);
    EXPECT_EQ(eight, Bytes(8, 0xEE));

    Bytes nine(9, 1);
    nspack::payload::PadToBlock(nine);
    EXPECT_EQ(nine.size(), 16u);

    Bytes empty;
    nspack::payload::PadToBlock(empty);
    EXPECT_TRUE(empty.empty());
}

TEST(Payload, ProtectedPayloadStartsWithVendorHeader) {
    const Bytes templated = nspack::templates::WrapLuaScript("print('hi')");
    const Bytes payload = nspack::payload::ProtectPayload(templated);
    const Bytes header = nspack::templates::ProtectedHeader();
    ASSERT_EQ(header.size(), 40u);
    ASSERT_GT(payload.size(), header.size());
    EXPECT_TRUE(std::equal(header.begin(), header.end(), payload.begin()));
    EXPECT_EQ((payload.size() - header.size()) % nspack::constants::kBlockSize, 0u);
}

TEST(Payload, ProtectedPayloadUnwindsToTemplate) {
    const Bytes templated = nspack::templates::WrapLuaScript("local x = 1\nprint(x)\n");
    const Bytes payload = nspack::payload::ProtectPayload(templated);

    Bytes body(payload.begin() + 40, payload.end());
    nspack::doccrypt::Protect(body);
    // Trailing pad bytes follow the end of the deflate stream.
    EXPECT_EQ(nspack::deflate::Decompress(body), templated);
}

TEST(Payload, ProtectedPayloadIsDeterministic) {
    const Bytes templated = ToBytes("same input");
    EXPECT_EQ(nspack::payload::ProtectPayload(templated), nspack::payload::ProtectPayload(templated));
}

TEST(Payload, ProtectedEntryUsesVendorMethod) {
    nspack::tns::Entry entry = nspack::payload::ProtectedEntry("Problem1.xml", ToBytes("body"));
    EXPECT_EQ(entry.name, "Problem1.xml");
    EXPECT_EQ(entry.method, nspack::tns::Method::VendorProtected);
    EXPECT_FALSE(entry.crc32.has_value());
    EXPECT_FALSE(entry.uncompressed_size.has_value());
}

TEST(Payload, CompanionEntryDescribesOriginalBytes) {
    const Bytes script = ToBytes("import math\nprint(math.pi)\nprint(math.pi)\nprint(math.pi)\n");
    nspack::tns::Entry entry = nspack::payload::CompanionEntry("calc.py", script);
    EXPECT_EQ(entry.name, "calc.py");
    EXPECT_EQ(entry.method, nspack::tns::Method::Deflated);
    ASSERT_TRUE(entry.uncompressed_size.has_value());
    EXPECT_EQ(*entry.uncompressed_size, script.size());
    ASSERT_TRUE(entry.crc32.has_value());
    EXPECT_EQ(*entry.crc32, nspack::deflate::Crc32(script));
    EXPECT_EQ(nspack::deflate::Decompress(entry.body), script);
}

TEST(Payload, EmptyCompanionStillDeflates) {
    nspack::tns::Entry entry = nspack::payload::CompanionEntry("empty.py", {});
    EXPECT_EQ(*entry.uncompressed_size, 0u);
    EXPECT_EQ(*entry.crc32, 0u);
    EXPECT_FALSE(entry.body.empty());
}
