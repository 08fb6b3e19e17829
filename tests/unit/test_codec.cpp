#include <cstdint>
#include <limits>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "codec/address.hpp"
#include "codec/base58.hpp"
#include "codec/base64.hpp"
#include "codec/bcs.hpp"
#include "codec/ed25519.hpp"
#include "codec/hex.hpp"
#include "codec/sha256.hpp"
#include "codec/stringified.hpp"

namespace {

using nexus::core::errors::get_error;
using nexus::core::errors::get_value;
using nexus::core::errors::is_error;
namespace codec = nexus::codec;

TEST(StringifiedTest, ParsesAndSerializesExtremes) {
    for (std::uint64_t n : {std::uint64_t{0}, std::uint64_t{42},
                            std::uint64_t{9007199254740993ULL},
                            std::numeric_limits<std::uint64_t>::max()}) {
        auto parsed = codec::parse_stringified_u64(codec::serialize_stringified_u64(n));
        ASSERT_FALSE(is_error(parsed));
        EXPECT_EQ(get_value(parsed), n);
    }
}

TEST(StringifiedTest, RejectsOverflowAndGarbage) {
    EXPECT_TRUE(is_error(codec::parse_stringified_u64("18446744073709551616")));
    EXPECT_TRUE(is_error(codec::parse_stringified_u64("")));
    EXPECT_TRUE(is_error(codec::parse_stringified_u64("-1")));
    EXPECT_TRUE(is_error(codec::parse_stringified_u64("12a")));
}

TEST(StringifiedTest, ReadU64NamesTheField) {
    const nlohmann::json object{{"walk_index", "not a number"}};
    auto value = codec::read_u64(object, "walk_index");
    ASSERT_TRUE(is_error(value));
    EXPECT_EQ(get_error(value).code, "malformed_payload");
    EXPECT_NE(get_error(value).message.find("walk_index"), std::string::npos);

    auto missing = codec::read_optional_u64(nlohmann::json::object(), "deadline_ms");
    ASSERT_FALSE(is_error(missing));
    EXPECT_FALSE(get_value(missing).has_value());
}

TEST(StringifiedTest, JsonIntegersCountRegardlessOfStorage) {
    EXPECT_TRUE(codec::is_json_u64(nlohmann::json(5000000)));
    EXPECT_TRUE(codec::is_json_u64(nlohmann::json::parse("5000000")));
    EXPECT_TRUE(codec::is_json_u64(nlohmann::json(0)));
    EXPECT_FALSE(codec::is_json_u64(nlohmann::json(-1)));
    EXPECT_FALSE(codec::is_json_u64(nlohmann::json(1.5)));
    EXPECT_FALSE(codec::is_json_u64(nlohmann::json("7")));

    auto bytes = codec::read_byte_array(nlohmann::json{{"b", {1, 2, 255}}}, "b");
    ASSERT_FALSE(is_error(bytes));
    EXPECT_EQ(get_value(bytes), (std::vector<std::uint8_t>{1, 2, 255}));
}

TEST(Base64Test, UrlSafeWithoutPadding) {
    EXPECT_EQ(codec::base64url_encode_no_pad(codec::to_bytes("ping")), "cGluZw");
    EXPECT_EQ(codec::base64url_encode_no_pad(codec::Bytes(16, 0)), "AAAAAAAAAAAAAAAAAAAAAA");

    auto decoded = codec::base64url_decode_no_pad("cGluZw");
    ASSERT_FALSE(is_error(decoded));
    EXPECT_EQ(get_value(decoded), codec::to_bytes("ping"));
}

TEST(Base64Test, StrictDecoderRejectsMalformedInput) {
    auto impossible = codec::base64url_decode_no_pad("a");
    ASSERT_TRUE(is_error(impossible));
    EXPECT_EQ(get_error(impossible).code, "invalid_base64");

    EXPECT_TRUE(is_error(codec::base64url_decode_no_pad("cGluZw==")));
    EXPECT_TRUE(is_error(codec::base64url_decode_no_pad("cGlu+w")));
    // "cGluZx" carries non-zero trailing bits.
    EXPECT_TRUE(is_error(codec::base64url_decode_no_pad("cGluZx")));
}

TEST(Base58Test, EncodesKnownVectors) {
    EXPECT_EQ(codec::base58_encode(codec::to_bytes("hello world")), "StV1DL6CwTryKyV");
    EXPECT_EQ(codec::base58_encode(codec::Bytes{0, 0, 1}), "112");

    auto decoded = codec::base58_decode("StV1DL6CwTryKyV");
    ASSERT_FALSE(is_error(decoded));
    EXPECT_EQ(get_value(decoded), codec::to_bytes("hello world"));

    auto bad = codec::base58_decode("0OIl");
    ASSERT_TRUE(is_error(bad));
    EXPECT_EQ(get_error(bad).code, "invalid_base58");
}

TEST(Base58Test, DigestsMustBe32Bytes) {
    const auto digest = codec::base58_encode(codec::Bytes(32, 7));
    EXPECT_FALSE(is_error(codec::decode_digest(digest)));
    EXPECT_TRUE(is_error(codec::decode_digest(codec::base58_encode(codec::Bytes(31, 7)))));
}

TEST(HexTest, RoundTripsAndValidates) {
    EXPECT_EQ(codec::hex_encode(codec::Bytes{0x00, 0xab, 0xff}), "00abff");
    auto decoded = codec::hex_decode("0x00ABff");
    ASSERT_FALSE(is_error(decoded));
    EXPECT_EQ(get_value(decoded), (codec::Bytes{0x00, 0xab, 0xff}));

    EXPECT_TRUE(is_error(codec::hex_decode("abc")));
    EXPECT_TRUE(codec::is_lower_hex("00abff", 6));
    EXPECT_FALSE(codec::is_lower_hex("00ABFF", 6));
}

TEST(AddressTest, ShortFormsArePadded) {
    auto address = codec::Address::from_hex("0x2");
    ASSERT_FALSE(is_error(address));
    EXPECT_EQ(get_value(address), codec::framework_address());
    EXPECT_EQ(get_value(address).to_hex(),
              "0x0000000000000000000000000000000000000000000000000000000000000002");
    EXPECT_TRUE(is_error(codec::Address::from_hex("0xzz")));
}

TEST(Sha256Test, EmptyBodyDigest) {
    EXPECT_EQ(codec::sha256_hex(codec::Bytes{}),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Ed25519Test, MatchesRfc8032FirstVector) {
    auto seed_bytes =
        codec::hex_decode("9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
    ASSERT_FALSE(is_error(seed_bytes));
    auto key = codec::SigningKey::from_bytes(get_value(seed_bytes));
    ASSERT_FALSE(is_error(key));
    const auto& signing_key = get_value(key);

    const auto& pk = signing_key.verifying_key().bytes();
    EXPECT_EQ(codec::hex_encode(pk.data(), pk.size()),
              "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");

    auto signature = signing_key.sign(codec::Bytes{});
    ASSERT_FALSE(is_error(signature));
    const auto& sig = get_value(signature);
    EXPECT_EQ(codec::hex_encode(sig.data(), sig.size()),
              "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555fb8821590a33bac"
              "c61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b");
    EXPECT_TRUE(signing_key.verifying_key().verify_strict(codec::Bytes{}, sig));

    auto tampered = sig;
    tampered[0] ^= 0x01;
    EXPECT_FALSE(signing_key.verifying_key().verify_strict(codec::Bytes{}, tampered));
}

TEST(Ed25519Test, IdentityPointIsWeak) {
    codec::Ed25519PublicKey identity{};
    identity[0] = 0x01;
    EXPECT_TRUE(codec::VerifyingKey(identity).is_weak());
}

TEST(BcsTest, EncodesPrimitiveShapes) {
    EXPECT_EQ(codec::bcs_u64(1), (codec::Bytes{1, 0, 0, 0, 0, 0, 0, 0}));
    EXPECT_EQ(codec::bcs_bool(true), (codec::Bytes{1}));
    EXPECT_EQ(codec::bcs_string("ab"), (codec::Bytes{2, 'a', 'b'}));
    EXPECT_EQ(codec::bcs_option_u64(std::nullopt), (codec::Bytes{0}));
    EXPECT_EQ(codec::bcs_option_u64(std::uint64_t{2}), (codec::Bytes{1, 2, 0, 0, 0, 0, 0, 0, 0}));

    codec::BcsWriter writer;
    writer.uleb128(300);
    EXPECT_EQ(writer.bytes(), (codec::Bytes{0xac, 0x02}));
}

}  // namespace
