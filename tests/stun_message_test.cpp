// tests/stun_message_test.cpp

#include <gtest/gtest.h>

#include <vector>

#include "fingerprint.hpp"
#include "message_integrity.hpp"
#include "stun_address.hpp"
#include "stun_attributes.hpp"
#include "stun_error.hpp"
#include "stun_message.hpp"
#include "test_vectors.hpp"

namespace stun {
namespace {

constexpr uint16_t SOFTWARE_TYPE = static_cast<uint16_t>(StunAttributeType::SOFTWARE);
constexpr uint16_t USERNAME_TYPE = static_cast<uint16_t>(StunAttributeType::USERNAME);
constexpr uint16_t MI_TYPE = static_cast<uint16_t>(StunAttributeType::MESSAGE_INTEGRITY);
constexpr uint16_t MI_SHA256_TYPE = static_cast<uint16_t>(StunAttributeType::MESSAGE_INTEGRITY_SHA256);
constexpr uint16_t FINGERPRINT_TYPE = static_cast<uint16_t>(StunAttributeType::FINGERPRINT);

void expect_invalid(std::vector<uint8_t> bytes) {
    try {
        StunMessage::parse(std::move(bytes));
        FAIL() << "expected StunError";
    } catch (const StunError &e) {
        EXPECT_EQ(e.kind(), StunErrorKind::INVALID_DATA);
    }
}

TEST(StunMessageTest, ParseRfc5769Request) {
    auto msg = StunMessage::parse(test::rfc5769_request());

    EXPECT_EQ(msg.get_class(), StunClass::REQUEST);
    EXPECT_EQ(msg.get_method(), StunMethod::BINDING);
    EXPECT_EQ(msg.declared_length(), 0x58);
    EXPECT_EQ(msg.get_transaction_id().to_hex(), "b7e7a701bc34d686fa87dfae");

    const auto &spans = msg.attributes();
    ASSERT_EQ(spans.size(), 6u);
    EXPECT_EQ(spans[0].type_code, SOFTWARE_TYPE);
    EXPECT_EQ(spans[0].begin, 20u);
    EXPECT_EQ(spans[0].value_begin, 24u);
    EXPECT_EQ(spans[0].value_end, 40u);
    EXPECT_EQ(spans[0].padding_end, 40u);

    // USERNAME has 9 value bytes and 3 padding bytes
    EXPECT_EQ(spans[3].type_code, USERNAME_TYPE);
    EXPECT_EQ(spans[3].value_length(), 9u);
    EXPECT_EQ(spans[3].padding_end, spans[3].value_end + 3);

    EXPECT_EQ(spans[4].type_code, MI_TYPE);
    EXPECT_EQ(spans[5].type_code, FINGERPRINT_TYPE);
    EXPECT_EQ(spans[5].padding_end, msg.buffer().size());
}

TEST(StunMessageTest, DecodeRfc5769RequestAttributes) {
    auto msg = StunMessage::parse(test::rfc5769_request());

    auto software = msg.attribute<Software>();
    ASSERT_TRUE(software.has_value());
    EXPECT_EQ(software->value(), "STUN test client");

    auto priority = msg.attribute<Priority>();
    ASSERT_TRUE(priority.has_value());
    EXPECT_EQ(priority->value(), 0x6E0001FFu);

    auto controlled = msg.attribute<IceControlled>();
    ASSERT_TRUE(controlled.has_value());
    EXPECT_EQ(controlled->value(), 0x932FF9B151263B36ULL);

    // padding bytes are not part of the value, whatever they contain
    auto username = msg.attribute<Username>();
    ASSERT_TRUE(username.has_value());
    EXPECT_EQ(username->value(), "evtj:h6vY");

    EXPECT_FALSE(msg.attribute<IceControlling>().has_value());
    EXPECT_FALSE(msg.attribute<XorMappedAddress>().has_value());
}

TEST(StunMessageTest, DecodeRfc5769Ipv4Response) {
    auto msg = StunMessage::parse(test::rfc5769_ipv4_response());

    EXPECT_EQ(msg.get_class(), StunClass::SUCCESS_RESPONSE);
    EXPECT_EQ(msg.attribute<Software>()->value(), "test vector");

    auto mapped = msg.attribute<XorMappedAddress>();
    ASSERT_TRUE(mapped.has_value());
    EXPECT_EQ(mapped->endpoint().address().to_string(), "192.0.2.1");
    EXPECT_EQ(mapped->endpoint().port(), 32853);
}

TEST(StunMessageTest, DecodeRfc5769Ipv6Response) {
    auto msg = StunMessage::parse(test::rfc5769_ipv6_response());

    auto mapped = msg.attribute<XorMappedAddress>();
    ASSERT_TRUE(mapped.has_value());
    EXPECT_TRUE(mapped->endpoint().address().is_v6());
    EXPECT_EQ(mapped->endpoint().address(), asio::ip::make_address("2001:db8:1234:5678:11:2233:4455:6677"));
    EXPECT_EQ(mapped->endpoint().port(), 32853);
}

TEST(StunMessageTest, TrailingBytesAreDropped) {
    auto bytes = test::rfc5769_request();
    const std::size_t size = bytes.size();
    bytes.push_back(0xDE);
    bytes.push_back(0xAD);

    auto msg = StunMessage::parse(std::move(bytes));
    EXPECT_EQ(msg.buffer().size(), size);
    EXPECT_NO_THROW(msg.attribute<Fingerprint>());
}

TEST(StunMessageTest, RejectsMalformedFraming) {
    auto bytes = test::rfc5769_request();

    // shorter than a header
    expect_invalid(std::vector<uint8_t>(bytes.begin(), bytes.begin() + 12));

    // wrong magic cookie
    auto bad_cookie = bytes;
    bad_cookie[4] = 0x00;
    expect_invalid(bad_cookie);

    // length not a multiple of 4
    auto odd_length = bytes;
    odd_length[3] = 0x57;
    expect_invalid(odd_length);

    // length larger than the datagram
    auto truncated = bytes;
    truncated.resize(truncated.size() - 4);
    expect_invalid(truncated);

    // attribute value running past the end of the message
    auto long_value = bytes;
    long_value[102] = 0x00;
    long_value[103] = 0x08;  // FINGERPRINT claims 8 bytes
    expect_invalid(long_value);
}

TEST(StunMessageTest, HeaderOnlyMessage) {
    auto bytes = test::rfc5769_request();
    bytes.resize(STUN_HEADER_LENGTH);
    bytes[2] = 0;
    bytes[3] = 0;

    auto msg = StunMessage::parse(std::move(bytes));
    EXPECT_TRUE(msg.attributes().empty());
    EXPECT_FALSE(msg.has_attribute(SOFTWARE_TYPE));
    EXPECT_FALSE(msg.attribute<Fingerprint>().has_value());
}

TEST(StunMessageTest, AttributesAfterFingerprintAreIgnored) {
    // FINGERPRINT followed by SOFTWARE "abcd"
    auto bytes = test::from_hex(
        "000100102112a442b7e7a701bc34d686fa87dfae"
        "8028000400000000"
        "8022000461626364");
    auto msg = StunMessage::parse(std::move(bytes));

    ASSERT_EQ(msg.attributes().size(), 2u);
    EXPECT_TRUE(msg.has_attribute(FINGERPRINT_TYPE));
    EXPECT_FALSE(msg.has_attribute(SOFTWARE_TYPE));
    EXPECT_FALSE(msg.attribute<Software>().has_value());
}

TEST(StunMessageTest, OnlySecurityAttributesFollowMessageIntegrity) {
    // MESSAGE-INTEGRITY, SOFTWARE, MESSAGE-INTEGRITY-SHA256, USERNAME, FINGERPRINT. Lookup only, nothing is verified.
    std::vector<uint8_t> bytes = test::from_hex("000100002112a442b7e7a701bc34d686fa87dfae");
    append_u16(bytes, MI_TYPE);
    append_u16(bytes, 20);
    bytes.insert(bytes.end(), 20, 0);
    append_u16(bytes, SOFTWARE_TYPE);
    append_u16(bytes, 4);
    bytes.insert(bytes.end(), {'a', 'b', 'c', 'd'});
    append_u16(bytes, MI_SHA256_TYPE);
    append_u16(bytes, 32);
    bytes.insert(bytes.end(), 32, 0);
    append_u16(bytes, USERNAME_TYPE);
    append_u16(bytes, 4);
    bytes.insert(bytes.end(), {'u', 's', 'e', 'r'});
    append_u16(bytes, FINGERPRINT_TYPE);
    append_u16(bytes, 4);
    bytes.insert(bytes.end(), 4, 0);

    const uint16_t length = static_cast<uint16_t>(bytes.size() - STUN_HEADER_LENGTH);
    bytes[2] = static_cast<uint8_t>(length >> 8);
    bytes[3] = static_cast<uint8_t>(length & 0xFF);

    auto msg = StunMessage::parse(std::move(bytes));
    ASSERT_EQ(msg.attributes().size(), 5u);

    EXPECT_TRUE(msg.has_attribute(MI_TYPE));
    EXPECT_FALSE(msg.has_attribute(SOFTWARE_TYPE));
    EXPECT_TRUE(msg.has_attribute(MI_SHA256_TYPE));
    EXPECT_FALSE(msg.has_attribute(USERNAME_TYPE));
    EXPECT_TRUE(msg.has_attribute(FINGERPRINT_TYPE));
}

TEST(StunMessageTest, FirstOccurrenceWins) {
    auto bytes = test::from_hex(
        "000100102112a442b7e7a701bc34d686fa87dfae"
        "8022000461626364"
        "8022000465666768");
    auto msg = StunMessage::parse(std::move(bytes));

    EXPECT_EQ(msg.attribute<Software>()->value(), "abcd");
}

TEST(StunMessageTest, MessageIntegrityNeedsKey) {
    auto msg = StunMessage::parse(test::rfc5769_request());
    auto key = MessageIntegrityKey::new_short_term(test::RFC5769_PASSWORD);

    EXPECT_TRUE(msg.attribute_with<MessageIntegrity>(key).has_value());
    EXPECT_FALSE(msg.attribute_with<MessageIntegritySha256>(key).has_value());
}

}  // namespace
}  // namespace stun
