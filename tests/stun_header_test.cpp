// tests/stun_header_test.cpp

#include <gtest/gtest.h>

#include <unordered_set>
#include <vector>

#include "stun_error.hpp"
#include "stun_header.hpp"
#include "test_vectors.hpp"

namespace stun {
namespace {

TEST(StunHeaderTest, MessageTypeEncoding) {
    EXPECT_EQ(MessageHeader::encode_type(StunClass::REQUEST, StunMethod::BINDING), 0x0001);
    EXPECT_EQ(MessageHeader::encode_type(StunClass::INDICATION, StunMethod::BINDING), 0x0011);
    EXPECT_EQ(MessageHeader::encode_type(StunClass::SUCCESS_RESPONSE, StunMethod::BINDING), 0x0101);
    EXPECT_EQ(MessageHeader::encode_type(StunClass::ERROR_RESPONSE, StunMethod::BINDING), 0x0111);
    EXPECT_EQ(MessageHeader::encode_type(StunClass::REQUEST, StunMethod::ALLOCATE), 0x0003);
    EXPECT_EQ(MessageHeader::encode_type(StunClass::ERROR_RESPONSE, StunMethod::CHANNEL_BIND), 0x0119);
}

TEST(StunHeaderTest, MessageTypeDecodingInvertsEncoding) {
    const StunClass classes[] = {StunClass::REQUEST, StunClass::INDICATION, StunClass::SUCCESS_RESPONSE,
                                 StunClass::ERROR_RESPONSE};
    const uint16_t methods[] = {0x001, 0x009, 0x07F, 0x080, 0xABC, 0xFFF};

    for (auto cls : classes) {
        for (auto m : methods) {
            auto method = static_cast<StunMethod>(m);
            uint16_t type = MessageHeader::encode_type(cls, method);
            EXPECT_EQ(type & 0xC000, 0);
            EXPECT_EQ(MessageHeader::decode_class(type), cls);
            EXPECT_EQ(MessageHeader::decode_method(type), method);
        }
    }
}

TEST(StunHeaderTest, DecodeRfc5769Header) {
    auto bytes = test::rfc5769_ipv4_response();
    auto header = MessageHeader::decode(bytes);

    EXPECT_EQ(header.cls, StunClass::SUCCESS_RESPONSE);
    EXPECT_EQ(header.method, StunMethod::BINDING);
    EXPECT_EQ(header.length, 0x3C);
    EXPECT_EQ(header.transaction_id.to_hex(), "b7e7a701bc34d686fa87dfae");
}

TEST(StunHeaderTest, EncodeWritesCookieAndTransactionId) {
    MessageHeader header;
    header.cls = StunClass::REQUEST;
    header.method = StunMethod::BINDING;
    header.length = 0x58;
    header.transaction_id = TransactionId::from_bytes(test::rfc5769_transaction_id());

    std::vector<uint8_t> buffer;
    header.encode(buffer);

    auto expected = test::rfc5769_request();
    expected.resize(STUN_HEADER_LENGTH);
    EXPECT_EQ(buffer, expected);
}

TEST(StunHeaderTest, DecodeRejectsBadHeaders) {
    auto bytes = test::rfc5769_request();

    std::vector<uint8_t> short_buffer(bytes.begin(), bytes.begin() + 19);
    EXPECT_THROW(MessageHeader::decode(short_buffer), StunError);

    auto leading_bits = bytes;
    leading_bits[0] |= 0x80;
    EXPECT_THROW(MessageHeader::decode(leading_bits), StunError);

    auto bad_cookie = bytes;
    bad_cookie[7] ^= 0xFF;
    EXPECT_THROW(MessageHeader::decode(bad_cookie), StunError);
}

TEST(StunHeaderTest, IsStunMessage) {
    EXPECT_TRUE(is_stun_message(test::rfc5769_request()));

    std::vector<uint8_t> rtp = {0x80, 0x60, 0x00, 0x01};
    rtp.resize(40, 0);
    EXPECT_FALSE(is_stun_message(rtp));
    EXPECT_FALSE(is_stun_message({}));
}

TEST(TransactionIdTest, FromBytesRequiresTwelveBytes) {
    std::vector<uint8_t> eleven(11, 0);
    EXPECT_THROW(TransactionId::from_bytes(eleven), StunError);

    auto id = TransactionId::from_bytes(test::rfc5769_transaction_id());
    EXPECT_EQ(id.to_hex(), "b7e7a701bc34d686fa87dfae");
}

TEST(TransactionIdTest, GenerateIsRandom) {
    std::unordered_set<TransactionId, TransactionId::Hasher> ids;
    for (int i = 0; i < 64; ++i) {
        ids.insert(TransactionId::generate());
    }
    EXPECT_EQ(ids.size(), 64u);
}

TEST(ByteOrderTest, ReadAndAppendBigEndian) {
    std::vector<uint8_t> buffer;
    append_u16(buffer, 0x1234);
    append_u32(buffer, 0x89ABCDEF);
    append_u64(buffer, 0x0102030405060708ULL);

    ASSERT_EQ(buffer.size(), 14u);
    EXPECT_EQ(buffer[0], 0x12);
    EXPECT_EQ(buffer[2], 0x89);
    EXPECT_EQ(read_u16(buffer, 0), 0x1234);
    EXPECT_EQ(read_u32(buffer, 2), 0x89ABCDEFu);
    EXPECT_EQ(read_u64(buffer, 6), 0x0102030405060708ULL);
}

TEST(ByteOrderTest, PaddedLength) {
    EXPECT_EQ(padded_length(0), 0u);
    EXPECT_EQ(padded_length(1), 4u);
    EXPECT_EQ(padded_length(4), 4u);
    EXPECT_EQ(padded_length(9), 12u);
    EXPECT_EQ(padded_length(763), 764u);
}

}  // namespace
}  // namespace stun
