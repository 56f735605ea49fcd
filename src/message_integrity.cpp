// src/message_integrity.cpp

#include "message_integrity.hpp"

#include <array>

#include "logger.hpp"
#include "stun_builder.hpp"
#include "stun_message.hpp"

namespace stun {

std::vector<uint8_t> message_integrity_digest(DigestAlgorithm algorithm, const MessageIntegrityKey &key,
                                              std::span<const uint8_t> buffer, std::size_t attribute_begin,
                                              uint16_t effective_length) {
    if (attribute_begin < STUN_HEADER_LENGTH || attribute_begin > buffer.size()) {
        throw invalid_data("message integrity attribute outside of message");
    }

    Hmac hmac(algorithm, key.bytes());

    const std::array<uint8_t, 2> length_field = {static_cast<uint8_t>(effective_length >> 8),
                                                 static_cast<uint8_t>(effective_length & 0xFF)};

    hmac.update(buffer.first(2));  // message type
    hmac.update(length_field);
    hmac.update(buffer.subspan(4, attribute_begin - 4));  // cookie, transaction id, preceding attributes

    return hmac.finalize();
}

namespace detail {

void message_integrity_decode(DigestAlgorithm algorithm, const MessageIntegrityKey &key, const StunMessage &msg,
                              const AttrSpan &span) {
    auto received_digest = span.get_value(msg.buffer());

    // 길이가 다르면 HMAC 계산 전에 거부
    if (received_digest.size() != Digest::output_size(algorithm)) {
        log(LogLevel::Debug, "{} has {} bytes, expected {}", attribute_type_name(span.type_code),
            received_digest.size(), Digest::output_size(algorithm));
        throw invalid_data("failed to verify message integrity");
    }

    // The length is taken as if the message ended right after this attribute.
    const uint16_t effective_length = checked_u16(span.padding_end - STUN_HEADER_LENGTH);

    auto calculated_digest = message_integrity_digest(algorithm, key, msg.buffer(), span.begin, effective_length);

    if (!digest_equals(calculated_digest, received_digest)) {
        log(LogLevel::Debug, "{} mismatch for transaction {}", attribute_type_name(span.type_code),
            msg.get_transaction_id().to_hex());
        throw invalid_data("failed to verify message integrity");
    }
}

void message_integrity_encode(DigestAlgorithm algorithm, const MessageIntegrityKey &key, MessageBuilder &builder) {
    // Reject the key before touching the buffer.
    Hmac hmac(algorithm, key.bytes());

    auto &buffer = builder.buffer();
    const std::size_t digest_size = hmac.output_size();

    // type + length of this attribute are already in the buffer
    builder.set_length(checked_u16(buffer.size() + digest_size - STUN_HEADER_LENGTH));

    hmac.update(std::span<const uint8_t>(buffer.data(), buffer.size() - ATTRIBUTE_HEADER_LENGTH));
    auto digest = hmac.finalize();

    buffer.insert(buffer.end(), digest.begin(), digest.end());
}

}  // namespace detail

}  // namespace stun
