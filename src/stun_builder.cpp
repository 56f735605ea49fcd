// src/stun_builder.cpp

#include "stun_builder.hpp"

#include "logger.hpp"
#include "stun_error.hpp"

namespace stun {

MessageBuilder::MessageBuilder(StunClass cls, StunMethod method, const TransactionId &transaction_id)
    : transaction_id_(transaction_id) {
    MessageHeader header;
    header.cls = cls;
    header.method = method;
    header.length = 0;  // finish() 또는 속성 추가 시 갱신
    header.transaction_id = transaction_id;

    buffer_.reserve(STUN_HEADER_LENGTH + 64);
    header.encode(buffer_);
}

void MessageBuilder::set_length(uint16_t length) {
    if (finished_) {
        throw invalid_data("message already finished");
    }
    buffer_[2] = static_cast<uint8_t>(length >> 8);
    buffer_[3] = static_cast<uint8_t>(length & 0xFF);
}

std::vector<uint8_t> MessageBuilder::finish() {
    set_length(checked_u16(buffer_.size() - STUN_HEADER_LENGTH));
    finished_ = true;

    std::vector<uint8_t> bytes;
    bytes.swap(buffer_);
    return bytes;
}

void MessageBuilder::check_order(uint16_t type) const {
    const auto attr_type = static_cast<StunAttributeType>(type);

    if (finished_) {
        throw invalid_data("message already finished");
    }

    if (has_fingerprint_) {
        throw invalid_data("no attribute may follow FINGERPRINT");
    }
    if (has_integrity_sha256_ && attr_type != StunAttributeType::FINGERPRINT) {
        throw invalid_data("only FINGERPRINT may follow MESSAGE-INTEGRITY-SHA256");
    }
    if (has_integrity_ && attr_type != StunAttributeType::MESSAGE_INTEGRITY_SHA256 &&
        attr_type != StunAttributeType::FINGERPRINT) {
        throw invalid_data("only MESSAGE-INTEGRITY-SHA256 or FINGERPRINT may follow MESSAGE-INTEGRITY");
    }
}

std::size_t MessageBuilder::begin_attribute(uint16_t type, uint16_t value_length) {
    check_order(type);

    // 이 속성(패딩 포함)까지를 메시지 길이로 기록한다
    const std::size_t attribute_end = buffer_.size() + ATTRIBUTE_HEADER_LENGTH + padded_length(value_length);
    const uint16_t message_length = checked_u16(attribute_end - STUN_HEADER_LENGTH);

    append_u16(buffer_, type);
    append_u16(buffer_, value_length);
    set_length(message_length);

    return buffer_.size();
}

void MessageBuilder::end_attribute(uint16_t type, std::size_t value_begin, uint16_t value_length) {
    const std::size_t written = buffer_.size() - value_begin;
    if (written != value_length) {
        log(LogLevel::Error, "Attribute {} wrote {} bytes, announced {}", attribute_type_name(type), written,
            value_length);
        throw invalid_data("attribute " + attribute_type_name(type) + " encoded an unexpected number of bytes");
    }

    buffer_.insert(buffer_.end(), padded_length(value_length) - value_length, 0);

    switch (static_cast<StunAttributeType>(type)) {
        case StunAttributeType::MESSAGE_INTEGRITY:
            has_integrity_ = true;
            break;
        case StunAttributeType::MESSAGE_INTEGRITY_SHA256:
            has_integrity_sha256_ = true;
            break;
        case StunAttributeType::FINGERPRINT:
            has_fingerprint_ = true;
            break;
        default:
            break;
    }
}

void MessageBuilder::rollback(std::size_t value_begin) {
    // 실패한 속성을 통째로 제거하고 길이 필드를 복구
    buffer_.resize(value_begin - ATTRIBUTE_HEADER_LENGTH);
    set_length(static_cast<uint16_t>(buffer_.size() - STUN_HEADER_LENGTH));
}

}  // namespace stun
