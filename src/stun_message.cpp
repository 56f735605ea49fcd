// src/stun_message.cpp

#include "stun_message.hpp"

#include "logger.hpp"
#include "stun_error.hpp"

namespace stun {

namespace {

[[noreturn]] void reject(const std::string &reason) {
    log(LogLevel::Debug, "Rejected STUN message: {}", reason);
    throw invalid_data(reason);
}

}  // namespace

StunMessage StunMessage::parse(std::vector<uint8_t> buffer) {
    MessageHeader header;
    try {
        header = MessageHeader::decode(buffer);
    } catch (const StunError &ex) {
        reject(ex.what());
    }

    if ((header.length & 0x03) != 0) {
        reject("STUN message length " + std::to_string(header.length) + " is not a multiple of 4");
    }
    if (buffer.size() < STUN_HEADER_LENGTH + header.length) {
        reject("STUN message length " + std::to_string(header.length) + " exceeds received " +
               std::to_string(buffer.size() - STUN_HEADER_LENGTH) + " bytes");
    }

    // 헤더 길이 이후의 바이트는 버린다 (UDP datagram 뒤의 쓰레기 등)
    const std::size_t end = STUN_HEADER_LENGTH + header.length;
    buffer.resize(end);

    std::vector<AttrSpan> attributes;
    std::span<const uint8_t> data(buffer);
    std::size_t offset = STUN_HEADER_LENGTH;
    while (offset < end) {
        if (offset + ATTRIBUTE_HEADER_LENGTH > end) {
            reject("truncated STUN attribute header");
        }

        AttrSpan span;
        span.type_code = read_u16(data, offset);
        span.begin = offset;
        span.value_begin = offset + ATTRIBUTE_HEADER_LENGTH;
        span.value_end = span.value_begin + read_u16(data, offset + 2);
        span.padding_end = padded_length(span.value_end);

        if (span.value_end > end) {
            reject("STUN attribute " + attribute_type_name(span.type_code) + " length " +
                   std::to_string(span.value_length()) + " exceeds message size");
        }

        attributes.push_back(span);
        offset = span.padding_end;
    }

    log(LogLevel::Debug, "Parsed STUN {} {} with {} attributes", stun_method_to_string(header.method),
        stun_class_to_string(header.cls), attributes.size());

    return StunMessage(std::move(header), std::move(buffer), std::move(attributes));
}

const AttrSpan *StunMessage::find_span(uint16_t type) const {
    bool after_integrity = false;
    bool after_integrity_sha256 = false;

    for (const auto &span : attributes_) {
        const auto attr_type = static_cast<StunAttributeType>(span.type_code);

        if (span.type_code == type) {
            bool visible = true;
            if (after_integrity_sha256) {
                visible = attr_type == StunAttributeType::FINGERPRINT;
            } else if (after_integrity) {
                visible = attr_type == StunAttributeType::MESSAGE_INTEGRITY_SHA256 ||
                          attr_type == StunAttributeType::FINGERPRINT;
            }
            if (visible) {
                return &span;
            }
        }

        switch (attr_type) {
            case StunAttributeType::FINGERPRINT:
                return nullptr;
            case StunAttributeType::MESSAGE_INTEGRITY:
                after_integrity = true;
                break;
            case StunAttributeType::MESSAGE_INTEGRITY_SHA256:
                after_integrity_sha256 = true;
                break;
            default:
                break;
        }
    }

    return nullptr;
}

}  // namespace stun
