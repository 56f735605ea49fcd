// src/stun_attributes.cpp

#include "stun_attributes.hpp"

namespace stun {

std::string attribute_type_name(uint16_t type) {
    switch (static_cast<StunAttributeType>(type)) {
        case StunAttributeType::MAPPED_ADDRESS:
            return "MAPPED-ADDRESS";
        case StunAttributeType::USERNAME:
            return "USERNAME";
        case StunAttributeType::MESSAGE_INTEGRITY:
            return "MESSAGE-INTEGRITY";
        case StunAttributeType::ERROR_CODE:
            return "ERROR-CODE";
        case StunAttributeType::UNKNOWN_ATTRIBUTES:
            return "UNKNOWN-ATTRIBUTES";
        case StunAttributeType::REALM:
            return "REALM";
        case StunAttributeType::NONCE:
            return "NONCE";
        case StunAttributeType::MESSAGE_INTEGRITY_SHA256:
            return "MESSAGE-INTEGRITY-SHA256";
        case StunAttributeType::PASSWORD_ALGORITHM:
            return "PASSWORD-ALGORITHM";
        case StunAttributeType::USERHASH:
            return "USERHASH";
        case StunAttributeType::XOR_MAPPED_ADDRESS:
            return "XOR-MAPPED-ADDRESS";
        case StunAttributeType::PRIORITY:
            return "PRIORITY";
        case StunAttributeType::USE_CANDIDATE:
            return "USE-CANDIDATE";
        case StunAttributeType::PASSWORD_ALGORITHMS:
            return "PASSWORD-ALGORITHMS";
        case StunAttributeType::ALTERNATE_DOMAIN:
            return "ALTERNATE-DOMAIN";
        case StunAttributeType::SOFTWARE:
            return "SOFTWARE";
        case StunAttributeType::ALTERNATE_SERVER:
            return "ALTERNATE-SERVER";
        case StunAttributeType::FINGERPRINT:
            return "FINGERPRINT";
        case StunAttributeType::ICE_CONTROLLED:
            return "ICE-CONTROLLED";
        case StunAttributeType::ICE_CONTROLLING:
            return "ICE-CONTROLLING";
        default:
            return "UNKNOWN";
    }
}

std::string get_error_reason(StunErrorCode code) {
    switch (code) {
        case StunErrorCode::TRY_ALTERNATE:
            return "Try Alternate";
        case StunErrorCode::BAD_REQUEST:
            return "Bad Request";
        case StunErrorCode::UNAUTHORIZED:
            return "Unauthorized";
        case StunErrorCode::FORBIDDEN:
            return "Forbidden";
        case StunErrorCode::UNKNOWN_ATTRIBUTE:
            return "Unknown Attribute";
        case StunErrorCode::ALLOCATION_MISMATCH:
            return "Allocation Mismatch";
        case StunErrorCode::STALE_NONCE:
            return "Stale Nonce";
        case StunErrorCode::ROLE_CONFLICT:
            return "Role Conflict";
        case StunErrorCode::SERVER_ERROR:
            return "Server Error";
        case StunErrorCode::INSUFFICIENT_CAPACITY:
            return "Insufficient Capacity";
        default:
            return "Unknown Error";
    }
}

UseCandidate UseCandidate::decode(Context, const StunMessage &, const AttrSpan &span) {
    if (span.value_length() != 0) {
        throw invalid_data("USE-CANDIDATE must not carry a value");
    }
    return UseCandidate{};
}

// -------------------- ERROR-CODE --------------------

ErrorCode::ErrorCode(uint16_t code, std::string reason) : code_(code), reason_(std::move(reason)) {
    if (code_ < 300 || code_ > 699) {
        throw invalid_data("error code " + std::to_string(code_) + " out of range 300..699");
    }
}

ErrorCode::ErrorCode(StunErrorCode code) : ErrorCode(static_cast<uint16_t>(code), get_error_reason(code)) {}

ErrorCode ErrorCode::decode(Context, const StunMessage &msg, const AttrSpan &span) {
    auto value = span.get_value(msg.buffer());
    if (value.size() < 4) {
        throw invalid_data("ERROR-CODE attribute too short");
    }
    if (value.size() - 4 > MAX_REASON_LENGTH) {
        throw invalid_data("ERROR-CODE reason phrase too long");
    }

    const uint8_t error_class = value[2] & 0x07;
    const uint8_t error_number = value[3];
    if (error_class < 3 || error_class > 6 || error_number > 99) {
        throw invalid_data("ERROR-CODE class/number out of range");
    }

    return ErrorCode(static_cast<uint16_t>(error_class * 100 + error_number),
                     std::string(value.begin() + 4, value.end()));
}

void ErrorCode::encode(Context, MessageBuilder &builder) const {
    auto &buffer = builder.buffer();
    buffer.push_back(0);
    buffer.push_back(0);
    buffer.push_back(static_cast<uint8_t>(code_ / 100));
    buffer.push_back(static_cast<uint8_t>(code_ % 100));
    buffer.insert(buffer.end(), reason_.begin(), reason_.end());
}

uint16_t ErrorCode::encode_len() const {
    if (reason_.size() > MAX_REASON_LENGTH) {
        throw invalid_data("ERROR-CODE reason phrase too long");
    }
    return checked_u16(4 + reason_.size());
}

// -------------------- UNKNOWN-ATTRIBUTES --------------------

UnknownAttributes UnknownAttributes::decode(Context, const StunMessage &msg, const AttrSpan &span) {
    auto value = span.get_value(msg.buffer());
    if (value.size() % 2 != 0) {
        throw invalid_data("UNKNOWN-ATTRIBUTES length must be even");
    }

    std::vector<uint16_t> types;
    types.reserve(value.size() / 2);
    for (std::size_t i = 0; i < value.size(); i += 2) {
        types.push_back(read_u16(value, i));
    }
    return UnknownAttributes(std::move(types));
}

void UnknownAttributes::encode(Context, MessageBuilder &builder) const {
    for (auto type : types_) {
        append_u16(builder.buffer(), type);
    }
}

}  // namespace stun
