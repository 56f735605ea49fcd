// include/stun_attributes.hpp

#ifndef STUN_ATTRIBUTES_HPP
#define STUN_ATTRIBUTES_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "stun_attribute.hpp"
#include "stun_builder.hpp"
#include "stun_error.hpp"
#include "stun_message.hpp"

namespace stun {

// -------------------- TEXT --------------------
// USERNAME, REALM, NONCE, SOFTWARE: opaque UTF-8 bytes with an upper size bound.
template <uint16_t AttrType, std::size_t MaxLength>
class StringAttribute {
   public:
    static constexpr uint16_t TYPE = AttrType;
    static constexpr std::size_t MAX_LENGTH = MaxLength;

    using Context = NoContext;

    StringAttribute() = default;
    explicit StringAttribute(std::string value) : value_(std::move(value)) {}

    const std::string &value() const { return value_; }

    static StringAttribute decode(Context, const StunMessage &msg, const AttrSpan &span) {
        auto value = span.get_value(msg.buffer());
        if (value.size() > MaxLength) {
            throw invalid_data(attribute_type_name(AttrType) + " value is longer than " + std::to_string(MaxLength) +
                               " bytes");
        }
        return StringAttribute(std::string(value.begin(), value.end()));
    }

    void encode(Context, MessageBuilder &builder) const {
        builder.buffer().insert(builder.buffer().end(), value_.begin(), value_.end());
    }

    uint16_t encode_len() const {
        if (value_.size() > MaxLength) {
            throw invalid_data(attribute_type_name(AttrType) + " value is longer than " + std::to_string(MaxLength) +
                               " bytes");
        }
        return checked_u16(value_.size());
    }

    bool operator==(const StringAttribute &other) const { return value_ == other.value_; }

   private:
    std::string value_;
};

using Username = StringAttribute<static_cast<uint16_t>(StunAttributeType::USERNAME), 513>;
using Realm = StringAttribute<static_cast<uint16_t>(StunAttributeType::REALM), 763>;
using Nonce = StringAttribute<static_cast<uint16_t>(StunAttributeType::NONCE), 763>;
using Software = StringAttribute<static_cast<uint16_t>(StunAttributeType::SOFTWARE), 763>;

// -------------------- INTEGERS --------------------
// PRIORITY (u32), ICE-CONTROLLED / ICE-CONTROLLING (u64 tie breaker), RFC 8445 16.1
template <uint16_t AttrType, typename T>
class IntegerAttribute {
    static_assert(sizeof(T) == 4 || sizeof(T) == 8, "only 32 and 64 bit values");

   public:
    static constexpr uint16_t TYPE = AttrType;

    using Context = NoContext;

    IntegerAttribute() = default;
    explicit IntegerAttribute(T value) : value_(value) {}

    T value() const { return value_; }

    static IntegerAttribute decode(Context, const StunMessage &msg, const AttrSpan &span) {
        auto value = span.get_value(msg.buffer());
        if (value.size() != sizeof(T)) {
            throw invalid_data(attribute_type_name(AttrType) + " value must be " + std::to_string(sizeof(T)) +
                               " bytes");
        }
        if constexpr (sizeof(T) == 4) {
            return IntegerAttribute(static_cast<T>(read_u32(value, 0)));
        } else {
            return IntegerAttribute(static_cast<T>(read_u64(value, 0)));
        }
    }

    void encode(Context, MessageBuilder &builder) const {
        if constexpr (sizeof(T) == 4) {
            append_u32(builder.buffer(), static_cast<uint32_t>(value_));
        } else {
            append_u64(builder.buffer(), static_cast<uint64_t>(value_));
        }
    }

    uint16_t encode_len() const { return sizeof(T); }

    bool operator==(const IntegerAttribute &other) const { return value_ == other.value_; }

   private:
    T value_ = 0;
};

using Priority = IntegerAttribute<static_cast<uint16_t>(StunAttributeType::PRIORITY), uint32_t>;
using IceControlled = IntegerAttribute<static_cast<uint16_t>(StunAttributeType::ICE_CONTROLLED), uint64_t>;
using IceControlling = IntegerAttribute<static_cast<uint16_t>(StunAttributeType::ICE_CONTROLLING), uint64_t>;

// -------------------- USE-CANDIDATE --------------------
class UseCandidate {
   public:
    static constexpr uint16_t TYPE = static_cast<uint16_t>(StunAttributeType::USE_CANDIDATE);

    using Context = NoContext;

    static UseCandidate decode(Context, const StunMessage &msg, const AttrSpan &span);
    void encode(Context, MessageBuilder &) const {}
    uint16_t encode_len() const { return 0; }
};

// -------------------- ERROR-CODE --------------------
/*
    0                   1                   2                   3
    0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
   +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
   |           Reserved, should be 0         |Class|     Number    |
   +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
   |      Reason Phrase (variable)                                ..
   +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
*/
enum class StunErrorCode : uint16_t {
    TRY_ALTERNATE = 300,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    FORBIDDEN = 403,
    UNKNOWN_ATTRIBUTE = 420,
    ALLOCATION_MISMATCH = 437,
    STALE_NONCE = 438,
    ROLE_CONFLICT = 487,  // RFC 8445
    SERVER_ERROR = 500,
    INSUFFICIENT_CAPACITY = 508
};

std::string get_error_reason(StunErrorCode code);

class ErrorCode {
   public:
    static constexpr uint16_t TYPE = static_cast<uint16_t>(StunAttributeType::ERROR_CODE);
    static constexpr std::size_t MAX_REASON_LENGTH = 763;

    using Context = NoContext;

    ErrorCode(uint16_t code, std::string reason);
    // Reason defaults to the RFC phrase of the code.
    explicit ErrorCode(StunErrorCode code);

    uint16_t code() const { return code_; }
    const std::string &reason() const { return reason_; }

    static ErrorCode decode(Context, const StunMessage &msg, const AttrSpan &span);
    void encode(Context, MessageBuilder &builder) const;
    uint16_t encode_len() const;

   private:
    uint16_t code_;
    std::string reason_;
};

// -------------------- UNKNOWN-ATTRIBUTES --------------------
class UnknownAttributes {
   public:
    static constexpr uint16_t TYPE = static_cast<uint16_t>(StunAttributeType::UNKNOWN_ATTRIBUTES);

    using Context = NoContext;

    UnknownAttributes() = default;
    explicit UnknownAttributes(std::vector<uint16_t> types) : types_(std::move(types)) {}

    const std::vector<uint16_t> &types() const { return types_; }

    static UnknownAttributes decode(Context, const StunMessage &msg, const AttrSpan &span);
    void encode(Context, MessageBuilder &builder) const;
    uint16_t encode_len() const { return checked_u16(types_.size() * 2); }

   private:
    std::vector<uint16_t> types_;
};

}  // namespace stun

#endif  // STUN_ATTRIBUTES_HPP
