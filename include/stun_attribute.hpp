// include/stun_attribute.hpp

#ifndef STUN_ATTRIBUTE_HPP
#define STUN_ATTRIBUTE_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace stun {

/*
   Every attribute type provides:

     static constexpr uint16_t TYPE;
     using Context = ...;   // NoContext, or whatever the codec needs besides the message bytes
     static A decode(Context ctx, const StunMessage &msg, const AttrSpan &span);
     void encode(Context ctx, MessageBuilder &builder) const;
     uint16_t encode_len() const;   // value length before padding

   encode() is called with the builder's buffer ending right after the attribute
   header and must append exactly encode_len() bytes. Padding is written by the builder.
*/

// Context of attributes whose codec only needs the message bytes.
struct NoContext {};

// STUN Attribute Types (RFC 8489, RFC 8445)
enum class StunAttributeType : uint16_t {
    MAPPED_ADDRESS = 0x0001,
    USERNAME = 0x0006,
    MESSAGE_INTEGRITY = 0x0008,
    ERROR_CODE = 0x0009,
    UNKNOWN_ATTRIBUTES = 0x000A,
    REALM = 0x0014,
    NONCE = 0x0015,
    MESSAGE_INTEGRITY_SHA256 = 0x001C,
    PASSWORD_ALGORITHM = 0x001D,
    USERHASH = 0x001E,
    XOR_MAPPED_ADDRESS = 0x0020,
    PRIORITY = 0x0024,
    USE_CANDIDATE = 0x0025,
    PASSWORD_ALGORITHMS = 0x8002,
    ALTERNATE_DOMAIN = 0x8003,
    SOFTWARE = 0x8022,
    ALTERNATE_SERVER = 0x8023,
    FINGERPRINT = 0x8028,
    ICE_CONTROLLED = 0x8029,
    ICE_CONTROLLING = 0x802A
};

std::string attribute_type_name(uint16_t type);

// Location of one attribute inside a parsed message buffer.
// begin <= value_begin <= value_end <= padding_end
struct AttrSpan {
    uint16_t type_code = 0;
    std::size_t begin = 0;        // 4-byte type+length header
    std::size_t value_begin = 0;
    std::size_t value_end = 0;    // exclusive, unpadded
    std::size_t padding_end = 0;  // value_end rounded up to 4 bytes

    std::size_t value_length() const { return value_end - value_begin; }

    std::span<const uint8_t> get_value(std::span<const uint8_t> buffer) const {
        return buffer.subspan(value_begin, value_end - value_begin);
    }
};

}  // namespace stun

#endif  // STUN_ATTRIBUTE_HPP
