// include/fingerprint.hpp

#ifndef FINGERPRINT_HPP
#define FINGERPRINT_HPP

#include <cstdint>
#include <span>

#include "stun_attribute.hpp"

namespace stun {

class StunMessage;
class MessageBuilder;

/*
   rfc: https://datatracker.ietf.org/doc/html/rfc8489#section-14.7

   CRC-32 of the message up to (but excluding) the FINGERPRINT attribute itself,
   XOR'ed with 0x5354554e. Always the last attribute of a message.
*/
class Fingerprint {
   public:
    static constexpr uint16_t TYPE = static_cast<uint16_t>(StunAttributeType::FINGERPRINT);
    static constexpr uint32_t XOR_VALUE = 0x5354554E;  // "STUN"

    using Context = NoContext;

    static Fingerprint decode(Context, const StunMessage &msg, const AttrSpan &span);
    void encode(Context, MessageBuilder &builder) const;
    uint16_t encode_len() const { return 4; }

    static uint32_t compute(std::span<const uint8_t> data);
};

}  // namespace stun

#endif  // FINGERPRINT_HPP
