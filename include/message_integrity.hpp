// include/message_integrity.hpp

#ifndef MESSAGE_INTEGRITY_HPP
#define MESSAGE_INTEGRITY_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "hmac.hpp"
#include "message_integrity_key.hpp"
#include "stun_attribute.hpp"
#include "stun_error.hpp"

namespace stun {

class StunMessage;
class MessageBuilder;

// HMAC over message[0 .. attribute_begin) as if the header length field were effective_length.
// The buffer is not modified; the patched length is fed to the MAC in place of bytes 2..3.
std::vector<uint8_t> message_integrity_digest(DigestAlgorithm algorithm, const MessageIntegrityKey &key,
                                              std::span<const uint8_t> buffer, std::size_t attribute_begin,
                                              uint16_t effective_length);

namespace detail {

void message_integrity_decode(DigestAlgorithm algorithm, const MessageIntegrityKey &key, const StunMessage &msg,
                              const AttrSpan &span);
void message_integrity_encode(DigestAlgorithm algorithm, const MessageIntegrityKey &key, MessageBuilder &builder);

}  // namespace detail

/*
   rfc: https://datatracker.ietf.org/doc/html/rfc8489#section-14.5
        https://datatracker.ietf.org/doc/html/rfc8489#section-14.6

   The text used as input to HMAC is the STUN message, up to and including the
   attribute preceding the MESSAGE-INTEGRITY attribute, with the Length field of
   the header adjusted to point to the end of the MESSAGE-INTEGRITY attribute.
*/
template <uint16_t AttrType, DigestAlgorithm Algorithm>
class BasicMessageIntegrity {
   public:
    static constexpr uint16_t TYPE = AttrType;

    using Context = const MessageIntegrityKey &;

    static BasicMessageIntegrity decode(Context key, const StunMessage &msg, const AttrSpan &span) {
        detail::message_integrity_decode(Algorithm, key, msg, span);
        return BasicMessageIntegrity{};
    }

    void encode(Context key, MessageBuilder &builder) const {
        detail::message_integrity_encode(Algorithm, key, builder);
    }

    uint16_t encode_len() const { return checked_u16(Digest::output_size(Algorithm)); }
};

using MessageIntegrity =
    BasicMessageIntegrity<static_cast<uint16_t>(StunAttributeType::MESSAGE_INTEGRITY), DigestAlgorithm::SHA1>;
using MessageIntegritySha256 =
    BasicMessageIntegrity<static_cast<uint16_t>(StunAttributeType::MESSAGE_INTEGRITY_SHA256),
                          DigestAlgorithm::SHA256>;

}  // namespace stun

#endif  // MESSAGE_INTEGRITY_HPP
