// include/stun_message.hpp

#ifndef STUN_MESSAGE_HPP
#define STUN_MESSAGE_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include "stun_attribute.hpp"
#include "stun_header.hpp"

namespace stun {

// -------------------- STUN MESSAGE (parse side) --------------------
//
// Owns the received bytes. Attribute spans are computed once by parse() and never change;
// attributes are decoded on demand from the raw bytes, so verification always sees the
// message exactly as it was received (including non-zero padding).
class StunMessage {
   public:
    // Throws StunError(INVALID_DATA) if the framing is malformed.
    static StunMessage parse(std::vector<uint8_t> buffer);

    const MessageHeader &header() const { return header_; }
    StunClass get_class() const { return header_.cls; }
    StunMethod get_method() const { return header_.method; }
    const TransactionId &get_transaction_id() const { return header_.transaction_id; }

    // Length field as received.
    uint16_t declared_length() const { return header_.length; }

    std::span<const uint8_t> buffer() const { return buffer_; }
    const std::vector<AttrSpan> &attributes() const { return attributes_; }

    bool has_attribute(uint16_t type) const { return find_span(type) != nullptr; }

    // First visible span of the given type. Attributes after MESSAGE-INTEGRITY other than
    // MESSAGE-INTEGRITY-SHA256 and FINGERPRINT, and anything after FINGERPRINT, are not visible.
    const AttrSpan *find_span(uint16_t type) const;

    // std::nullopt if absent; decode errors are thrown.
    template <typename A>
    std::optional<A> attribute_with(typename A::Context ctx) const {
        const AttrSpan *span = find_span(A::TYPE);
        if (span == nullptr) {
            return std::nullopt;
        }
        return A::decode(ctx, *this, *span);
    }

    template <typename A>
    std::optional<A> attribute() const {
        static_assert(std::is_same_v<typename A::Context, NoContext>,
                      "attribute requires a context, use attribute_with()");
        return attribute_with<A>(NoContext{});
    }

   private:
    StunMessage(MessageHeader header, std::vector<uint8_t> buffer, std::vector<AttrSpan> attributes)
        : header_(std::move(header)), buffer_(std::move(buffer)), attributes_(std::move(attributes)) {}

    MessageHeader header_;
    std::vector<uint8_t> buffer_;
    std::vector<AttrSpan> attributes_;
};

}  // namespace stun

#endif  // STUN_MESSAGE_HPP
