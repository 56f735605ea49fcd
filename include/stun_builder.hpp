// include/stun_builder.hpp

#ifndef STUN_BUILDER_HPP
#define STUN_BUILDER_HPP

#include <cstdint>
#include <type_traits>
#include <vector>

#include "stun_attribute.hpp"
#include "stun_header.hpp"

namespace stun {

// -------------------- MESSAGE BUILDER --------------------
//
// Appends attributes one by one into a buffer that starts with the 20-byte header.
// The header length field always covers the attribute currently being encoded, so
// MESSAGE-INTEGRITY and FINGERPRINT see the length a receiver will see at that point.
class MessageBuilder {
   public:
    MessageBuilder(StunClass cls, StunMethod method, const TransactionId &transaction_id);

    template <typename A>
    void add_attribute(const A &attr) {
        static_assert(std::is_same_v<typename A::Context, NoContext>,
                      "attribute requires a context, use add_attribute_with()");
        add_attribute_with(attr, NoContext{});
    }

    template <typename A>
    void add_attribute_with(const A &attr, typename A::Context ctx) {
        const uint16_t value_length = attr.encode_len();
        const std::size_t value_begin = begin_attribute(A::TYPE, value_length);
        try {
            attr.encode(ctx, *this);
            end_attribute(A::TYPE, value_begin, value_length);
        } catch (...) {
            rollback(value_begin);
            throw;
        }
    }

    // Growable output; attributes append their value here.
    std::vector<uint8_t> &buffer() { return buffer_; }
    const std::vector<uint8_t> &buffer() const { return buffer_; }

    const TransactionId &transaction_id() const { return transaction_id_; }

    // Overwrites the header length field. Throws once the builder is finished.
    void set_length(uint16_t length);

    // Writes the final length and hands over the bytes. Any further use of the builder throws.
    std::vector<uint8_t> finish();

   private:
    std::size_t begin_attribute(uint16_t type, uint16_t value_length);
    void end_attribute(uint16_t type, std::size_t value_begin, uint16_t value_length);
    void rollback(std::size_t value_begin);

    // RFC 8489 14.5 - 14.7 ordering of the security attributes
    void check_order(uint16_t type) const;

    TransactionId transaction_id_;
    std::vector<uint8_t> buffer_;
    bool has_integrity_ = false;
    bool has_integrity_sha256_ = false;
    bool has_fingerprint_ = false;
    bool finished_ = false;
};

}  // namespace stun

#endif  // STUN_BUILDER_HPP
