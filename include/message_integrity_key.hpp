// include/message_integrity_key.hpp

#ifndef MESSAGE_INTEGRITY_KEY_HPP
#define MESSAGE_INTEGRITY_KEY_HPP

#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace stun {

// Key material for MESSAGE-INTEGRITY / MESSAGE-INTEGRITY-SHA256 (RFC 8489 9.1, 9.2).
// The key does not remember which scheme produced it.
class MessageIntegrityKey {
   public:
    // key = password bytes, unmodified
    static MessageIntegrityKey new_short_term(std::string_view password);

    // key = MD5("username:realm:password")
    static MessageIntegrityKey new_long_term_md5(std::string_view username, std::string_view realm,
                                                 std::string_view password);

    // key = SHA-256("username:realm:password")
    static MessageIntegrityKey new_long_term_sha256(std::string_view username, std::string_view realm,
                                                    std::string_view password);

    static MessageIntegrityKey new_raw(std::vector<uint8_t> raw);

    std::span<const uint8_t> bytes() const { return key_; }
    std::size_t size() const { return key_.size(); }

   private:
    explicit MessageIntegrityKey(std::vector<uint8_t> key) : key_(std::move(key)) {}

    std::vector<uint8_t> key_;
};

}  // namespace stun

#endif  // MESSAGE_INTEGRITY_KEY_HPP
