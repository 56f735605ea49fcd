// src/message_integrity_key.cpp

#include "message_integrity_key.hpp"

#include <string>

#include "hmac.hpp"

namespace stun {

namespace {

std::vector<uint8_t> long_term_input(std::string_view username, std::string_view realm, std::string_view password) {
    std::string joined;
    joined.reserve(username.size() + realm.size() + password.size() + 2);
    joined.append(username).append(":").append(realm).append(":").append(password);
    return std::vector<uint8_t>(joined.begin(), joined.end());
}

}  // namespace

MessageIntegrityKey MessageIntegrityKey::new_short_term(std::string_view password) {
    return MessageIntegrityKey(std::vector<uint8_t>(password.begin(), password.end()));
}

MessageIntegrityKey MessageIntegrityKey::new_long_term_md5(std::string_view username, std::string_view realm,
                                                           std::string_view password) {
    return MessageIntegrityKey(Digest::calculate(DigestAlgorithm::MD5, long_term_input(username, realm, password)));
}

MessageIntegrityKey MessageIntegrityKey::new_long_term_sha256(std::string_view username, std::string_view realm,
                                                              std::string_view password) {
    return MessageIntegrityKey(Digest::calculate(DigestAlgorithm::SHA256, long_term_input(username, realm, password)));
}

MessageIntegrityKey MessageIntegrityKey::new_raw(std::vector<uint8_t> raw) { return MessageIntegrityKey(std::move(raw)); }

}  // namespace stun
