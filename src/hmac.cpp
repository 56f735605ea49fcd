// src/hmac.cpp

#include "hmac.hpp"

#include <climits>

#include <openssl/crypto.h>

#include "stun_error.hpp"

namespace stun {

namespace {

const EVP_MD *to_evp_md(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::MD5:
            return EVP_md5();
        case DigestAlgorithm::SHA1:
            return EVP_sha1();
        case DigestAlgorithm::SHA256:
            return EVP_sha256();
    }
    throw StunError(StunErrorKind::CRYPTO, "Unsupported digest algorithm");
}

}  // namespace

std::vector<uint8_t> Digest::calculate(DigestAlgorithm algorithm, std::span<const uint8_t> data) {
    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int result_len = 0;

    if (!EVP_Digest(data.data(), data.size(), result, &result_len, to_evp_md(algorithm), nullptr)) {
        throw StunError(StunErrorKind::CRYPTO, "Digest calculation failed");
    }

    return std::vector<uint8_t>(result, result + result_len);
}

std::size_t Digest::output_size(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::MD5:
            return 16;
        case DigestAlgorithm::SHA1:
            return 20;
        case DigestAlgorithm::SHA256:
            return 32;
    }
    return 0;
}

Hmac::Hmac(DigestAlgorithm algorithm, std::span<const uint8_t> key) : algorithm_(algorithm), ctx_(HMAC_CTX_new()) {
    if (!ctx_) {
        throw StunError(StunErrorKind::CRYPTO, "Failed to create HMAC context");
    }
    if (key.size() > static_cast<std::size_t>(INT_MAX)) {
        throw invalid_data("invalid key length");
    }

    // A null key pointer means "reuse the previous key" to OpenSSL, so an empty key needs a real address.
    static const unsigned char empty_key = 0;
    const unsigned char *key_ptr = key.empty() ? &empty_key : key.data();

    if (!HMAC_Init_ex(ctx_.get(), key_ptr, static_cast<int>(key.size()), to_evp_md(algorithm_), nullptr)) {
        throw invalid_data("invalid key length");
    }
}

void Hmac::update(std::span<const uint8_t> data) {
    if (finalized_) {
        throw StunError(StunErrorKind::CRYPTO, "HMAC already finalized");
    }
    if (data.empty()) {
        return;
    }
    if (!HMAC_Update(ctx_.get(), data.data(), data.size())) {
        throw StunError(StunErrorKind::CRYPTO, "Failed to update HMAC");
    }
}

std::vector<uint8_t> Hmac::finalize() {
    if (finalized_) {
        throw StunError(StunErrorKind::CRYPTO, "HMAC already finalized");
    }

    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int result_len = 0;

    if (!HMAC_Final(ctx_.get(), result, &result_len)) {
        throw StunError(StunErrorKind::CRYPTO, "Failed to finalize HMAC");
    }
    finalized_ = true;

    return std::vector<uint8_t>(result, result + result_len);
}

std::vector<uint8_t> Hmac::calculate(DigestAlgorithm algorithm, std::span<const uint8_t> key,
                                     std::span<const uint8_t> data) {
    Hmac hmac(algorithm, key);
    hmac.update(data);
    return hmac.finalize();
}

bool digest_equals(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    return lhs.empty() || CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}  // namespace stun
