// include/hmac.hpp

#ifndef HMAC_HPP
#define HMAC_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace stun {

enum class DigestAlgorithm { MD5, SHA1, SHA256 };

// One-shot message digests (key derivation for long-term credentials).
class Digest {
   public:
    static std::vector<uint8_t> calculate(DigestAlgorithm algorithm, std::span<const uint8_t> data);
    static std::size_t output_size(DigestAlgorithm algorithm);
};

// Incremental HMAC over several non-contiguous byte ranges.
//
// The constructor reports a key the primitive refuses as INVALID_DATA
// ("invalid key length") before anything is hashed.
class Hmac {
   public:
    Hmac(DigestAlgorithm algorithm, std::span<const uint8_t> key);

    Hmac(const Hmac &) = delete;
    Hmac &operator=(const Hmac &) = delete;

    void update(std::span<const uint8_t> data);
    std::vector<uint8_t> finalize();

    std::size_t output_size() const { return Digest::output_size(algorithm_); }

    static std::vector<uint8_t> calculate(DigestAlgorithm algorithm, std::span<const uint8_t> key,
                                          std::span<const uint8_t> data);

   private:
    struct CtxDeleter {
        void operator()(HMAC_CTX *ctx) const { HMAC_CTX_free(ctx); }
    };

    DigestAlgorithm algorithm_;
    std::unique_ptr<HMAC_CTX, CtxDeleter> ctx_;
    bool finalized_ = false;
};

// Constant time comparison (CRYPTO_memcmp).
bool digest_equals(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs);

}  // namespace stun

#endif  // HMAC_HPP
