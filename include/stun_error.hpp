// include/stun_error.hpp

#ifndef STUN_ERROR_HPP
#define STUN_ERROR_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace stun {

enum class StunErrorKind {
    INVALID_DATA,  // 잘못된 메시지/속성, fingerprint 또는 integrity 검증 실패
    CONVERSION,    // 16비트 길이 필드에 들어가지 않는 값
    CRYPTO         // OpenSSL 내부 실패
};

class StunError : public std::runtime_error {
   public:
    StunError(StunErrorKind kind, const std::string &what) : std::runtime_error(what), kind_(kind) {}

    StunErrorKind kind() const noexcept { return kind_; }

   private:
    StunErrorKind kind_;
};

inline StunError invalid_data(const std::string &reason) { return StunError(StunErrorKind::INVALID_DATA, reason); }

// Wire lengths are 16 bits; never truncate silently.
inline uint16_t checked_u16(std::size_t value) {
    if (value > std::numeric_limits<uint16_t>::max()) {
        throw StunError(StunErrorKind::CONVERSION,
                        "value " + std::to_string(value) + " does not fit into a 16-bit length field");
    }
    return static_cast<uint16_t>(value);
}

}  // namespace stun

#endif  // STUN_ERROR_HPP
