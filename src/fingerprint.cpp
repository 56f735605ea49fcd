// src/fingerprint.cpp

#include "fingerprint.hpp"

#include "crc32.hpp"
#include "logger.hpp"
#include "stun_builder.hpp"
#include "stun_error.hpp"
#include "stun_message.hpp"

namespace stun {

uint32_t Fingerprint::compute(std::span<const uint8_t> data) { return CRC32::calculate(data) ^ XOR_VALUE; }

Fingerprint Fingerprint::decode(Context, const StunMessage &msg, const AttrSpan &span) {
    auto value = span.get_value(msg.buffer());
    if (value.size() != 4) {
        log(LogLevel::Debug, "FINGERPRINT has {} bytes, expected 4", value.size());
        throw invalid_data("fingerprint value must be 4 bytes");
    }

    const uint32_t received = read_u32(value, 0);
    const uint32_t expected = compute(msg.buffer().first(span.begin));

    if (received != expected) {
        log(LogLevel::Debug, "FINGERPRINT mismatch: received {:08x}, expected {:08x}", received, expected);
        throw invalid_data("failed to verify message fingerprint");
    }

    return Fingerprint{};
}

void Fingerprint::encode(Context, MessageBuilder &builder) const {
    auto &buffer = builder.buffer();

    // 버퍼는 FINGERPRINT 속성 헤더 직후에서 끝난다; 헤더 자체는 CRC 대상이 아니다
    std::span<const uint8_t> data(buffer.data(), buffer.size() - ATTRIBUTE_HEADER_LENGTH);
    const uint32_t crc = compute(data);

    append_u32(buffer, crc);
}

}  // namespace stun
