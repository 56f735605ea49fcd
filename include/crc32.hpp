// include/crc32.hpp

#ifndef CRC32_HPP
#define CRC32_HPP

#include <array>
#include <cstdint>
#include <span>

namespace stun {

// Standard reflected CRC-32 (polynomial 0xEDB88320), identical to zlib/Ethernet.
class CRC32 {
   public:
    static uint32_t calculate(std::span<const uint8_t> data) { return update(0, data); }

    // 이어서 계산할 때 이전 결과를 crc 로 넘긴다.
    static uint32_t update(uint32_t crc, std::span<const uint8_t> data);

   private:
    static const std::array<uint32_t, 256> &table();
};

}  // namespace stun

#endif  // CRC32_HPP
