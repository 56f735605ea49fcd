// include/stun_header.hpp

#ifndef STUN_HEADER_HPP
#define STUN_HEADER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace stun {

/*
   rfc: https://datatracker.ietf.org/doc/html/rfc8489#section-5

       0                   1                   2                   3
       0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
      +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
      |0 0|     STUN Message Type     |         Message Length        |
      +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
      |                         Magic Cookie                          |
      +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
      |                                                               |
      |                     Transaction ID (96 bits)                  |
      |                                                               |
      +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
*/
constexpr std::size_t STUN_HEADER_LENGTH = 20;
constexpr std::size_t ATTRIBUTE_HEADER_LENGTH = 4;
constexpr std::size_t TRANSACTION_ID_LENGTH = 12;
constexpr uint32_t STUN_MAGIC_COOKIE = 0x2112A442;

enum class StunClass : uint8_t {
    REQUEST = 0b00,
    INDICATION = 0b01,
    SUCCESS_RESPONSE = 0b10,
    ERROR_RESPONSE = 0b11
};

// 12-bit method. Values not listed here are carried through unchanged.
enum class StunMethod : uint16_t {
    BINDING = 0x001,
    ALLOCATE = 0x003,   // RFC 8656
    REFRESH = 0x004,
    SEND = 0x006,
    DATA = 0x007,
    CREATE_PERMISSION = 0x008,
    CHANNEL_BIND = 0x009
};

std::string stun_class_to_string(StunClass cls);
std::string stun_method_to_string(StunMethod method);

// -------------------- BYTE ORDER --------------------
inline uint16_t read_u16(std::span<const uint8_t> data, std::size_t offset) {
    return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

inline uint32_t read_u32(std::span<const uint8_t> data, std::size_t offset) {
    return (static_cast<uint32_t>(data[offset]) << 24) | (static_cast<uint32_t>(data[offset + 1]) << 16) |
           (static_cast<uint32_t>(data[offset + 2]) << 8) | static_cast<uint32_t>(data[offset + 3]);
}

inline uint64_t read_u64(std::span<const uint8_t> data, std::size_t offset) {
    return (static_cast<uint64_t>(read_u32(data, offset)) << 32) | read_u32(data, offset + 4);
}

inline void append_u16(std::vector<uint8_t> &buffer, uint16_t value) {
    buffer.push_back(static_cast<uint8_t>(value >> 8));
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
}

inline void append_u32(std::vector<uint8_t> &buffer, uint32_t value) {
    buffer.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
}

inline void append_u64(std::vector<uint8_t> &buffer, uint64_t value) {
    append_u32(buffer, static_cast<uint32_t>(value >> 32));
    append_u32(buffer, static_cast<uint32_t>(value & 0xFFFFFFFF));
}

// Value length rounded up to the 4-byte attribute boundary.
constexpr std::size_t padded_length(std::size_t length) { return (length + 3) & ~static_cast<std::size_t>(3); }

// -------------------- TRANSACTION ID --------------------
class TransactionId {
   public:
    struct Hasher {
        std::size_t operator()(const TransactionId &id) const {
            std::size_t hash = 0;
            for (auto byte : id.data_) {
                hash ^= std::hash<uint8_t>{}(byte) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
            }
            return hash;
        }
    };

    TransactionId() = default;
    explicit TransactionId(const std::array<uint8_t, TRANSACTION_ID_LENGTH> &data) : data_(data) {}

    // Random transaction id
    static TransactionId generate();

    static TransactionId from_bytes(std::span<const uint8_t> bytes);

    const std::array<uint8_t, TRANSACTION_ID_LENGTH> &bytes() const { return data_; }
    std::string to_hex() const;

    bool operator==(const TransactionId &other) const { return data_ == other.data_; }
    bool operator!=(const TransactionId &other) const { return !(*this == other); }

   private:
    std::array<uint8_t, TRANSACTION_ID_LENGTH> data_{};
};

// -------------------- MESSAGE HEADER --------------------
struct MessageHeader {
    StunClass cls = StunClass::REQUEST;
    StunMethod method = StunMethod::BINDING;
    uint16_t length = 0;  // attribute bytes following the header, padding included
    TransactionId transaction_id;

    // Interleave class bits C1/C0 into the 14-bit type field.
    static uint16_t encode_type(StunClass cls, StunMethod method);
    static StunClass decode_class(uint16_t type);
    static StunMethod decode_method(uint16_t type);

    // Throws StunError(INVALID_DATA) on a short buffer, non-zero leading bits or wrong magic cookie.
    static MessageHeader decode(std::span<const uint8_t> data);
    void encode(std::vector<uint8_t> &buffer) const;
};

// Cheap check for demultiplexing STUN from other traffic on the same port.
bool is_stun_message(std::span<const uint8_t> data);

}  // namespace stun

#endif  // STUN_HEADER_HPP
