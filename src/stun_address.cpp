// src/stun_address.cpp

#include "stun_address.hpp"

#include <algorithm>
#include <array>

#include "stun_error.hpp"

namespace stun {

namespace detail {

namespace {

// magic cookie || transaction id, XOR mask for the address bytes
std::array<uint8_t, 16> xor_mask(const TransactionId &transaction_id) {
    std::array<uint8_t, 16> mask{};
    mask[0] = static_cast<uint8_t>((STUN_MAGIC_COOKIE >> 24) & 0xFF);
    mask[1] = static_cast<uint8_t>((STUN_MAGIC_COOKIE >> 16) & 0xFF);
    mask[2] = static_cast<uint8_t>((STUN_MAGIC_COOKIE >> 8) & 0xFF);
    mask[3] = static_cast<uint8_t>(STUN_MAGIC_COOKIE & 0xFF);
    std::copy(transaction_id.bytes().begin(), transaction_id.bytes().end(), mask.begin() + 4);
    return mask;
}

}  // namespace

asio::ip::udp::endpoint decode_address(std::span<const uint8_t> value, bool xored,
                                       const TransactionId &transaction_id) {
    if (value.size() < 4) {
        throw invalid_data("address attribute too short");
    }

    const auto mask = xor_mask(transaction_id);
    const uint8_t family = value[1];

    uint16_t port = read_u16(value, 2);
    if (xored) {
        port ^= static_cast<uint16_t>(STUN_MAGIC_COOKIE >> 16);
    }

    if (family == static_cast<uint8_t>(AddressFamily::IPV4)) {
        if (value.size() != 8) {
            throw invalid_data("IPv4 address attribute must be 8 bytes");
        }
        asio::ip::address_v4::bytes_type bytes;
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = xored ? (value[4 + i] ^ mask[i]) : value[4 + i];
        }
        return asio::ip::udp::endpoint(asio::ip::address_v4(bytes), port);
    } else if (family == static_cast<uint8_t>(AddressFamily::IPV6)) {
        if (value.size() != 20) {
            throw invalid_data("IPv6 address attribute must be 20 bytes");
        }
        asio::ip::address_v6::bytes_type bytes;
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = xored ? (value[4 + i] ^ mask[i]) : value[4 + i];
        }
        return asio::ip::udp::endpoint(asio::ip::address_v6(bytes), port);
    }

    throw invalid_data("Unsupported address family " + std::to_string(family));
}

void encode_address(std::vector<uint8_t> &buffer, const asio::ip::udp::endpoint &endpoint, bool xored,
                    const TransactionId &transaction_id) {
    const auto mask = xor_mask(transaction_id);
    const auto address = endpoint.address();

    uint16_t port = endpoint.port();
    if (xored) {
        port ^= static_cast<uint16_t>(STUN_MAGIC_COOKIE >> 16);
    }

    buffer.push_back(0);  // Reserved
    if (address.is_v4()) {
        buffer.push_back(static_cast<uint8_t>(AddressFamily::IPV4));
        append_u16(buffer, port);
        auto bytes = address.to_v4().to_bytes();
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            buffer.push_back(xored ? (bytes[i] ^ mask[i]) : bytes[i]);
        }
    } else {
        buffer.push_back(static_cast<uint8_t>(AddressFamily::IPV6));
        append_u16(buffer, port);
        auto bytes = address.to_v6().to_bytes();
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            buffer.push_back(xored ? (bytes[i] ^ mask[i]) : bytes[i]);
        }
    }
}

uint16_t address_value_length(const asio::ip::udp::endpoint &endpoint) {
    return endpoint.address().is_v4() ? 8 : 20;
}

}  // namespace detail

}  // namespace stun
