// src/stun_header.cpp

#include "stun_header.hpp"

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

#include "stun_error.hpp"

namespace stun {

std::string stun_class_to_string(StunClass cls) {
    switch (cls) {
        case StunClass::REQUEST:
            return "Request";
        case StunClass::INDICATION:
            return "Indication";
        case StunClass::SUCCESS_RESPONSE:
            return "SuccessResponse";
        case StunClass::ERROR_RESPONSE:
            return "ErrorResponse";
        default:
            return "Unknown";
    }
}

std::string stun_method_to_string(StunMethod method) {
    switch (method) {
        case StunMethod::BINDING:
            return "Binding";
        case StunMethod::ALLOCATE:
            return "Allocate";
        case StunMethod::REFRESH:
            return "Refresh";
        case StunMethod::SEND:
            return "Send";
        case StunMethod::DATA:
            return "Data";
        case StunMethod::CREATE_PERMISSION:
            return "CreatePermission";
        case StunMethod::CHANNEL_BIND:
            return "ChannelBind";
        default:
            return "Unknown";
    }
}

TransactionId TransactionId::generate() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int> dis(0, 255);

    TransactionId id;
    for (auto &byte : id.data_) {
        byte = static_cast<uint8_t>(dis(gen));
    }
    return id;
}

TransactionId TransactionId::from_bytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != TRANSACTION_ID_LENGTH) {
        throw invalid_data("Transaction ID must be 12 bytes");
    }
    TransactionId id;
    std::copy(bytes.begin(), bytes.end(), id.data_.begin());
    return id;
}

std::string TransactionId::to_hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : data_) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

/*
                 0                 1
                 2  3  4 5 6 7 8 9 0 1 2 3 4 5
                +--+--+-+-+-+-+-+-+-+-+-+-+-+-+
                |M |M |M|M|M|C|M|M|M|C|M|M|M|M|
                |11|10|9|8|7|1|6|5|4|0|3|2|1|0|
                +--+--+-+-+-+-+-+-+-+-+-+-+-+-+
*/
uint16_t MessageHeader::encode_type(StunClass cls, StunMethod method) {
    uint16_t m = static_cast<uint16_t>(method) & 0x0FFF;
    uint16_t c = static_cast<uint16_t>(cls) & 0x03;

    return static_cast<uint16_t>((m & 0x000F) | ((m & 0x0070) << 1) | ((m & 0x0F80) << 2) | ((c & 0x01) << 4) |
                                 ((c & 0x02) << 7));
}

StunClass MessageHeader::decode_class(uint16_t type) {
    return static_cast<StunClass>(((type >> 4) & 0x01) | ((type >> 7) & 0x02));
}

StunMethod MessageHeader::decode_method(uint16_t type) {
    return static_cast<StunMethod>((type & 0x000F) | ((type & 0x00E0) >> 1) | ((type & 0x3E00) >> 2));
}

MessageHeader MessageHeader::decode(std::span<const uint8_t> data) {
    if (data.size() < STUN_HEADER_LENGTH) {
        throw invalid_data("STUN message too short");
    }

    uint16_t type = read_u16(data, 0);
    if ((type & 0xC000) != 0) {
        throw invalid_data("STUN message type must start with two zero bits");
    }
    if (read_u32(data, 4) != STUN_MAGIC_COOKIE) {
        throw invalid_data("Invalid STUN magic cookie");
    }

    MessageHeader header;
    header.cls = decode_class(type);
    header.method = decode_method(type);
    header.length = read_u16(data, 2);
    header.transaction_id = TransactionId::from_bytes(data.subspan(8, TRANSACTION_ID_LENGTH));
    return header;
}

void MessageHeader::encode(std::vector<uint8_t> &buffer) const {
    append_u16(buffer, encode_type(cls, method));
    append_u16(buffer, length);
    append_u32(buffer, STUN_MAGIC_COOKIE);
    buffer.insert(buffer.end(), transaction_id.bytes().begin(), transaction_id.bytes().end());
}

bool is_stun_message(std::span<const uint8_t> data) {
    if (data.size() < STUN_HEADER_LENGTH) {
        return false;
    }
    return (data[0] & 0xC0) == 0 && read_u32(data, 4) == STUN_MAGIC_COOKIE;
}

}  // namespace stun
