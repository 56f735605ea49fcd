// src/stun_dump.cpp

#include "stun_dump.hpp"

namespace stun {

std::string to_hex(std::span<const uint8_t> data) {
    static const char *digits = "0123456789abcdef";

    std::string hex;
    hex.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        hex.push_back(digits[byte >> 4]);
        hex.push_back(digits[byte & 0x0F]);
    }
    return hex;
}

nlohmann::json to_json(const StunMessage &msg) {
    nlohmann::json attributes = nlohmann::json::array();
    for (const auto &span : msg.attributes()) {
        nlohmann::json entry = {
            {"type", span.type_code},
            {"name", attribute_type_name(span.type_code)},
            {"offset", span.begin},
            {"length", span.value_length()},
            {"value", to_hex(span.get_value(msg.buffer()))},
        };
        attributes.push_back(std::move(entry));
    }

    nlohmann::json dump = {
        {"class", stun_class_to_string(msg.get_class())},
        {"method", stun_method_to_string(msg.get_method())},
        {"transaction_id", msg.get_transaction_id().to_hex()},
        {"length", msg.declared_length()},
        {"attributes", attributes},
    };
    return dump;
}

}  // namespace stun
