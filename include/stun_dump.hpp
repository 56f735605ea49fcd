// include/stun_dump.hpp

#ifndef STUN_DUMP_HPP
#define STUN_DUMP_HPP

#include <cstdint>
#include <span>
#include <string>

#include <nlohmann/json.hpp>

#include "stun_message.hpp"

namespace stun {

std::string to_hex(std::span<const uint8_t> data);

// Debug view of a parsed message. Nothing is verified.
//
// {
//   "class": "Request", "method": "Binding", "transaction_id": "b7e7a701...",
//   "length": 88,
//   "attributes": [ { "type": 32802, "name": "SOFTWARE", "offset": 20, "length": 16, "value": "5354..." }, ... ]
// }
nlohmann::json to_json(const StunMessage &msg);

}  // namespace stun

#endif  // STUN_DUMP_HPP
