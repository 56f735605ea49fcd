// include/stun_address.hpp

#ifndef STUN_ADDRESS_HPP
#define STUN_ADDRESS_HPP

#include <cstdint>
#include <span>
#include <vector>

#include <asio/ip/udp.hpp>

#include "stun_attribute.hpp"
#include "stun_builder.hpp"
#include "stun_header.hpp"
#include "stun_message.hpp"

namespace stun {

/*
   rfc: https://datatracker.ietf.org/doc/html/rfc8489#section-14.1

    0                   1                   2                   3
    0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
   +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
   |0 0 0 0 0 0 0 0|    Family     |           Port                |
   +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
   |                                                               |
   |                 Address (32 bits or 128 bits)                 |
   |                                                               |
   +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
*/
enum class AddressFamily : uint8_t { IPV4 = 0x01, IPV6 = 0x02 };

namespace detail {

// transaction_id is only used when xored is true (IPv6 XOR mask).
asio::ip::udp::endpoint decode_address(std::span<const uint8_t> value, bool xored, const TransactionId &transaction_id);
void encode_address(std::vector<uint8_t> &buffer, const asio::ip::udp::endpoint &endpoint, bool xored,
                    const TransactionId &transaction_id);
uint16_t address_value_length(const asio::ip::udp::endpoint &endpoint);

}  // namespace detail

// MAPPED-ADDRESS / ALTERNATE-SERVER (plain) and XOR-MAPPED-ADDRESS (XOR'ed with cookie + transaction id).
template <uint16_t AttrType, bool Xored>
class AddressAttribute {
   public:
    static constexpr uint16_t TYPE = AttrType;

    using Context = NoContext;

    AddressAttribute() = default;
    explicit AddressAttribute(const asio::ip::udp::endpoint &endpoint) : endpoint_(endpoint) {}

    const asio::ip::udp::endpoint &endpoint() const { return endpoint_; }

    static AddressAttribute decode(Context, const StunMessage &msg, const AttrSpan &span) {
        return AddressAttribute(
            detail::decode_address(span.get_value(msg.buffer()), Xored, msg.get_transaction_id()));
    }

    void encode(Context, MessageBuilder &builder) const {
        detail::encode_address(builder.buffer(), endpoint_, Xored, builder.transaction_id());
    }

    uint16_t encode_len() const { return detail::address_value_length(endpoint_); }

   private:
    asio::ip::udp::endpoint endpoint_;
};

using MappedAddress = AddressAttribute<static_cast<uint16_t>(StunAttributeType::MAPPED_ADDRESS), false>;
using XorMappedAddress = AddressAttribute<static_cast<uint16_t>(StunAttributeType::XOR_MAPPED_ADDRESS), true>;
using AlternateServer = AddressAttribute<static_cast<uint16_t>(StunAttributeType::ALTERNATE_SERVER), false>;

}  // namespace stun

#endif  // STUN_ADDRESS_HPP
