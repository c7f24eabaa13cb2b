#include "pktlib/packet/packet.hpp"
#include "pktlib/packet/checksum.hpp"

#include <utility>

namespace pktlib::packet {

Packet::Packet(uint8_t message_type, uint32_t sequence, uint64_t sender_id,
               std::vector<std::uint8_t> payload)
    : payload_(std::move(payload)) {
  header_.message_type = message_type;
  header_.sequence = sequence;
  header_.sender_id = sender_id;
  // 4 GiB 以上の payload は対象外（上位ビットは切り捨て）
  header_.payload_size = static_cast<uint32_t>(payload_.size());
  header_.checksum = calc_checksum(payload_);
}

Packet::Packet(const Header& header, std::vector<std::uint8_t> payload)
    : header_(header), payload_(std::move(payload)) {}

} // namespace pktlib::packet
