#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "pktlib/expected.hpp"
#include "pktlib/packet/header.hpp"

namespace pktlib::packet {

class Packet;

pktlib::Result<Packet> decode_packet(std::span<const std::uint8_t> bytes) noexcept;

/**
 * @brief Header と payload の組（生成後は不変）
 *
 * payload_size と checksum は payload から算出される。
 * decode_packet で復元した場合の checksum はワイヤ上の値そのまま。
 */
class Packet {
public:
  /// Packet(0, 0, 0, {}) と同じ
  Packet() = default;

  /**
   * @brief Build a packet, deriving payload_size and checksum from the payload
   * @param message_type Application-defined message kind
   * @param sequence Sender sequence number
   * @param sender_id Opaque originator identifier
   * @param payload Payload bytes (may be empty, must be shorter than 4 GiB)
   */
  Packet(uint8_t message_type, uint32_t sequence, uint64_t sender_id,
         std::vector<std::uint8_t> payload);

  const Header& header() const noexcept { return header_; }
  const std::vector<std::uint8_t>& payload() const noexcept { return payload_; }

  uint8_t message_type() const noexcept { return header_.message_type; }
  uint32_t sequence() const noexcept { return header_.sequence; }
  uint64_t sender_id() const noexcept { return header_.sender_id; }

  /// Encoded length: kHeaderSize + payload().size()
  size_t wire_size() const noexcept { return kHeaderSize + payload_.size(); }

private:
  Packet(const Header& header, std::vector<std::uint8_t> payload);

  friend pktlib::Result<Packet> decode_packet(std::span<const std::uint8_t> bytes) noexcept;

  Header header_{};
  std::vector<std::uint8_t> payload_{};
};

} // namespace pktlib::packet
