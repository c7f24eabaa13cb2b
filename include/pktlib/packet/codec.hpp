#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "pktlib/error.hpp"
#include "pktlib/expected.hpp"
#include "pktlib/packet/header.hpp"
#include "pktlib/packet/packet.hpp"

namespace pktlib::packet {

// ヘッダ 21 バイト + payload をそのまま連結
std::vector<std::uint8_t> encode_packet(const Packet& p);

/**
 * @brief Decode a complete packet
 *
 * The buffer must hold exactly one packet: header plus payload_size bytes.
 * The checksum field is not checked, use verify_checksum for that.
 *
 * @param bytes Encoded packet
 * @return Packet, PktErrc::insufficient_bytes if shorter than a header,
 *         or PktErrc::payload_size_mismatch if the remaining length differs from payload_size
 */
pktlib::Result<Packet> decode_packet(std::span<const std::uint8_t> bytes) noexcept;

/**
 * @brief Recompute the payload checksum and compare it with the header
 * @param p Packet to check
 * @return true if header().checksum matches the payload
 */
bool verify_checksum(const Packet& p) noexcept;

} // namespace pktlib::packet
