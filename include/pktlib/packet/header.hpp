#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "pktlib/error.hpp"
#include "pktlib/expected.hpp"

namespace pktlib::packet {

// 固定長ヘッダ 21 バイト（パディングなし、整数はすべて little-endian）
struct Header {
  uint8_t  message_type = 0;   // offset 0
  uint32_t sequence = 0;       // offset 1
  uint64_t sender_id = 0;      // offset 5
  uint32_t payload_size = 0;   // offset 13
  uint32_t checksum = 0;       // offset 17

  bool operator==(const Header&) const = default;
};

constexpr size_t kHeaderSize = 21u;
using HeaderBytes = std::array<std::uint8_t, kHeaderSize>;

namespace offsets {
constexpr size_t kMessageType = 0;
constexpr size_t kSequence = 1;
constexpr size_t kSenderId = 5;
constexpr size_t kPayloadSize = 13;
constexpr size_t kChecksum = 17;
} // namespace offsets

/**
 * @brief Serialize a header into its 21-byte wire form
 * @param h Header to encode
 * @return Encoded bytes
 */
HeaderBytes encode_header(const Header& h) noexcept;

/**
 * @brief Parse a header from the first 21 bytes of a buffer
 *
 * Trailing bytes are ignored. Field values are not validated.
 *
 * @param bytes Input buffer
 * @return Header, or PktErrc::insufficient_bytes if the buffer is shorter than 21 bytes
 */
pktlib::Result<Header> decode_header(std::span<const std::uint8_t> bytes) noexcept;

} // namespace pktlib::packet
