#include "pktlib/packet/header.hpp"
#include "pktlib/packet/byte_order.hpp"

namespace pktlib::packet {

HeaderBytes encode_header(const Header& h) noexcept {
  HeaderBytes out{};
  out[offsets::kMessageType] = h.message_type;
  write_le32(out.data() + offsets::kSequence, h.sequence);
  write_le64(out.data() + offsets::kSenderId, h.sender_id);
  write_le32(out.data() + offsets::kPayloadSize, h.payload_size);
  write_le32(out.data() + offsets::kChecksum, h.checksum);
  return out;
}

pktlib::Result<Header> decode_header(std::span<const std::uint8_t> bytes) noexcept {
  if (bytes.size() < kHeaderSize) {
    return make_error_code(PktErrc::insufficient_bytes);
  }
  const std::uint8_t* p = bytes.data();
  Header h{};
  h.message_type = p[offsets::kMessageType];
  h.sequence = read_le32(p + offsets::kSequence);
  h.sender_id = read_le64(p + offsets::kSenderId);
  h.payload_size = read_le32(p + offsets::kPayloadSize);
  h.checksum = read_le32(p + offsets::kChecksum);
  return h;
}

} // namespace pktlib::packet
