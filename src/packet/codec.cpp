#include "pktlib/packet/codec.hpp"
#include "pktlib/packet/checksum.hpp"

namespace pktlib::packet {

std::vector<std::uint8_t> encode_packet(const Packet& p) {
  const auto hb = encode_header(p.header());
  std::vector<std::uint8_t> out;
  out.reserve(p.wire_size());
  out.insert(out.end(), hb.begin(), hb.end());
  out.insert(out.end(), p.payload().begin(), p.payload().end());
  return out;
}

pktlib::Result<Packet> decode_packet(std::span<const std::uint8_t> bytes) noexcept {
  if (bytes.size() < kHeaderSize) {
    return make_error_code(PktErrc::insufficient_bytes);
  }
  auto h_res = decode_header(bytes.first(kHeaderSize));
  if (!h_res) return h_res.error();
  const Header& h = h_res.value();

  auto body = bytes.subspan(kHeaderSize);
  if (body.size() != static_cast<size_t>(h.payload_size)) {
    return make_error_code(PktErrc::payload_size_mismatch);
  }
  return Packet(h, std::vector<std::uint8_t>(body.begin(), body.end()));
}

bool verify_checksum(const Packet& p) noexcept {
  return verify_checksum(p.payload(), p.header().checksum);
}

} // namespace pktlib::packet
