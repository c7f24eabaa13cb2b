#include "pktlib/packet/checksum.hpp"

namespace pktlib::packet {

uint32_t calc_checksum(std::span<const uint8_t> data) noexcept {
    // unsigned 演算なのでオーバーフローは 2^32 で折り返す
    uint32_t sum = 0;
    for (uint8_t b : data) {
        sum += static_cast<uint32_t>(b);
    }
    return sum;
}

bool verify_checksum(std::span<const uint8_t> data, uint32_t expected_checksum) noexcept {
    return calc_checksum(data) == expected_checksum;
}

} // namespace pktlib::packet
