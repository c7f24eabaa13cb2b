#include "pktlib/packet/byte_order.hpp"

namespace pktlib::packet {

namespace {

template<typename T>
T read_le(const uint8_t* data) noexcept {
    T value = 0;
    for (unsigned i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(data[i]) << (8 * i);
    }
    return value;
}

template<typename T>
void write_le(uint8_t* data, T value) noexcept {
    for (unsigned i = 0; i < sizeof(T); ++i) {
        data[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFFu);
    }
}

} // namespace

uint32_t read_le32(const uint8_t* data) noexcept { return read_le<uint32_t>(data); }

uint64_t read_le64(const uint8_t* data) noexcept { return read_le<uint64_t>(data); }

void write_le32(uint8_t* data, uint32_t value) noexcept { write_le<uint32_t>(data, value); }

void write_le64(uint8_t* data, uint64_t value) noexcept { write_le<uint64_t>(data, value); }

} // namespace pktlib::packet
