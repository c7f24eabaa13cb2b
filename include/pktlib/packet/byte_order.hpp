#pragma once

#include <cstdint>

namespace pktlib::packet {

/**
 * @brief Read a 32-bit little-endian value
 * @param data Pointer to at least 4 bytes
 * @return Decoded value (host order)
 */
uint32_t read_le32(const uint8_t* data) noexcept;

/**
 * @brief Read a 64-bit little-endian value
 * @param data Pointer to at least 8 bytes
 * @return Decoded value (host order)
 */
uint64_t read_le64(const uint8_t* data) noexcept;

/**
 * @brief Write a 32-bit value least-significant byte first
 * @param data Pointer to at least 4 writable bytes
 * @param value Value to write
 */
void write_le32(uint8_t* data, uint32_t value) noexcept;

/**
 * @brief Write a 64-bit value least-significant byte first
 * @param data Pointer to at least 8 writable bytes
 * @param value Value to write
 */
void write_le64(uint8_t* data, uint64_t value) noexcept;

} // namespace pktlib::packet
