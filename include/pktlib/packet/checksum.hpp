#pragma once

#include <cstdint>
#include <span>

namespace pktlib::packet {

/**
 * @brief Calculate the additive payload checksum
 *
 * Each byte is widened to 32 bits and summed; overflow wraps modulo 2^32.
 * Not a CRC and not tamper resistant: reordering bytes leaves the value unchanged.
 *
 * @param data Payload bytes (may be empty)
 * @return Checksum value, 0 for empty input
 */
uint32_t calc_checksum(std::span<const uint8_t> data) noexcept;

/**
 * @brief Verify the additive checksum
 * @param data Payload bytes
 * @param expected_checksum Expected checksum value
 * @return true if checksum matches
 */
bool verify_checksum(std::span<const uint8_t> data, uint32_t expected_checksum) noexcept;

} // namespace pktlib::packet
