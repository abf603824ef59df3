/**
 * @file byte_order.hpp
 * @brief Little-endian read/write helpers shared by the codec and cache
 *
 * Readers take a span and an offset; callers are responsible for the
 * bounds check so the hot decode loop does not check twice.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace medimg::encoding {

[[nodiscard]] constexpr auto read_le16(std::span<const uint8_t> data,
                                       std::size_t offset) noexcept -> uint16_t {
    return static_cast<uint16_t>(data[offset]) |
           static_cast<uint16_t>(static_cast<uint16_t>(data[offset + 1]) << 8);
}

[[nodiscard]] constexpr auto read_le32(std::span<const uint8_t> data,
                                       std::size_t offset) noexcept -> uint32_t {
    return static_cast<uint32_t>(data[offset]) |
           (static_cast<uint32_t>(data[offset + 1]) << 8) |
           (static_cast<uint32_t>(data[offset + 2]) << 16) |
           (static_cast<uint32_t>(data[offset + 3]) << 24);
}

[[nodiscard]] constexpr auto read_le64(std::span<const uint8_t> data,
                                       std::size_t offset) noexcept -> uint64_t {
    return static_cast<uint64_t>(read_le32(data, offset)) |
           (static_cast<uint64_t>(read_le32(data, offset + 4)) << 32);
}

inline void write_le16(std::vector<uint8_t>& buffer, uint16_t value) {
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

inline void write_le32(std::vector<uint8_t>& buffer, uint32_t value) {
    buffer.push_back(static_cast<uint8_t>(value & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    buffer.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

inline void write_le64(std::vector<uint8_t>& buffer, uint64_t value) {
    write_le32(buffer, static_cast<uint32_t>(value & 0xFFFFFFFFu));
    write_le32(buffer, static_cast<uint32_t>(value >> 32));
}

}  // namespace medimg::encoding
