#pragma once

#include <cstdint>
#include <cstddef>

namespace block_storage {

/**
 * Fixed-width integer encoding for header fields.
 *
 * Values are stored little-endian regardless of host byte order so that
 * a block file written on one machine reads back on another.
 */
inline void WriteInt64(uint8_t* buffer, size_t offset, int64_t value) {
    uint64_t bits = static_cast<uint64_t>(value);
    for (size_t i = 0; i < 8; i++) {
        buffer[offset + i] = static_cast<uint8_t>(bits >> (8 * i));
    }
}

inline int64_t ReadInt64(const uint8_t* buffer, size_t offset) {
    uint64_t bits = 0;
    for (size_t i = 0; i < 8; i++) {
        bits |= static_cast<uint64_t>(buffer[offset + i]) << (8 * i);
    }
    return static_cast<int64_t>(bits);
}

}  // namespace block_storage
