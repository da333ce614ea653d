#pragma once

#include <cstdint>

namespace block_storage {

// ============================================================================
// Block Constants
// ============================================================================
constexpr uint32_t kMinBlockSize = 128;
constexpr uint32_t kDefaultBlockSize = 4096;     // Matches the common OS page size
constexpr uint32_t kDefaultHeaderSize = 48;      // 6 header fields
constexpr uint32_t kLargeSectorSize = 4096;      // Cached sector for blocks >= 4KB
constexpr uint32_t kSmallSectorSize = 128;       // Cached sector for smaller blocks
constexpr uint32_t kHeaderFieldSize = 8;         // Each header field is one int64
constexpr int kHeaderCacheSize = 5;              // Decoded header fields kept per block
constexpr uint32_t kWriteChunkSize = 4096;       // Direct-to-stream write granularity

/**
 * BlockGeometry: Size configuration shared by a storage and all its blocks
 *
 * Layout of one block:
 *   [ header (header_size) | data (data_size) ]
 *   [ cached first sector (sector_size) ...   ]
 *
 * The sector never has to line up with the header or the block end.
 */
struct BlockGeometry {
    uint32_t block_size = 0;
    uint32_t header_size = 0;
    uint32_t data_size = 0;
    uint32_t sector_size = 0;

    /**
     * Build and validate a geometry
     *
     * @throws std::invalid_argument if block_size < kMinBlockSize,
     *         header_size >= block_size, or the header does not fit in
     *         the cached sector
     */
    static BlockGeometry Make(uint32_t block_size, uint32_t header_size);

    // Number of addressable header fields
    int header_field_count() const {
        return static_cast<int>(header_size / kHeaderFieldSize);
    }
};

}  // namespace block_storage
