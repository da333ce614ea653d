#include "block_storage/geometry.hpp"
#include <stdexcept>
#include <string>

namespace block_storage {

BlockGeometry BlockGeometry::Make(uint32_t block_size, uint32_t header_size) {
    if (block_size < kMinBlockSize) {
        throw std::invalid_argument("block_size must be at least "
                                    + std::to_string(kMinBlockSize)
                                    + ", got " + std::to_string(block_size));
    }
    if (header_size >= block_size) {
        throw std::invalid_argument("header_size must be less than block_size, got "
                                    + std::to_string(header_size) + " >= "
                                    + std::to_string(block_size));
    }

    BlockGeometry geometry;
    geometry.block_size = block_size;
    geometry.header_size = header_size;
    geometry.data_size = block_size - header_size;
    geometry.sector_size = (block_size >= kLargeSectorSize) ? kLargeSectorSize
                                                            : kSmallSectorSize;

    // Header fields are only ever read from the cached sector
    if (header_size > geometry.sector_size) {
        throw std::invalid_argument("header_size " + std::to_string(header_size)
                                    + " exceeds cached sector size "
                                    + std::to_string(geometry.sector_size));
    }
    return geometry;
}

}  // namespace block_storage
