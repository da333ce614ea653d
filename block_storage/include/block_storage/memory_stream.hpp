#pragma once

#include "block_storage/stream.hpp"
#include <vector>
#include <string>

namespace block_storage {

/**
 * MemoryStream: Stream backed by a growable byte vector
 *
 * Used for scratch storage and in tests. Flush() has nothing to make
 * durable but is still counted, so callers can observe flush behaviour.
 *
 * Usage:
 *   auto stream = std::make_unique<MemoryStream>();
 *   BlockStorage storage(std::move(stream), 128, 16);
 */
class MemoryStream : public Stream {
public:
    /**
     * @param max_read_size Upper bound on bytes returned by a single Read
     *                      (0 = unlimited). Lets tests force short reads.
     */
    explicit MemoryStream(size_t max_read_size = 0);

    uint64_t GetPosition() const override { return position_; }
    void SetPosition(uint64_t position) override { position_ = position; }
    size_t Read(uint8_t* buffer, size_t count) override;
    void Write(const uint8_t* buffer, size_t count) override;
    void Flush() override;
    uint64_t GetLength() const override { return data_.size(); }
    void SetLength(uint64_t length) override;

    AccessStats GetAccessStats() const override { return stats_; }
    void ResetAccessStats() override { stats_ = AccessStats(); }

    std::string GetName() const override { return "memory"; }

    // Raw contents, for inspection
    const std::vector<uint8_t>& data() const { return data_; }

private:
    std::vector<uint8_t> data_;
    uint64_t position_ = 0;
    size_t max_read_size_;
    AccessStats stats_;
};

}  // namespace block_storage
