#pragma once

#include "block_storage/stream.hpp"
#include <string>

namespace block_storage {

/**
 * FileStream: Stream over a regular file via a POSIX file descriptor
 *
 * Responsibilities:
 * - Own the descriptor (opened read/write, created if missing)
 * - Keep the logical cursor and issue lseek right before each transfer
 * - Map Flush() to fsync so "durable" means on the physical device
 *
 * Data flow:
 *   Application buffer
 *       ↓
 *   write(2) → OS page cache
 *       ↓
 *   fsync(2) [Flush] → Physical disk
 *
 * Usage:
 *   auto stream = std::make_unique<FileStream>("/path/to/blocks.db");
 *   BlockStorage storage(std::move(stream), 4096, 48);
 */
class FileStream : public Stream {
public:
    /**
     * Open (or create) the backing file
     * @param path File path
     * @throws StreamError if the file cannot be opened
     */
    explicit FileStream(const std::string& path);
    ~FileStream() override;

    FileStream(const FileStream&) = delete;
    FileStream& operator=(const FileStream&) = delete;

    uint64_t GetPosition() const override;
    void SetPosition(uint64_t position) override;
    size_t Read(uint8_t* buffer, size_t count) override;
    void Write(const uint8_t* buffer, size_t count) override;
    void Flush() override;
    uint64_t GetLength() const override;
    void SetLength(uint64_t length) override;

    AccessStats GetAccessStats() const override;
    void ResetAccessStats() override;

    std::string GetName() const override { return path_; }

private:
    std::string path_;
    int fd_ = -1;
    uint64_t position_ = 0;

    AccessStats stats_;

    /**
     * Position the descriptor at the logical cursor
     */
    void Seek();
};

}  // namespace block_storage
