#pragma once

#include "block_storage/geometry.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace block_storage {

// Forward declarations
class BlockStorage;
class Stream;

/**
 * Block: One open fixed-size block of the stream
 *
 * Responsibilities:
 * - Keep the first sector of the block (header + leading data) in memory
 * - Cache decoded header fields so hot headers skip the byte decoding
 * - Stitch data reads/writes across the cached sector and the stream
 * - Write the cached sector back exactly once, on Release()
 *
 * Write policy:
 * - Header and data bytes inside the first sector are write-back; they
 *   only reach the stream when the block is released
 * - Data bytes past the first sector have no in-memory copy and are
 *   written through (and flushed) immediately, in kWriteChunkSize pieces
 *
 * Lifecycle:
 *   Open → (headers / reads / writes) → Released (terminal)
 *   Every operation other than Release() throws BlockDisposedError once
 *   the block is released. A block destroyed without Release() does not
 *   flush; pending first-sector changes are lost and logged.
 *
 * Thread-safety:
 * - NOT thread-safe; shares the storage's single stream cursor
 *
 * Blocks are only created by BlockStorage and reached through BlockHandle.
 */
class Block {
public:
    ~Block() = default;

    Block(const Block&) = delete;
    Block& operator=(const Block&) = delete;

    uint64_t id() const { return id_; }

    /**
     * Read a header field
     *
     * @param field Field index, 0 <= field < header_size / 8
     * @return Decoded 64-bit value
     * @throws std::out_of_range, BlockDisposedError
     */
    int64_t GetHeader(int field);

    /**
     * Set a header field. Deferred until Release().
     *
     * @throws std::out_of_range, BlockDisposedError
     */
    void SetHeader(int field, int64_t value);

    /**
     * Read data bytes of the block (src) into a buffer (dst)
     *
     * @param dst Destination buffer
     * @param dst_offset Where in dst to start copying
     * @param src_offset Offset within the data region (0 = first byte after header)
     * @param count Number of bytes
     * @throws std::out_of_range if either range is out of bounds
     * @throws TruncatedStreamError if the stream ends early
     * @throws BlockDisposedError
     */
    void Read(std::vector<uint8_t>& dst, size_t dst_offset, size_t src_offset, size_t count);

    /**
     * Write bytes from a buffer (src) into the data region of the block (dst)
     *
     * @param src Source buffer
     * @param src_offset Where in src to start copying
     * @param dst_offset Offset within the data region
     * @param count Number of bytes
     * @throws std::out_of_range, BlockDisposedError
     */
    void Write(const std::vector<uint8_t>& src, size_t src_offset, size_t dst_offset, size_t count);

    /**
     * Flush the cached sector if dirty, retire the block and remove it
     * from its storage's registry. Safe to call more than once.
     */
    void Release();

    bool is_dirty() const { return dirty_; }
    bool is_disposed() const { return disposed_; }

private:
    friend class BlockStorage;

    Block(BlockStorage* storage, uint64_t id, Stream* stream,
          const BlockGeometry& geometry, std::vector<uint8_t> first_sector);

    /**
     * Retire without flushing; used when the owning storage goes away
     * while the block is still open
     */
    void Abandon();

    void ThrowIfDisposed() const;
    void CheckField(int field) const;
    void FlushFirstSector();

    uint64_t BlockOffset() const {
        return id_ * static_cast<uint64_t>(geometry_.block_size);
    }

    BlockStorage* storage_;  // null once released
    uint64_t id_;
    Stream* stream_;         // owned by storage
    BlockGeometry geometry_;

    std::vector<uint8_t> first_sector_;  // sector_size bytes
    std::array<std::optional<int64_t>, kHeaderCacheSize> header_cache_;

    bool dirty_ = false;
    bool disposed_ = false;
};

}  // namespace block_storage
