#pragma once

#include "block_storage/block.hpp"
#include "block_storage/geometry.hpp"
#include "block_storage/stream.hpp"
#include <cstdint>
#include <memory>
#include <unordered_map>

namespace block_storage {

class BlockStorage;

/**
 * BlockHandle: Scoped access token for an open Block
 *
 * Returned by BlockStorage::CreateNew() and BlockStorage::Find(). Several
 * handles may refer to the same block; the storage counts them. Dropping
 * the last handle (Release() or scope exit) releases the block, which
 * flushes its cached sector and removes it from the registry.
 *
 * An empty handle means "not found".
 *
 * Usage:
 *   {
 *       BlockHandle block = storage.CreateNew();
 *       block->SetHeader(0, 42);
 *   }  // flushed here
 *
 *   BlockHandle block = storage.Find(id);
 *   if (!block) { ... not found ... }
 */
class BlockHandle {
public:
    BlockHandle() = default;
    ~BlockHandle();

    BlockHandle(BlockHandle&& other) noexcept;
    BlockHandle& operator=(BlockHandle&& other);

    BlockHandle(const BlockHandle&) = delete;
    BlockHandle& operator=(const BlockHandle&) = delete;

    /**
     * Access the block
     * @throws BlockDisposedError if the handle is empty or released
     */
    Block* operator->() const;
    Block& operator*() const;

    // Block pointer, or nullptr for an empty handle
    Block* get() const { return block_.get(); }

    explicit operator bool() const { return block_ != nullptr; }

    /**
     * Give up this handle's reference. Idempotent.
     */
    void Release();

private:
    friend class BlockStorage;

    BlockHandle(BlockStorage* storage, std::shared_ptr<Block> block);

    BlockStorage* storage_ = nullptr;
    std::shared_ptr<Block> block_;
};

/**
 * BlockStorage: Addresses a stream as an array of fixed-size blocks
 *
 * Responsibilities:
 * - Own the stream and the block geometry
 * - Allocate new blocks by extending the stream (CreateNew)
 * - Look up existing blocks by id, reading their first sector (Find)
 * - Track open blocks so each id has at most one live Block
 *
 * BlockStorage never reads or writes block contents itself after a block
 * is opened; that is the Block's job.
 *
 * Persisted layout:
 *   block id occupies [id * block_size, (id + 1) * block_size)
 *
 * Thread-safety:
 * - NOT thread-safe; callers serialize all access to the storage and its
 *   blocks (see BlockServiceImpl)
 *
 * Usage:
 *   BlockStorage storage(std::make_unique<FileStream>(path), 4096, 48);
 *   BlockHandle block = storage.CreateNew();
 *   block->Write(data, 0, 0, data.size());
 */
class BlockStorage {
public:
    /**
     * @param stream Backing stream (ownership taken)
     * @param block_size Total bytes per block (header + data), >= 128
     * @param header_size Bytes of header at the start of each block
     * @throws std::invalid_argument on a null stream or invalid geometry
     */
    explicit BlockStorage(std::unique_ptr<Stream> stream,
                          uint32_t block_size = kDefaultBlockSize,
                          uint32_t header_size = kDefaultHeaderSize);
    ~BlockStorage();

    BlockStorage(const BlockStorage&) = delete;
    BlockStorage& operator=(const BlockStorage&) = delete;

    uint32_t block_size() const { return geometry_.block_size; }
    uint32_t header_size() const { return geometry_.header_size; }
    uint32_t data_size() const { return geometry_.data_size; }
    uint32_t sector_size() const { return geometry_.sector_size; }
    const BlockGeometry& geometry() const { return geometry_; }

    /**
     * Allocate a new zero-filled block at the end of the stream
     *
     * @return Handle to the new block, id = previous length / block_size
     * @throws MisalignedStreamError if the stream length is not a
     *         multiple of block_size
     */
    BlockHandle CreateNew();

    /**
     * Open an existing block
     *
     * An already-open block is returned as is, without touching the stream.
     *
     * @param block_id Block to open
     * @return Handle to the block, or an empty handle if the block lies
     *         (even partly) past the end of the stream
     * @throws TruncatedStreamError if the first sector cannot be read
     */
    BlockHandle Find(uint64_t block_id);

    /**
     * Number of whole blocks the stream currently holds
     */
    uint64_t block_count() const;

    /**
     * Number of blocks currently open (registered)
     */
    size_t open_block_count() const { return blocks_.size(); }

    Stream& stream() { return *stream_; }

private:
    friend class Block;
    friend class BlockHandle;

    struct OpenBlock {
        std::shared_ptr<Block> block;
        uint32_t handles = 0;
    };

    std::unique_ptr<Stream> stream_;
    BlockGeometry geometry_;

    // Registry: block id -> open block
    std::unordered_map<uint64_t, OpenBlock> blocks_;

    BlockHandle Register(std::shared_ptr<Block> block);

    /**
     * Called by Block::Release(); the only path that shrinks the registry
     */
    void OnBlockReleased(uint64_t block_id, const Block* block);

    /**
     * Called by BlockHandle::Release(); releases the block once its last
     * handle is gone
     */
    void DropHandle(Block* block);
};

}  // namespace block_storage
