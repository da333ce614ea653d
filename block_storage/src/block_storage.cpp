#include "block_storage/block_storage.hpp"
#include "block_storage/errors.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace block_storage {

// ============================================================================
// BlockHandle Implementation
// ============================================================================

BlockHandle::BlockHandle(BlockStorage* storage, std::shared_ptr<Block> block)
    : storage_(storage), block_(std::move(block)) {
}

BlockHandle::~BlockHandle() {
    try {
        Release();
    } catch (const std::exception& e) {
        std::cerr << "BlockHandle: ERROR - release failed: " << e.what() << std::endl;
    }
}

BlockHandle::BlockHandle(BlockHandle&& other) noexcept
    : storage_(other.storage_), block_(std::move(other.block_)) {
    other.storage_ = nullptr;
}

BlockHandle& BlockHandle::operator=(BlockHandle&& other) {
    if (this != &other) {
        Release();
        storage_ = other.storage_;
        block_ = std::move(other.block_);
        other.storage_ = nullptr;
    }
    return *this;
}

Block* BlockHandle::operator->() const {
    if (!block_) {
        throw BlockDisposedError("BlockHandle is empty or has been released");
    }
    return block_.get();
}

Block& BlockHandle::operator*() const {
    return *operator->();
}

void BlockHandle::Release() {
    if (!block_) {
        return;
    }

    // Keep the block alive until the storage is done with it
    std::shared_ptr<Block> block = std::move(block_);
    BlockStorage* storage = storage_;
    block_.reset();
    storage_ = nullptr;

    // Already released directly, or abandoned by a destroyed storage
    if (block->is_disposed() || storage == nullptr) {
        return;
    }
    storage->DropHandle(block.get());
}

// ============================================================================
// BlockStorage Implementation
// ============================================================================

BlockStorage::BlockStorage(std::unique_ptr<Stream> stream,
                           uint32_t block_size,
                           uint32_t header_size)
    : stream_(std::move(stream)) {
    if (!stream_) {
        throw std::invalid_argument("BlockStorage: stream must not be null");
    }
    geometry_ = BlockGeometry::Make(block_size, header_size);

    std::cout << "BlockStorage: Initialized on " << stream_->GetName()
              << " (block_size=" << geometry_.block_size
              << ", header_size=" << geometry_.header_size
              << ", sector_size=" << geometry_.sector_size << ")" << std::endl;
}

BlockStorage::~BlockStorage() {
    if (!blocks_.empty()) {
        std::cerr << "BlockStorage: WARNING - destroyed with " << blocks_.size()
                  << " open blocks; unreleased changes are discarded" << std::endl;
    }
    for (auto& entry : blocks_) {
        entry.second.block->Abandon();
    }
    blocks_.clear();
}

uint64_t BlockStorage::block_count() const {
    return stream_->GetLength() / geometry_.block_size;
}

BlockHandle BlockStorage::Register(std::shared_ptr<Block> block) {
    uint64_t block_id = block->id();
    auto result = blocks_.emplace(block_id, OpenBlock{block, 1});
    if (!result.second) {
        throw std::logic_error("BlockStorage: block " + std::to_string(block_id)
                               + " is already open");
    }
    return BlockHandle(this, std::move(block));
}

BlockHandle BlockStorage::CreateNew() {
    uint64_t length = stream_->GetLength();
    if (length % geometry_.block_size != 0) {
        throw MisalignedStreamError("Unexpected length of the stream: " + std::to_string(length)
                                    + " is not a multiple of block size "
                                    + std::to_string(geometry_.block_size));
    }

    uint64_t block_id = length / geometry_.block_size;

    // Extend the stream; the new region is zero-filled
    stream_->SetLength(length + geometry_.block_size);
    stream_->Flush();

    std::shared_ptr<Block> block(new Block(this, block_id, stream_.get(), geometry_,
                                           std::vector<uint8_t>(geometry_.sector_size, 0)));

    std::cout << "BlockStorage: Allocated block " << block_id << std::endl;
    return Register(std::move(block));
}

BlockHandle BlockStorage::Find(uint64_t block_id) {
    auto it = blocks_.find(block_id);
    if (it != blocks_.end()) {
        it->second.handles++;
        return BlockHandle(this, it->second.block);
    }

    // Block must lie entirely within the stream
    if (block_id >= block_count()) {
        return BlockHandle();
    }

    std::vector<uint8_t> first_sector(geometry_.sector_size);
    stream_->SetPosition(block_id * geometry_.block_size);

    size_t filled = 0;
    while (filled < first_sector.size()) {
        size_t n = stream_->Read(first_sector.data() + filled, first_sector.size() - filled);
        if (n == 0) {
            throw TruncatedStreamError("Stream " + stream_->GetName()
                                       + " ended while reading first sector of block "
                                       + std::to_string(block_id));
        }
        filled += n;
    }

    std::shared_ptr<Block> block(new Block(this, block_id, stream_.get(), geometry_,
                                           std::move(first_sector)));
    return Register(std::move(block));
}

void BlockStorage::OnBlockReleased(uint64_t block_id, const Block* block) {
    auto it = blocks_.find(block_id);
    if (it != blocks_.end() && it->second.block.get() == block) {
        blocks_.erase(it);
    }
}

void BlockStorage::DropHandle(Block* block) {
    auto it = blocks_.find(block->id());
    if (it == blocks_.end() || it->second.block.get() != block) {
        return;
    }
    if (--it->second.handles == 0) {
        block->Release();
    }
}

}  // namespace block_storage
