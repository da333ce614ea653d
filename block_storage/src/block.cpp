#include "block_storage/block.hpp"
#include "block_storage/block_storage.hpp"
#include "block_storage/buffer_helper.hpp"
#include "block_storage/errors.hpp"
#include "block_storage/stream.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

namespace block_storage {

Block::Block(BlockStorage* storage, uint64_t id, Stream* stream,
             const BlockGeometry& geometry, std::vector<uint8_t> first_sector)
    : storage_(storage),
      id_(id),
      stream_(stream),
      geometry_(geometry),
      first_sector_(std::move(first_sector)) {
    if (stream_ == nullptr) {
        throw std::invalid_argument("Block: stream must not be null");
    }
    if (first_sector_.size() != geometry_.sector_size) {
        throw std::invalid_argument("Block: first sector must be exactly "
                                    + std::to_string(geometry_.sector_size) + " bytes");
    }
}

void Block::ThrowIfDisposed() const {
    if (disposed_) {
        throw BlockDisposedError("Block " + std::to_string(id_) + " has been released");
    }
}

void Block::CheckField(int field) const {
    if (field < 0 || field >= geometry_.header_field_count()) {
        throw std::out_of_range("Header field " + std::to_string(field)
                                + " out of range [0, "
                                + std::to_string(geometry_.header_field_count()) + ")");
    }
}

int64_t Block::GetHeader(int field) {
    ThrowIfDisposed();
    CheckField(field);

    size_t offset = static_cast<size_t>(field) * kHeaderFieldSize;
    if (field < kHeaderCacheSize) {
        std::optional<int64_t>& slot = header_cache_[field];
        if (!slot) {
            slot = ReadInt64(first_sector_.data(), offset);
        }
        return *slot;
    }
    return ReadInt64(first_sector_.data(), offset);
}

void Block::SetHeader(int field, int64_t value) {
    ThrowIfDisposed();
    CheckField(field);

    if (field < kHeaderCacheSize) {
        header_cache_[field] = value;
    }
    WriteInt64(first_sector_.data(), static_cast<size_t>(field) * kHeaderFieldSize, value);
    dirty_ = true;
}

void Block::Read(std::vector<uint8_t>& dst, size_t dst_offset, size_t src_offset, size_t count) {
    ThrowIfDisposed();

    const size_t data_size = geometry_.data_size;
    if (count > data_size || src_offset > data_size - count) {
        throw std::out_of_range("Read of " + std::to_string(count) + " bytes at offset "
                                + std::to_string(src_offset) + " is outside the data region ("
                                + std::to_string(data_size) + " bytes)");
    }
    if (dst_offset > dst.size() || count > dst.size() - dst_offset) {
        throw std::out_of_range("Read of " + std::to_string(count)
                                + " bytes is outside of destination bounds");
    }

    const size_t header_size = geometry_.header_size;
    const size_t sector_size = geometry_.sector_size;

    // Leading bytes that live in the cached sector
    size_t copied = 0;
    const bool from_sector = (header_size + src_offset) < sector_size;
    if (from_sector) {
        size_t n = std::min(sector_size - header_size - src_offset, count);
        auto first = first_sector_.begin() + static_cast<std::ptrdiff_t>(header_size + src_offset);
        std::copy(first, first + static_cast<std::ptrdiff_t>(n),
                  dst.begin() + static_cast<std::ptrdiff_t>(dst_offset));
        copied = n;
    }

    if (copied == count) {
        return;
    }

    // Everything else comes from the stream
    uint64_t position = BlockOffset() + (from_sector ? sector_size : header_size + src_offset);
    stream_->SetPosition(position);
    while (copied < count) {
        size_t to_read = std::min(sector_size, count - copied);
        size_t n = stream_->Read(dst.data() + dst_offset + copied, to_read);
        if (n == 0) {
            throw TruncatedStreamError("Stream " + stream_->GetName() + " ended while reading block "
                                       + std::to_string(id_) + " (" + std::to_string(copied)
                                       + " of " + std::to_string(count) + " bytes read)");
        }
        copied += n;
    }
}

void Block::Write(const std::vector<uint8_t>& src, size_t src_offset, size_t dst_offset, size_t count) {
    ThrowIfDisposed();

    const size_t data_size = geometry_.data_size;
    if (count > data_size || dst_offset > data_size - count) {
        throw std::out_of_range("Write of " + std::to_string(count) + " bytes at offset "
                                + std::to_string(dst_offset) + " is outside the data region ("
                                + std::to_string(data_size) + " bytes)");
    }
    if (src_offset > src.size() || count > src.size() - src_offset) {
        throw std::out_of_range("Write of " + std::to_string(count)
                                + " bytes is outside of source bounds");
    }

    const size_t header_size = geometry_.header_size;
    const size_t sector_size = geometry_.sector_size;

    // Bytes belonging to the first sector stay in memory until Release()
    if (header_size + dst_offset < sector_size) {
        size_t n = std::min(count, sector_size - (header_size + dst_offset));
        if (n > 0) {
            auto first = src.begin() + static_cast<std::ptrdiff_t>(src_offset);
            std::copy(first, first + static_cast<std::ptrdiff_t>(n),
                      first_sector_.begin() + static_cast<std::ptrdiff_t>(header_size + dst_offset));
            dirty_ = true;
        }
    }

    if (header_size + dst_offset + count <= sector_size) {
        return;
    }

    // The rest of the block has no in-memory copy: write through
    uint64_t position = BlockOffset() + std::max(sector_size, header_size + dst_offset);
    if (header_size + dst_offset < sector_size) {
        size_t absorbed = sector_size - (header_size + dst_offset);
        src_offset += absorbed;
        count -= absorbed;
    }

    stream_->SetPosition(position);
    size_t written = 0;
    while (written < count) {
        size_t chunk = std::min(static_cast<size_t>(kWriteChunkSize), count - written);
        stream_->Write(src.data() + src_offset + written, chunk);
        stream_->Flush();
        written += chunk;
    }
}

void Block::FlushFirstSector() {
    stream_->SetPosition(BlockOffset());
    stream_->Write(first_sector_.data(), first_sector_.size());
    stream_->Flush();
    dirty_ = false;
}

void Block::Release() {
    if (disposed_) {
        return;
    }
    disposed_ = true;

    BlockStorage* storage = storage_;
    storage_ = nullptr;

    try {
        if (dirty_) {
            FlushFirstSector();
            std::cout << "Block: Flushed first sector of block " << id_ << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Block: ERROR - failed to flush block " << id_ << ": "
                  << e.what() << std::endl;
        if (storage != nullptr) {
            storage->OnBlockReleased(id_, this);
        }
        throw;
    }

    if (storage != nullptr) {
        storage->OnBlockReleased(id_, this);
    }
}

void Block::Abandon() {
    if (disposed_) {
        return;
    }
    if (dirty_) {
        std::cerr << "Block: WARNING - block " << id_
                  << " abandoned while open, cached sector changes lost" << std::endl;
    }
    disposed_ = true;
    dirty_ = false;
    storage_ = nullptr;
}

}  // namespace block_storage
