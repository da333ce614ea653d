#include "block_storage/memory_stream.hpp"
#include <algorithm>
#include <cstring>

namespace block_storage {

MemoryStream::MemoryStream(size_t max_read_size)
    : max_read_size_(max_read_size) {
}

size_t MemoryStream::Read(uint8_t* buffer, size_t count) {
    stats_.reads++;
    if (position_ >= data_.size()) {
        return 0;
    }

    size_t available = static_cast<size_t>(data_.size() - position_);
    size_t n = std::min(count, available);
    if (max_read_size_ > 0) {
        n = std::min(n, max_read_size_);
    }

    std::memcpy(buffer, data_.data() + position_, n);
    position_ += n;
    stats_.bytes_read += n;
    return n;
}

void MemoryStream::Write(const uint8_t* buffer, size_t count) {
    if (count == 0) {
        return;
    }
    if (position_ + count > data_.size()) {
        data_.resize(static_cast<size_t>(position_ + count), 0);
    }
    std::memcpy(data_.data() + position_, buffer, count);
    position_ += count;
    stats_.writes++;
    stats_.bytes_written += count;
}

void MemoryStream::Flush() {
    stats_.flushes++;
}

void MemoryStream::SetLength(uint64_t length) {
    data_.resize(static_cast<size_t>(length), 0);
}

}  // namespace block_storage
