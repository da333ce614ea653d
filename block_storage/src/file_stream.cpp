#include "block_storage/file_stream.hpp"
#include "block_storage/errors.hpp"
#include <iostream>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <errno.h>

namespace block_storage {

FileStream::FileStream(const std::string& path)
    : path_(path) {
    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw StreamError("FileStream: Failed to open " + path_, errno);
    }
    std::cout << "FileStream: Opened " << path_ << " (" << GetLength()
              << " bytes)" << std::endl;
}

FileStream::~FileStream() {
    if (fd_ >= 0) {
        if (::close(fd_) != 0) {
            std::cerr << "FileStream: close failed for: " << path_
                      << " (errno: " << errno << ")" << std::endl;
        }
    }
}

uint64_t FileStream::GetPosition() const {
    return position_;
}

void FileStream::SetPosition(uint64_t position) {
    position_ = position;
}

void FileStream::Seek() {
    if (::lseek(fd_, static_cast<off_t>(position_), SEEK_SET) < 0) {
        throw StreamError("FileStream: lseek failed for " + path_, errno);
    }
}

size_t FileStream::Read(uint8_t* buffer, size_t count) {
    Seek();

    ssize_t n;
    do {
        n = ::read(fd_, buffer, count);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        throw StreamError("FileStream: read failed for " + path_, errno);
    }

    position_ += static_cast<uint64_t>(n);
    stats_.reads++;
    stats_.bytes_read += static_cast<uint64_t>(n);
    return static_cast<size_t>(n);
}

void FileStream::Write(const uint8_t* buffer, size_t count) {
    Seek();

    size_t written = 0;
    while (written < count) {
        ssize_t n = ::write(fd_, buffer + written, count - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw StreamError("FileStream: write failed for " + path_, errno);
        }
        if (n == 0) {
            throw StreamError("FileStream: write made no progress on " + path_, EIO);
        }
        written += static_cast<size_t>(n);
    }

    position_ += count;
    stats_.writes++;
    stats_.bytes_written += count;
}

void FileStream::Flush() {
    if (::fsync(fd_) != 0) {
        throw StreamError("FileStream: fsync failed for " + path_, errno);
    }
    stats_.flushes++;
}

uint64_t FileStream::GetLength() const {
    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        throw StreamError("FileStream: fstat failed for " + path_, errno);
    }
    return static_cast<uint64_t>(st.st_size);
}

void FileStream::SetLength(uint64_t length) {
    // ftruncate zero-fills when growing
    if (::ftruncate(fd_, static_cast<off_t>(length)) != 0) {
        throw StreamError("FileStream: ftruncate failed for " + path_, errno);
    }
}

FileStream::AccessStats FileStream::GetAccessStats() const {
    return stats_;
}

void FileStream::ResetAccessStats() {
    stats_ = AccessStats();
}

}  // namespace block_storage
