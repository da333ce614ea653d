#pragma once

#include <stdexcept>
#include <string>

namespace block_storage {

/**
 * Error types raised by the block layer.
 *
 * Argument violations use the standard std::invalid_argument and
 * std::out_of_range; the conditions below have no standard counterpart.
 */

// Stream length is not a multiple of the block size at allocation time
class MisalignedStreamError : public std::runtime_error {
public:
    explicit MisalignedStreamError(const std::string& what)
        : std::runtime_error(what) {}
};

// Operation on a block (or handle) that has already been released
class BlockDisposedError : public std::logic_error {
public:
    explicit BlockDisposedError(const std::string& what)
        : std::logic_error(what) {}
};

// Stream returned end-of-data while block addressing expected more bytes
class TruncatedStreamError : public std::runtime_error {
public:
    explicit TruncatedStreamError(const std::string& what)
        : std::runtime_error(what) {}
};

// Underlying I/O call failed
class StreamError : public std::runtime_error {
public:
    StreamError(const std::string& what, int error_code)
        : std::runtime_error(what + " (errno: " + std::to_string(error_code) + ")"),
          error_code_(error_code) {}

    int error_code() const { return error_code_; }

private:
    int error_code_;
};

}  // namespace block_storage
