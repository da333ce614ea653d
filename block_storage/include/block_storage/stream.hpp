#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

namespace block_storage {

/**
 * Stream: Abstract seekable byte source/sink underneath BlockStorage
 *
 * The block layer never cares what the medium is (file, memory buffer,
 * network-backed device). It only needs a single cursor, partial reads,
 * full writes, a durability barrier and a resizable length.
 *
 * Thread-safety:
 * - NOT thread-safe; the position is one shared cursor, so every seek
 *   must immediately precede the read or write that uses it
 *
 * Errors:
 * - Implementations throw StreamError when the underlying call fails
 */
class Stream {
public:
    virtual ~Stream() = default;

    /**
     * Current cursor position in bytes from the start of the stream
     */
    virtual uint64_t GetPosition() const = 0;

    /**
     * Move the cursor. Positions past the end are allowed; a subsequent
     * read returns 0 and a subsequent write extends the stream.
     */
    virtual void SetPosition(uint64_t position) = 0;

    /**
     * Read up to count bytes at the cursor and advance it
     *
     * @param buffer Destination, at least count bytes long
     * @param count Maximum number of bytes to read
     * @return Number of bytes actually read (0 means end of data)
     */
    virtual size_t Read(uint8_t* buffer, size_t count) = 0;

    /**
     * Write exactly count bytes at the cursor and advance it
     */
    virtual void Write(const uint8_t* buffer, size_t count) = 0;

    /**
     * Force buffered writes down to durable storage
     */
    virtual void Flush() = 0;

    /**
     * Total length of the stream in bytes
     */
    virtual uint64_t GetLength() const = 0;

    /**
     * Resize the stream. Growing zero-fills the new region.
     */
    virtual void SetLength(uint64_t length) = 0;

    /**
     * Access statistics, used to observe when the block layer actually
     * touches the medium
     */
    struct AccessStats {
        uint64_t reads = 0;
        uint64_t writes = 0;
        uint64_t flushes = 0;
        uint64_t bytes_read = 0;
        uint64_t bytes_written = 0;
    };

    virtual AccessStats GetAccessStats() const = 0;
    virtual void ResetAccessStats() = 0;

    /**
     * Short description for log lines (e.g. file path)
     */
    virtual std::string GetName() const = 0;
};

}  // namespace block_storage
