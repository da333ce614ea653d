#include <iostream>
#include <cassert>
#include <filesystem>
#include <vector>
#include <string>
#include "block_storage/errors.hpp"
#include "block_storage/file_stream.hpp"
#include "block_storage/memory_stream.hpp"

namespace fs = std::filesystem;
using block_storage::FileStream;
using block_storage::MemoryStream;

// ============================================================================
// Test 1: MemoryStream write, seek and read back
// ============================================================================
void test_memory_stream_write_read() {
    std::cout << "\n=== Test 1: MemoryStream write/read ===" << std::endl;

    MemoryStream stream;
    std::vector<uint8_t> data = {1, 2, 3, 4, 5, 6, 7, 8};
    stream.Write(data.data(), data.size());
    assert(stream.GetLength() == 8 && "Write should extend the stream");
    assert(stream.GetPosition() == 8 && "Write should advance the cursor");

    stream.SetPosition(2);
    std::vector<uint8_t> out(4);
    size_t n = stream.Read(out.data(), out.size());
    assert(n == 4 && "Read should return requested count");
    assert(out == std::vector<uint8_t>({3, 4, 5, 6}) && "Read data should match");

    // Reading at the end returns 0
    stream.SetPosition(8);
    assert(stream.Read(out.data(), out.size()) == 0 && "Read at end should return 0");

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 2: MemoryStream honours the per-read limit
// ============================================================================
void test_memory_stream_short_reads() {
    std::cout << "\n=== Test 2: MemoryStream short reads ===" << std::endl;

    MemoryStream stream(3);
    std::vector<uint8_t> data(10, 0xAB);
    stream.Write(data.data(), data.size());
    stream.SetPosition(0);

    std::vector<uint8_t> out(10);
    size_t n = stream.Read(out.data(), out.size());
    assert(n == 3 && "Read should be capped at max_read_size");
    assert(stream.GetPosition() == 3 && "Cursor should advance by bytes read");

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 3: SetLength zero-fills and stats track traffic
// ============================================================================
void test_memory_stream_set_length_and_stats() {
    std::cout << "\n=== Test 3: MemoryStream SetLength and stats ===" << std::endl;

    MemoryStream stream;
    stream.SetLength(256);
    assert(stream.GetLength() == 256 && "SetLength should grow the stream");
    for (uint8_t b : stream.data()) {
        assert(b == 0 && "New region should be zero-filled");
    }

    std::vector<uint8_t> data(16, 7);
    stream.SetPosition(100);
    stream.Write(data.data(), data.size());
    stream.Flush();

    auto stats = stream.GetAccessStats();
    assert(stats.writes == 1 && stats.bytes_written == 16 && "Write should be counted");
    assert(stats.flushes == 1 && "Flush should be counted");

    stream.ResetAccessStats();
    stats = stream.GetAccessStats();
    assert(stats.writes == 0 && stats.flushes == 0 && "Stats should reset");

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 4: FileStream round trip and persistence across reopen
// ============================================================================
void test_file_stream_persistence() {
    std::cout << "\n=== Test 4: FileStream persistence ===" << std::endl;

    std::string test_dir = "/tmp/test_block_storage_streams";
    fs::remove_all(test_dir);
    fs::create_directories(test_dir);
    std::string path = test_dir + "/stream.db";

    std::vector<uint8_t> data = {'b', 'l', 'o', 'c', 'k'};
    {
        FileStream stream(path);
        assert(stream.GetLength() == 0 && "New file should be empty");

        stream.SetLength(4096);
        assert(stream.GetLength() == 4096 && "SetLength should grow the file");

        stream.SetPosition(1000);
        stream.Write(data.data(), data.size());
        stream.Flush();

        auto stats = stream.GetAccessStats();
        assert(stats.writes == 1 && stats.flushes == 1 && "Write and fsync should be counted");
    }

    {
        FileStream stream(path);
        assert(stream.GetLength() == 4096 && "Length should persist");

        std::vector<uint8_t> out(data.size());
        stream.SetPosition(1000);
        size_t n = stream.Read(out.data(), out.size());
        assert(n == data.size() && out == data && "Data should persist");

        std::vector<uint8_t> zeros(8);
        stream.SetPosition(0);
        stream.Read(zeros.data(), zeros.size());
        assert(zeros == std::vector<uint8_t>(8, 0) && "Grown region should read as zeros");

        stream.SetPosition(4096);
        assert(stream.Read(out.data(), out.size()) == 0 && "Read at EOF should return 0");
    }

    fs::remove_all(test_dir);
    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 5: FileStream reports open failures
// ============================================================================
void test_file_stream_open_failure() {
    std::cout << "\n=== Test 5: FileStream open failure ===" << std::endl;

    bool threw = false;
    try {
        FileStream stream("/nonexistent_dir_for_block_storage/stream.db");
    } catch (const block_storage::StreamError& e) {
        threw = true;
        std::cout << "  Got expected error: " << e.what() << std::endl;
    }
    assert(threw && "Opening in a missing directory should throw StreamError");

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Main
// ============================================================================
int main() {
    std::cout << "\n======================================" << std::endl;
    std::cout << "  Stream Tests" << std::endl;
    std::cout << "======================================" << std::endl;

    try {
        test_memory_stream_write_read();
        test_memory_stream_short_reads();
        test_memory_stream_set_length_and_stats();
        test_file_stream_persistence();
        test_file_stream_open_failure();

        std::cout << "\n======================================" << std::endl;
        std::cout << "  All tests PASSED!" << std::endl;
        std::cout << "======================================\n" << std::endl;

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n!!! TEST FAILED with exception: " << e.what() << std::endl;
        return 1;
    }
}
