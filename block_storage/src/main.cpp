#include "block_storage/block_service.hpp"
#include "block_storage/file_stream.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <signal.h>
#include <thread>
#include <chrono>
#include <atomic>

static std::unique_ptr<grpc::Server> g_server;
static std::atomic<bool> g_shutdown_requested(false);

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested.store(true);
    }
}

int main(int argc, char* argv[]) {
    // Parse command line arguments
    std::string file_path = "./blocks.db";
    std::string server_address = "0.0.0.0:50061";
    uint32_t block_size = block_storage::kDefaultBlockSize;
    uint32_t header_size = block_storage::kDefaultHeaderSize;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        try {
            if (arg == "--file" && i + 1 < argc) {
                file_path = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                server_address = "0.0.0.0:" + std::string(argv[++i]);
            } else if (arg == "--block-size" && i + 1 < argc) {
                block_size = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--header-size" && i + 1 < argc) {
                header_size = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: block_server [options]" << std::endl
                          << "Options:" << std::endl
                          << "  --file <path>          Backing file (default: ./blocks.db)" << std::endl
                          << "  --port <port>          Server port (default: 50061)" << std::endl
                          << "  --block-size <bytes>   Block size, >= 128 (default: 4096)" << std::endl
                          << "  --header-size <bytes>  Header size per block (default: 48)" << std::endl
                          << "  --help                 Show this help message" << std::endl;
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << " (see --help)" << std::endl;
                return 1;
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid value for " << arg << ": " << e.what() << std::endl;
            return 1;
        }
    }

    std::cout << "================================" << std::endl
              << "  Block Storage Server" << std::endl
              << "================================" << std::endl
              << "Backing File: " << file_path << std::endl
              << "Server Address: " << server_address << std::endl
              << "Block Size: " << block_size << std::endl
              << "Header Size: " << header_size << std::endl
              << std::endl;

    std::unique_ptr<block_storage::BlockServiceImpl> service;
    try {
        auto stream = std::make_unique<block_storage::FileStream>(file_path);
        auto storage = std::make_unique<block_storage::BlockStorage>(
            std::move(stream), block_size, header_size);
        service = std::make_unique<block_storage::BlockServiceImpl>(std::move(storage));
    } catch (const std::exception& e) {
        std::cerr << "Failed to open block storage: " << e.what() << std::endl;
        return 1;
    }

    // Build and start server
    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());

    g_server = builder.BuildAndStart();

    if (!g_server) {
        std::cerr << "Failed to start server!" << std::endl;
        return 1;
    }

    std::cout << "BlockServer listening on " << server_address << std::endl;
    std::cout << "Press Ctrl+C to shutdown..." << std::endl << std::endl;

    // Setup signal handlers
    signal(SIGINT, SignalHandler);
    signal(SIGTERM, SignalHandler);

    // Server::Shutdown is not async-signal-safe; the watcher calls it instead
    std::thread shutdown_thread([&service]() {
        int ticks = 0;
        while (!g_shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            if (++ticks % 300 == 0) {
                try {
                    std::cout << "\n" << service->GetStatistics() << std::endl;
                } catch (const std::exception& e) {
                    std::cerr << "Failed to collect statistics: " << e.what() << std::endl;
                }
            }
        }
        std::cout << "\nShutting down server..." << std::endl;
        g_server->Shutdown();
    });

    // Wait for server shutdown
    g_server->Wait();
    shutdown_thread.join();

    try {
        std::cout << service->GetStatistics() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Failed to collect statistics: " << e.what() << std::endl;
    }
    std::cout << "Server shutdown complete." << std::endl;

    return 0;
}
