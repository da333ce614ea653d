#include <iostream>
#include <cassert>
#include <cstdint>
#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include "block_service/block.grpc.pb.h"
#include "block_storage/block_service.hpp"
#include "block_storage/memory_stream.hpp"

using block_storage::BlockServiceImpl;
using block_storage::BlockStorage;
using block_storage::MemoryStream;

// In-process server around a memory-backed storage (block 8192, header 48)
struct TestServer {
    std::unique_ptr<BlockServiceImpl> service;
    std::unique_ptr<grpc::Server> server;
    std::unique_ptr<BlockService::Stub> stub;

    TestServer() {
        auto storage = std::make_unique<BlockStorage>(std::make_unique<MemoryStream>(), 8192, 48);
        service = std::make_unique<BlockServiceImpl>(std::move(storage));

        grpc::ServerBuilder builder;
        builder.RegisterService(service.get());
        server = builder.BuildAndStart();
        assert(server && "Server should start");

        stub = BlockService::NewStub(server->InProcessChannel(grpc::ChannelArguments()));
    }

    ~TestServer() {
        server->Shutdown();
    }

    uint64_t CreateBlock() {
        CreateBlockRequest request;
        CreateBlockResponse response;
        grpc::ClientContext context;
        grpc::Status status = stub->CreateBlock(&context, request, &response);
        assert(status.ok() && response.success() && "CreateBlock should succeed");
        return response.block_id();
    }
};

// ============================================================================
// Test 1: Geometry and allocation
// ============================================================================
void test_geometry_and_create() {
    std::cout << "\n=== Test 1: Geometry and CreateBlock ===" << std::endl;

    TestServer server;

    GeometryRequest request;
    GeometryResponse response;
    grpc::ClientContext context;
    grpc::Status status = server.stub->GetGeometry(&context, request, &response);
    assert(status.ok() && "GetGeometry should succeed");
    assert(response.block_size() == 8192 && response.header_size() == 48 && "Sizes");
    assert(response.data_size() == 8144 && response.sector_size() == 4096 && "Derived sizes");
    assert(response.block_count() == 0 && "No blocks yet");

    assert(server.CreateBlock() == 0 && "First block id is 0");
    assert(server.CreateBlock() == 1 && "Second block id is 1");

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 2: Header and data round trip over RPC
// ============================================================================
void test_header_and_data_round_trip() {
    std::cout << "\n=== Test 2: Header and data round trip ===" << std::endl;

    TestServer server;
    uint64_t block_id = server.CreateBlock();

    {
        SetHeaderRequest request;
        request.set_block_id(block_id);
        request.set_field(3);
        request.set_value(-12345);
        StatusResponse response;
        grpc::ClientContext context;
        grpc::Status status = server.stub->SetHeader(&context, request, &response);
        assert(status.ok() && response.success() && "SetHeader should succeed");
    }

    {
        GetHeaderRequest request;
        request.set_block_id(block_id);
        request.set_field(3);
        GetHeaderResponse response;
        grpc::ClientContext context;
        grpc::Status status = server.stub->GetHeader(&context, request, &response);
        assert(status.ok() && response.success() && "GetHeader should succeed");
        assert(response.value() == -12345 && "Header value should round trip");
    }

    // Payload straddling the cached sector
    std::string payload;
    for (int i = 0; i < 500; i++) {
        payload.push_back(static_cast<char>(i % 251));
    }

    {
        WriteDataRequest request;
        request.set_block_id(block_id);
        request.set_offset(3800);
        request.set_data(payload);
        StatusResponse response;
        grpc::ClientContext context;
        grpc::Status status = server.stub->WriteData(&context, request, &response);
        assert(status.ok() && response.success() && "WriteData should succeed");
    }

    {
        ReadDataRequest request;
        request.set_block_id(block_id);
        request.set_offset(3800);
        request.set_length(static_cast<uint32_t>(payload.size()));
        ReadDataResponse response;
        grpc::ClientContext context;
        grpc::Status status = server.stub->ReadData(&context, request, &response);
        assert(status.ok() && response.success() && "ReadData should succeed");
        assert(response.data() == payload && "Data should round trip");
    }

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Test 3: Errors come back as success=false
// ============================================================================
void test_error_responses() {
    std::cout << "\n=== Test 3: Error responses ===" << std::endl;

    TestServer server;
    uint64_t block_id = server.CreateBlock();

    {
        GetHeaderRequest request;
        request.set_block_id(42);
        request.set_field(0);
        GetHeaderResponse response;
        grpc::ClientContext context;
        grpc::Status status = server.stub->GetHeader(&context, request, &response);
        assert(status.ok() && !response.success() && "Unknown block should fail");
        std::cout << "  Unknown block: " << response.error() << std::endl;
    }

    {
        SetHeaderRequest request;
        request.set_block_id(block_id);
        request.set_field(6);  // 48-byte header has fields 0..5
        request.set_value(1);
        StatusResponse response;
        grpc::ClientContext context;
        grpc::Status status = server.stub->SetHeader(&context, request, &response);
        assert(status.ok() && !response.success() && "Field out of range should fail");
        std::cout << "  Bad field: " << response.error() << std::endl;
    }

    {
        ReadDataRequest request;
        request.set_block_id(block_id);
        request.set_offset(8000);
        request.set_length(200);
        ReadDataResponse response;
        grpc::ClientContext context;
        grpc::Status status = server.stub->ReadData(&context, request, &response);
        assert(status.ok() && !response.success() && "Read past data region should fail");
        std::cout << "  Bad range: " << response.error() << std::endl;
    }

    {
        // Oversized length is rejected before any buffer is allocated
        ReadDataRequest request;
        request.set_block_id(block_id);
        request.set_offset(0);
        request.set_length(UINT32_MAX);
        ReadDataResponse response;
        grpc::ClientContext context;
        grpc::Status status = server.stub->ReadData(&context, request, &response);
        assert(status.ok() && !response.success() && "Huge read length should fail");
        assert(response.data().empty() && "No data returned for a rejected range");
        std::cout << "  Huge length: " << response.error() << std::endl;
    }

    {
        WriteDataRequest request;
        request.set_block_id(7);
        request.set_offset(0);
        request.set_data("abc");
        StatusResponse response;
        grpc::ClientContext context;
        grpc::Status status = server.stub->WriteData(&context, request, &response);
        assert(status.ok() && !response.success() && "Write to unknown block should fail");
    }

    std::string stats = server.service->GetStatistics();
    assert(stats.find("Total Requests: 6") != std::string::npos && "Every RPC is counted");
    assert(stats.find("Open Blocks: 0") != std::string::npos && "Every RPC releases its block");

    std::cout << "  PASSED!" << std::endl;
}

// ============================================================================
// Main
// ============================================================================
int main() {
    std::cout << "\n======================================" << std::endl;
    std::cout << "  BlockService Tests" << std::endl;
    std::cout << "======================================" << std::endl;

    try {
        test_geometry_and_create();
        test_header_and_data_round_trip();
        test_error_responses();

        std::cout << "\n======================================" << std::endl;
        std::cout << "  All tests PASSED!" << std::endl;
        std::cout << "======================================\n" << std::endl;

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n!!! TEST FAILED with exception: " << e.what() << std::endl;
        return 1;
    }
}
