#pragma once

#include "block_service/block.grpc.pb.h"
#include "block_storage/block_storage.hpp"
#include <grpcpp/grpcpp.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace block_storage {

/**
 * BlockServiceImpl: gRPC service exposing one BlockStorage
 *
 * The block layer itself is single-threaded; gRPC dispatches RPCs on a
 * thread pool. This service is the layer that serializes access: a single
 * mutex guards the storage, its registry and every block operation.
 *
 * Each RPC:
 *   1. Locks storage_mutex_
 *   2. Opens the block through a scoped BlockHandle
 *   3. Performs one operation
 *   4. Releases the handle (first sector flushed) before replying
 *
 * Errors (unknown block, bad field, out-of-range bytes, I/O failure) are
 * reported as success=false with a message; the transport status stays OK.
 *
 * Usage:
 *   auto service = std::make_unique<BlockServiceImpl>(std::move(storage));
 *   grpc::ServerBuilder builder;
 *   builder.AddListeningPort("0.0.0.0:50061", grpc::InsecureServerCredentials());
 *   builder.RegisterService(service.get());
 *   auto server = builder.BuildAndStart();
 */
class BlockServiceImpl final : public BlockService::Service {
public:
    explicit BlockServiceImpl(std::unique_ptr<BlockStorage> storage);

    grpc::Status GetGeometry(grpc::ServerContext* context,
                             const GeometryRequest* request,
                             GeometryResponse* response) override;

    /**
     * CreateBlock RPC: Allocate a new zero-filled block at the end of the stream
     */
    grpc::Status CreateBlock(grpc::ServerContext* context,
                             const CreateBlockRequest* request,
                             CreateBlockResponse* response) override;

    grpc::Status GetHeader(grpc::ServerContext* context,
                           const GetHeaderRequest* request,
                           GetHeaderResponse* response) override;

    grpc::Status SetHeader(grpc::ServerContext* context,
                           const SetHeaderRequest* request,
                           StatusResponse* response) override;

    /**
     * ReadData RPC: Read length bytes at offset of the block's data region
     */
    grpc::Status ReadData(grpc::ServerContext* context,
                          const ReadDataRequest* request,
                          ReadDataResponse* response) override;

    /**
     * WriteData RPC: Write the request bytes at offset of the block's data region
     */
    grpc::Status WriteData(grpc::ServerContext* context,
                           const WriteDataRequest* request,
                           StatusResponse* response) override;

    /**
     * Get statistics about this server
     */
    std::string GetStatistics();

private:
    std::unique_ptr<BlockStorage> storage_;
    std::mutex storage_mutex_;
    uint64_t request_count_ = 0;  // guarded by storage_mutex_

    /**
     * Open a block for one RPC; empty handle if it does not exist
     * Caller must hold storage_mutex_
     */
    BlockHandle OpenBlock(uint64_t block_id, std::string& error);
};

}  // namespace block_storage
