#include "block_storage/block_service.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace block_storage {

BlockServiceImpl::BlockServiceImpl(std::unique_ptr<BlockStorage> storage)
    : storage_(std::move(storage)) {
    std::cout << "BlockService: Initialized (block_size=" << storage_->block_size()
              << ", header_size=" << storage_->header_size()
              << ", blocks=" << storage_->block_count() << ")" << std::endl;
}

BlockHandle BlockServiceImpl::OpenBlock(uint64_t block_id, std::string& error) {
    BlockHandle block = storage_->Find(block_id);
    if (!block) {
        error = "Block not found: " + std::to_string(block_id);
        std::cerr << "BlockService: " << error << std::endl;
    }
    return block;
}

grpc::Status BlockServiceImpl::GetGeometry(grpc::ServerContext* context,
                                           const GeometryRequest* request,
                                           GeometryResponse* response) {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    request_count_++;

    response->set_block_size(storage_->block_size());
    response->set_header_size(storage_->header_size());
    response->set_data_size(storage_->data_size());
    response->set_sector_size(storage_->sector_size());
    try {
        response->set_block_count(storage_->block_count());
    } catch (const std::exception& e) {
        std::cerr << "BlockService: Exception reading stream length: " << e.what() << std::endl;
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
    return grpc::Status::OK;
}

grpc::Status BlockServiceImpl::CreateBlock(grpc::ServerContext* context,
                                           const CreateBlockRequest* request,
                                           CreateBlockResponse* response) {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    request_count_++;

    try {
        BlockHandle block = storage_->CreateNew();
        response->set_block_id(block->id());
        block.Release();
        response->set_success(true);
    } catch (const std::exception& e) {
        std::cerr << "BlockService: Exception creating block: " << e.what() << std::endl;
        response->set_success(false);
        response->set_error(e.what());
    }
    return grpc::Status::OK;
}

grpc::Status BlockServiceImpl::GetHeader(grpc::ServerContext* context,
                                         const GetHeaderRequest* request,
                                         GetHeaderResponse* response) {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    request_count_++;

    try {
        std::string error;
        BlockHandle block = OpenBlock(request->block_id(), error);
        if (!block) {
            response->set_success(false);
            response->set_error(error);
            return grpc::Status::OK;
        }
        response->set_value(block->GetHeader(request->field()));
        block.Release();
        response->set_success(true);
    } catch (const std::exception& e) {
        std::cerr << "BlockService: Exception reading header of block "
                  << request->block_id() << ": " << e.what() << std::endl;
        response->set_success(false);
        response->set_error(e.what());
    }
    return grpc::Status::OK;
}

grpc::Status BlockServiceImpl::SetHeader(grpc::ServerContext* context,
                                         const SetHeaderRequest* request,
                                         StatusResponse* response) {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    request_count_++;

    try {
        std::string error;
        BlockHandle block = OpenBlock(request->block_id(), error);
        if (!block) {
            response->set_success(false);
            response->set_error(error);
            return grpc::Status::OK;
        }
        block->SetHeader(request->field(), request->value());
        block.Release();
        response->set_success(true);
    } catch (const std::exception& e) {
        std::cerr << "BlockService: Exception setting header of block "
                  << request->block_id() << ": " << e.what() << std::endl;
        response->set_success(false);
        response->set_error(e.what());
    }
    return grpc::Status::OK;
}

grpc::Status BlockServiceImpl::ReadData(grpc::ServerContext* context,
                                        const ReadDataRequest* request,
                                        ReadDataResponse* response) {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    request_count_++;

    try {
        std::string error;
        BlockHandle block = OpenBlock(request->block_id(), error);
        if (!block) {
            response->set_success(false);
            response->set_error(error);
            return grpc::Status::OK;
        }

        // Validate before allocating; length is client-controlled
        uint64_t end = static_cast<uint64_t>(request->offset()) + request->length();
        if (end > storage_->data_size()) {
            response->set_success(false);
            response->set_error("Range [" + std::to_string(request->offset()) + ", "
                                + std::to_string(end) + ") exceeds data size "
                                + std::to_string(storage_->data_size()));
            return grpc::Status::OK;
        }

        std::vector<uint8_t> buffer(request->length());
        block->Read(buffer, 0, request->offset(), request->length());
        block.Release();

        response->set_data(reinterpret_cast<const char*>(buffer.data()), buffer.size());
        response->set_success(true);
    } catch (const std::exception& e) {
        std::cerr << "BlockService: Exception reading block " << request->block_id()
                  << ": " << e.what() << std::endl;
        response->set_success(false);
        response->set_error(e.what());
    }
    return grpc::Status::OK;
}

grpc::Status BlockServiceImpl::WriteData(grpc::ServerContext* context,
                                         const WriteDataRequest* request,
                                         StatusResponse* response) {
    std::lock_guard<std::mutex> lock(storage_mutex_);
    request_count_++;

    try {
        std::string error;
        BlockHandle block = OpenBlock(request->block_id(), error);
        if (!block) {
            response->set_success(false);
            response->set_error(error);
            return grpc::Status::OK;
        }

        const std::string& data = request->data();
        std::vector<uint8_t> buffer(data.begin(), data.end());
        block->Write(buffer, 0, request->offset(), buffer.size());
        block.Release();

        response->set_success(true);
    } catch (const std::exception& e) {
        std::cerr << "BlockService: Exception writing block " << request->block_id()
                  << ": " << e.what() << std::endl;
        response->set_success(false);
        response->set_error(e.what());
    }
    return grpc::Status::OK;
}

std::string BlockServiceImpl::GetStatistics() {
    std::lock_guard<std::mutex> lock(storage_mutex_);

    Stream::AccessStats stats = storage_->stream().GetAccessStats();

    std::stringstream ss;
    ss << "=== Block Server Statistics ===" << std::endl
       << "Stream: " << storage_->stream().GetName() << std::endl
       << "Total Blocks: " << storage_->block_count() << std::endl
       << "Open Blocks: " << storage_->open_block_count() << std::endl
       << "Stream Reads: " << stats.reads << " (" << stats.bytes_read << " bytes)" << std::endl
       << "Stream Writes: " << stats.writes << " (" << stats.bytes_written << " bytes)" << std::endl
       << "Stream Flushes: " << stats.flushes << std::endl
       << "Total Requests: " << request_count_ << std::endl;

    return ss.str();
}

}  // namespace block_storage
