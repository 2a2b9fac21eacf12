#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkflow {

struct ServerCapabilities {
    uint64_t max_chunk_size = 0;
    uint64_t free_space = 0;
    std::vector<std::string> supported_formats;
    uint32_t storage_accounts = 0;
};

// Self-reported server status
struct ServerStatus {
    bool active = false;
    uint32_t current_load = 0;
    uint32_t max_load = 0;
    ServerCapabilities capabilities;
    double response_time_ms = 0.0;
    double success_rate = 1.0;
    std::string region;
    std::string account_id;
};

struct ChunkUploadRequest {
    const std::vector<uint8_t>* data = nullptr;
    uint32_t chunk_index = 0;
    std::string file_id;
    std::string file_name;
    std::string mime_type;
    uint32_t total_chunks = 0;
    std::string chunk_checksum;
};

struct ChunkUploadResult {
    bool success = false;
    std::string storage_locator;
    std::string account_id;
    std::string error;
};

// Outbound interface to one upload server. Implementations must be callable
// from several worker threads at once.
class StorageServer {
public:
    virtual ~StorageServer() = default;

    virtual const std::string& id() const = 0;
    virtual std::string endpoint() const = 0;

    // Transport failures are reported in the result, never thrown
    virtual ChunkUploadResult upload_chunk(const ChunkUploadRequest& request) = 0;

    // nullopt when the server cannot be reached
    virtual std::optional<ServerStatus> get_status() = 0;
};

}
