#pragma once

#include "upload_types.hpp"
#include "chunkflow.pb.h"
#include <chrono>
#include <cstdint>
#include <string>

namespace chunkflow {

// Tunables of the upload orchestrator
struct UploadSettings {
    uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
    uint32_t max_in_flight = 20;
    std::chrono::milliseconds selection_timeout{30000};
    std::chrono::milliseconds poll_interval{2000};
    uint32_t max_attempts = 3;
    // Backoff before retry n is n * backoff_step
    std::chrono::milliseconds backoff_step{1000};
    std::chrono::milliseconds request_timeout{5 * 60 * 1000};
    std::string preferred_region;
};

// Parse a text-format UploaderConfig. Throws std::runtime_error.
UploaderConfig load_uploader_config(const std::string& path);
StorageNodeConfig load_node_config(const std::string& path);

// Zero / empty fields fall back to the defaults above
UploadSettings settings_from_config(const UploaderConfig& config);

}
