#include "config.hpp"
#include "wire.hpp"
#include <google/protobuf/text_format.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace chunkflow {

namespace {

template <typename Message>
Message parse_text_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    Message message;
    if (!google::protobuf::TextFormat::ParseFromString(buffer.str(), &message)) {
        throw std::runtime_error("Malformed config file " + path);
    }
    return message;
}

}

UploaderConfig load_uploader_config(const std::string& path) {
    UploaderConfig config = parse_text_file<UploaderConfig>(path);
    for (const auto& server : config.servers()) {
        if (server.id().empty() || server.host().empty() || server.port() == 0 || server.port() > 65535) {
            throw std::runtime_error("Server entries need id, host and a valid port in " + path);
        }
    }
    return config;
}

StorageNodeConfig load_node_config(const std::string& path) {
    StorageNodeConfig config = parse_text_file<StorageNodeConfig>(path);
    if (config.id().empty() || config.data_dir().empty()) {
        throw std::runtime_error("Storage node config needs id and data_dir in " + path);
    }
    return config;
}

UploadSettings settings_from_config(const UploaderConfig& config) {
    UploadSettings settings;
    if (config.chunk_size() > 0) settings.chunk_size = config.chunk_size();
    if (settings.chunk_size >= wire::MAX_FRAME_SIZE) {
        throw std::invalid_argument("chunk_size " + std::to_string(settings.chunk_size) +
                                    " does not fit in a " + std::to_string(wire::MAX_FRAME_SIZE) + " byte frame");
    }
    if (config.max_in_flight() > 0) settings.max_in_flight = config.max_in_flight();
    if (config.selection_timeout_ms() > 0) {
        settings.selection_timeout = std::chrono::milliseconds(config.selection_timeout_ms());
    }
    if (config.poll_interval_ms() > 0) {
        settings.poll_interval = std::chrono::milliseconds(config.poll_interval_ms());
    }
    if (config.max_attempts() > 0) settings.max_attempts = config.max_attempts();
    if (config.backoff_step_ms() > 0) {
        settings.backoff_step = std::chrono::milliseconds(config.backoff_step_ms());
    }
    if (config.request_timeout_ms() > 0) {
        settings.request_timeout = std::chrono::milliseconds(config.request_timeout_ms());
    }
    settings.preferred_region = config.preferred_region();
    return settings;
}

}
