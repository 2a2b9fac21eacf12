#pragma once

#include "storage_server.hpp"
#include "chunkflow.pb.h"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <chrono>
#include <string>

namespace chunkflow {

namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

// Talks to a storage node over TLS. Each call opens its own connection and
// runs on a private io_context bounded by the request timeout, so calls from
// different worker threads do not interfere.
class RemoteStorageServer : public StorageServer {
public:
    RemoteStorageServer(std::string id, std::string host, unsigned short port,
                        std::chrono::milliseconds request_timeout,
                        std::chrono::milliseconds status_timeout = std::chrono::seconds(5));

    const std::string& id() const override { return id_; }
    std::string endpoint() const override;

    ChunkUploadResult upload_chunk(const ChunkUploadRequest& request) override;
    std::optional<ServerStatus> get_status() override;

private:
    // Sends one request frame and reads one response frame
    bool exchange(const MessageWrapper& request, MessageWrapper& response,
                  std::chrono::milliseconds timeout, std::string& error);

    std::string id_;
    std::string host_;
    unsigned short port_;
    std::chrono::milliseconds request_timeout_;
    std::chrono::milliseconds status_timeout_;
    ssl::context ssl_context_;
};

}
