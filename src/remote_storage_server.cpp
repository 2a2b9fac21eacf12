#include "remote_storage_server.hpp"
#include "chunkflow/tls.hpp"
#include "wire.hpp"
#include <iostream>
#include <memory>
#include <vector>

namespace chunkflow {

RemoteStorageServer::RemoteStorageServer(std::string id, std::string host, unsigned short port,
                                         std::chrono::milliseconds request_timeout,
                                         std::chrono::milliseconds status_timeout)
    : id_(std::move(id)),
      host_(std::move(host)),
      port_(port),
      request_timeout_(request_timeout),
      status_timeout_(status_timeout),
      ssl_context_(ssl::context::tls_client) {
    tls::configure_context(ssl_context_);
}

std::string RemoteStorageServer::endpoint() const {
    return host_ + ":" + std::to_string(port_);
}

bool RemoteStorageServer::exchange(const MessageWrapper& request, MessageWrapper& response,
                                   std::chrono::milliseconds timeout, std::string& error) {
    boost::asio::io_context io_context;
    tcp::resolver resolver(io_context);
    ssl::stream<tcp::socket> stream(io_context, ssl_context_);

    // Use a shared_ptr for the buffer so it lives until the write is complete
    std::shared_ptr<std::string> frame;
    try {
        frame = std::make_shared<std::string>(wire::encode_frame(request));
    } catch (const std::exception& e) {
        error = endpoint() + ": " + e.what();
        return false;
    }
    wire::Header header{};
    std::vector<uint8_t> body;
    boost::system::error_code result;
    bool done = false;

    auto finish = [&](const boost::system::error_code& ec) {
        result = ec;
        done = true;
    };

    resolver.async_resolve(host_, std::to_string(port_),
        [&](const boost::system::error_code& ec, tcp::resolver::results_type endpoints) {
            if (ec) return finish(ec);
            boost::asio::async_connect(stream.lowest_layer(), endpoints,
                [&](const boost::system::error_code& ec, const tcp::endpoint&) {
                    if (ec) return finish(ec);
                    stream.async_handshake(ssl::stream_base::client,
                        [&](const boost::system::error_code& ec) {
                            if (ec) return finish(ec);
                            boost::asio::async_write(stream, boost::asio::buffer(*frame),
                                [&](const boost::system::error_code& ec, std::size_t) {
                                    if (ec) return finish(ec);
                                    boost::asio::async_read(stream, boost::asio::buffer(header),
                                        [&](const boost::system::error_code& ec, std::size_t) {
                                            if (ec) return finish(ec);
                                            uint32_t length = wire::decode_length(header);
                                            if (length > wire::MAX_FRAME_SIZE) {
                                                return finish(boost::asio::error::message_size);
                                            }
                                            body.resize(length);
                                            boost::asio::async_read(stream, boost::asio::buffer(body),
                                                [&](const boost::system::error_code& ec, std::size_t) {
                                                    finish(ec);
                                                });
                                        });
                                });
                        });
                });
        });

    io_context.run_for(timeout);

    if (!done) {
        // Abort outstanding operations and let their handlers drain
        boost::system::error_code ignored;
        resolver.cancel();
        stream.lowest_layer().close(ignored);
        io_context.restart();
        io_context.run();
        error = "request to " + endpoint() + " timed out after " + std::to_string(timeout.count()) + "ms";
        return false;
    }

    boost::system::error_code ignored;
    stream.lowest_layer().close(ignored);

    if (result) {
        error = endpoint() + ": " + result.message();
        return false;
    }
    if (!response.ParseFromArray(body.data(), static_cast<int>(body.size()))) {
        error = endpoint() + ": failed to parse response";
        return false;
    }
    return true;
}

ChunkUploadResult RemoteStorageServer::upload_chunk(const ChunkUploadRequest& request) {
    ChunkUploadResult result;
    if (!request.data) {
        result.error = "no chunk data";
        return result;
    }

    MessageWrapper msg;
    auto* upload = msg.mutable_upload_chunk_req();
    upload->set_data(request.data->data(), request.data->size());
    upload->set_chunk_index(request.chunk_index);
    upload->set_file_id(request.file_id);
    upload->set_file_name(request.file_name);
    upload->set_mime_type(request.mime_type);
    upload->set_total_chunks(request.total_chunks);
    upload->set_chunk_checksum(request.chunk_checksum);

    MessageWrapper response;
    std::string error;
    if (!exchange(msg, response, request_timeout_, error)) {
        result.error = error;
        return result;
    }
    if (!response.has_upload_chunk_res()) {
        result.error = endpoint() + ": unexpected response to upload";
        return result;
    }

    const auto& res = response.upload_chunk_res();
    result.success = res.success();
    result.storage_locator = res.storage_locator();
    result.account_id = res.account_id();
    result.error = res.error();
    if (result.success && result.storage_locator.empty()) {
        result.success = false;
        result.error = endpoint() + ": upload acknowledged without a storage locator";
    }
    return result;
}

std::optional<ServerStatus> RemoteStorageServer::get_status() {
    MessageWrapper msg;
    msg.mutable_status_req();

    MessageWrapper response;
    std::string error;
    if (!exchange(msg, response, status_timeout_, error)) {
        std::cerr << "[Remote] Status of " << id_ << " unavailable: " << error << std::endl;
        return std::nullopt;
    }
    if (!response.has_status_res()) {
        std::cerr << "[Remote] Unexpected status response from " << id_ << std::endl;
        return std::nullopt;
    }

    const auto& res = response.status_res();
    ServerStatus status;
    status.active = res.active();
    status.current_load = res.current_load();
    status.max_load = res.max_load();
    status.capabilities.max_chunk_size = res.capabilities().max_chunk_size();
    status.capabilities.free_space = res.capabilities().free_space();
    status.capabilities.supported_formats.assign(res.capabilities().supported_formats().begin(),
                                                 res.capabilities().supported_formats().end());
    status.capabilities.storage_accounts = res.capabilities().storage_accounts();
    status.response_time_ms = res.response_time_ms();
    status.success_rate = res.success_rate();
    status.region = res.region();
    status.account_id = res.account_id();
    return status;
}

}
