#include "node.hpp"
#include "session.hpp"
#include "capacity_accountant.hpp"
#include "upload_types.hpp"
#include "wire.hpp"
#include "chunkflow/tls.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace chunkflow {

namespace {

const uint32_t DEFAULT_MAX_LOAD = 20;
const double RESPONSE_TIME_ALPHA = 0.2;

// Fill the defaults a bare config leaves out
StorageNodeConfig with_defaults(StorageNodeConfig config) {
    if (config.account_id().empty()) config.set_account_id(config.id());
    if (config.max_load() == 0) config.set_max_load(DEFAULT_MAX_LOAD);
    if (config.max_chunk_size() == 0) config.set_max_chunk_size(4 * DEFAULT_CHUNK_SIZE);
    if (config.capacity_bytes() == 0) config.set_capacity_bytes(DEFAULT_ACCOUNT_MAX_BYTES);
    if (config.max_chunk_size() >= wire::MAX_FRAME_SIZE) {
        throw std::invalid_argument("max_chunk_size must stay below the frame limit");
    }
    return config;
}

}

StorageNode::StorageNode(boost::asio::io_context& io_context, const StorageNodeConfig& config)
    : io_context_(io_context),
      config_(with_defaults(config)),
      ssl_context_(ssl::context::tlsv12_server),
      store_(config_.data_dir(), config_.account_id(), config_.capacity_bytes())
{
    tls::configure_context(ssl_context_);
    if (!config_.cert_file().empty()) {
        tls::use_certificate_files(ssl_context_, config_.cert_file(), config_.key_file());
    } else {
        std::cout << "[Node] No certificate configured, using a self-signed one." << std::endl;
        tls::use_self_signed_certificate(ssl_context_, config_.id());
    }
}

void StorageNode::listen(unsigned short port) {
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_,
        tcp::endpoint(tcp::v4(), port));
    std::cout << "[Node] " << config_.id() << " listening on port " << get_port() << std::endl;
    do_accept();
}

void StorageNode::stop() {
    if (acceptor_) {
        boost::system::error_code ec;
        acceptor_->close(ec);
    }
    // Session::stop() erases from sessions_, so iterate over a copy
    auto sessions = sessions_;
    for (auto& session : sessions) {
        session->stop();
    }
}

unsigned short StorageNode::get_port() const {
    return acceptor_ ? acceptor_->local_endpoint().port() : 0;
}

UploadChunkResponse StorageNode::handle_upload(const UploadChunkRequest& request) {
    auto started = std::chrono::steady_clock::now();
    UploadChunkResponse response;
    response.set_account_id(store_.account_id());

    if (!active_) {
        response.set_error("Node is not accepting uploads");
    } else if (request.data().size() > config_.max_chunk_size()) {
        response.set_error("Chunk exceeds max_chunk_size");
    } else if (request.total_chunks() > 0 && request.chunk_index() >= request.total_chunks()) {
        response.set_error("Chunk index out of range");
    } else {
        try {
            std::string locator = store_.put(request.file_id(), request.chunk_index(),
                                             request.data(), request.chunk_checksum());
            response.set_success(true);
            response.set_storage_locator(locator);
        } catch (const std::exception& e) {
            response.set_error(e.what());
        }
    }

    double elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - started).count();
    response_time_ms_ = uploads_handled_ == 0
        ? elapsed
        : RESPONSE_TIME_ALPHA * elapsed + (1.0 - RESPONSE_TIME_ALPHA) * response_time_ms_;
    ++uploads_handled_;
    if (response.success()) {
        ++uploads_succeeded_;
        std::cout << "[Node] Stored chunk " << request.chunk_index() << " of "
                  << request.file_name() << " as " << response.storage_locator() << std::endl;
    } else {
        std::cerr << "[Node] Rejected chunk " << request.chunk_index() << " of "
                  << request.file_name() << ": " << response.error() << std::endl;
    }
    return response;
}

StatusResponse StorageNode::status() const {
    StatusResponse status;
    status.set_active(active_);
    // The connection asking for status is not load
    status.set_current_load(sessions_.empty() ? 0 : static_cast<uint32_t>(sessions_.size() - 1));
    status.set_max_load(config_.max_load());
    status.set_response_time_ms(response_time_ms_);
    status.set_success_rate(uploads_handled_ == 0
        ? 1.0
        : static_cast<double>(uploads_succeeded_) / static_cast<double>(uploads_handled_));
    status.set_region(config_.region());
    status.set_account_id(store_.account_id());

    auto* capabilities = status.mutable_capabilities();
    capabilities->set_max_chunk_size(config_.max_chunk_size());
    capabilities->set_free_space(store_.free_space());
    capabilities->add_supported_formats("*/*");
    capabilities->set_storage_accounts(1);
    return status;
}

void StorageNode::do_accept() {
    acceptor_->async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == boost::asio::error::operation_aborted) {
                return; // Acceptor closed
            }
            if (ec) {
                std::cerr << "[Node] Accept error: " << ec.message() << std::endl;
            } else {
                auto session = std::make_shared<Session>(std::move(socket), *this);
                sessions_.insert(session);
                session->start();
            }
            do_accept();
        });
}

void StorageNode::remove_session(std::shared_ptr<Session> session) {
    sessions_.erase(session);
}

}
