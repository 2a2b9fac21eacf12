#include "session.hpp"
#include "node.hpp"
#include <iostream>

namespace chunkflow {

Session::Session(tcp::socket socket, StorageNode& node)
    : socket_(std::move(socket), node.get_ssl_context()),
      node_(node) {}

void Session::start() {
    // Start the SSL handshake
    do_handshake();
}

void Session::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;

    if (socket_.lowest_layer().is_open()) {
        boost::system::error_code ec;
        socket_.lowest_layer().close(ec);
    }

    // Remove ourselves from the active session list in the node
    node_.remove_session(shared_from_this());
}

void Session::do_handshake() {
    auto self(shared_from_this());
    socket_.async_handshake(ssl::stream_base::server,
        [this, self](const boost::system::error_code& ec) {
            if (ec) {
                std::cerr << "[Node] SSL Handshake failed: " << ec.message() << std::endl;
                stop();
                return;
            }
            do_read_header();
        });
}

void Session::do_read_header() {
    auto self(shared_from_this());
    boost::asio::async_read(socket_, boost::asio::buffer(header_),
        [this, self](boost::system::error_code ec, std::size_t /*length*/) {
            if (ec) {
                if (ec != boost::asio::error::eof && ec != ssl::error::stream_truncated) {
                    std::cerr << "[Node] Read error: " << ec.message() << std::endl;
                }
                stop();
                return;
            }
            uint32_t length = wire::decode_length(header_);
            if (length > wire::MAX_FRAME_SIZE) {
                std::cerr << "[Node] Rejecting frame of " << length << " bytes" << std::endl;
                stop();
                return;
            }
            do_read_body(length);
        });
}

void Session::do_read_body(uint32_t length) {
    auto self(shared_from_this());
    read_buffer_.resize(length);
    boost::asio::async_read(socket_, boost::asio::buffer(read_buffer_),
        [this, self](boost::system::error_code ec, std::size_t length) {
            if (ec) {
                std::cerr << "[Node] Read error: " << ec.message() << std::endl;
                stop();
                return;
            }
            MessageWrapper msg;
            if (!msg.ParseFromArray(read_buffer_.data(), static_cast<int>(length))) {
                std::cerr << "[Node] Failed to parse message." << std::endl;
                stop();
                return;
            }
            handle_message(msg);
        });
}

void Session::handle_message(const MessageWrapper& msg) {
    MessageWrapper response;
    if (msg.has_upload_chunk_req()) {
        *response.mutable_upload_chunk_res() = node_.handle_upload(msg.upload_chunk_req());
    } else if (msg.has_status_req()) {
        *response.mutable_status_res() = node_.status();
    } else {
        std::cerr << "[Node] Unsupported message, closing connection." << std::endl;
        stop();
        return;
    }
    do_write(response);
}

void Session::do_write(const MessageWrapper& msg) {
    auto self(shared_from_this());
    // Use a shared_ptr for the buffer so it lives until the write is complete
    auto serialized_msg = std::make_shared<std::string>(wire::encode_frame(msg));

    boost::asio::async_write(socket_, boost::asio::buffer(*serialized_msg),
        [this, self, serialized_msg](boost::system::error_code ec, std::size_t /*length*/) {
            if (ec) {
                std::cerr << "[Node] Write error: " << ec.message() << std::endl;
                stop(); // Stop the session on a write error
                return;
            }
            do_read_header(); // Wait for the next request
        });
}

}
