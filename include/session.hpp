#pragma once

#include "chunkflow.pb.h"
#include "wire.hpp"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <vector>

namespace chunkflow {

namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

class StorageNode; // Forward declaration

// Server side of one client connection: reads request frames and answers
// each with exactly one response frame until the peer disconnects
class Session : public std::enable_shared_from_this<Session> {
public:
    // Takes a raw socket and wraps it in an ssl::stream
    Session(tcp::socket socket, StorageNode& node);

    void start();
    void stop();

private:
    void do_handshake();
    void do_read_header();
    void do_read_body(uint32_t length);
    void handle_message(const MessageWrapper& msg);
    void do_write(const MessageWrapper& msg);

    ssl::stream<tcp::socket> socket_;
    wire::Header header_{};
    std::vector<uint8_t> read_buffer_;
    StorageNode& node_;
    bool stopped_ = false;
};

}
