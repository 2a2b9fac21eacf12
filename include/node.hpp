#pragma once

#include "chunk_store.hpp"
#include "chunkflow.pb.h"
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <string>
#include <memory>
#include <unordered_set>

namespace chunkflow {

namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

class Session; // Forward declaration

// Upload server: accepts TLS connections, stores chunks for one storage
// account and reports its status. All handlers run on the given io_context.
class StorageNode {
public:
    StorageNode(boost::asio::io_context& io_context, const StorageNodeConfig& config);

    // Port 0 binds an ephemeral port, see get_port()
    void listen(unsigned short port);
    void stop();

    // --- Request handling ---
    UploadChunkResponse handle_upload(const UploadChunkRequest& request);
    StatusResponse status() const;

    // Inactive nodes refuse uploads and report active = false
    void set_active(bool active) { active_ = active; }

    // --- Getters ---
    const std::string& get_node_id() const { return config_.id(); }
    unsigned short get_port() const;
    ssl::context& get_ssl_context() { return ssl_context_; }
    const ChunkStore& get_store() const { return store_; }

private:
    void do_accept();
    void remove_session(std::shared_ptr<Session> session);

    boost::asio::io_context& io_context_;
    StorageNodeConfig config_;
    ssl::context ssl_context_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    ChunkStore store_;
    bool active_ = true;

    // Connections currently open; this is the load the node reports
    std::unordered_set<std::shared_ptr<Session>> sessions_;

    uint64_t uploads_handled_ = 0;
    uint64_t uploads_succeeded_ = 0;
    double response_time_ms_ = 0.0;

    friend class Session; // Give Session access to remove_session
};

} // namespace chunkflow
