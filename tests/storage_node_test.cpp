#include "node.hpp"
#include "orchestrator.hpp"
#include "remote_storage_server.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <thread>

using namespace chunkflow;

namespace {

StorageNodeConfig node_config(const std::string& id, const std::filesystem::path& dir) {
    StorageNodeConfig config;
    config.set_id(id);
    config.set_data_dir(dir.string());
    config.set_account_id(id + "-account");
    config.set_region("eu-west");
    config.set_max_load(8);
    config.set_capacity_bytes(64 * 1024 * 1024);
    return config;
}

// Storage node listening on an ephemeral loopback port, served by its own thread
class NodeHarness {
public:
    explicit NodeHarness(const StorageNodeConfig& config, bool active = true)
        : node(io_context, config) {
        node.set_active(active);
        node.listen(0);
        thread = std::thread([this]() { io_context.run(); });
    }

    ~NodeHarness() {
        boost::asio::post(io_context, [this]() { node.stop(); });
        thread.join();
    }

    std::shared_ptr<RemoteStorageServer> client(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        return std::make_shared<RemoteStorageServer>(node.get_node_id(), "127.0.0.1", node.get_port(),
                                                     timeout, timeout);
    }

    boost::asio::io_context io_context;
    StorageNode node;
    std::thread thread;
};

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

ChunkUploadRequest upload_request(const std::vector<uint8_t>& data, uint32_t index) {
    ChunkUploadRequest request;
    request.data = &data;
    request.chunk_index = index;
    request.file_id = std::string(64, 'f');
    request.file_name = "movie.mkv";
    request.mime_type = "video/x-matroska";
    request.total_chunks = 4;
    request.chunk_checksum = util::sha256_hex(data);
    return request;
}

}

TEST(StorageNodeTest, ReportsStatusOverTls) {
    test::TempDir dir;
    NodeHarness harness(node_config("node-a", dir.path()));

    auto status = harness.client()->get_status();
    ASSERT_TRUE(status);
    EXPECT_TRUE(status->active);
    EXPECT_EQ(status->current_load, 0u);
    EXPECT_EQ(status->max_load, 8u);
    EXPECT_EQ(status->region, "eu-west");
    EXPECT_EQ(status->account_id, "node-a-account");
    EXPECT_EQ(status->capabilities.free_space, 64u * 1024 * 1024);
    EXPECT_GE(status->capabilities.max_chunk_size, DEFAULT_CHUNK_SIZE);
    EXPECT_DOUBLE_EQ(status->success_rate, 1.0);
}

TEST(StorageNodeTest, StoresVerifiedChunks) {
    test::TempDir dir;
    NodeHarness harness(node_config("node-a", dir.path()));
    auto client = harness.client();

    auto data = bytes_of(test::make_payload(100 * 1024));
    ChunkUploadResult result = client->upload_chunk(upload_request(data, 2));

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.account_id, "node-a-account");
    EXPECT_EQ(result.storage_locator, "node-a-account/" + std::string(64, 'f') + "/2");

    auto stored = harness.node.get_store().get(result.storage_locator);
    ASSERT_TRUE(stored);
    EXPECT_EQ(*stored, std::string(data.begin(), data.end()));

    auto status = client->get_status();
    ASSERT_TRUE(status);
    EXPECT_EQ(status->capabilities.free_space, 64u * 1024 * 1024 - data.size());
}

TEST(StorageNodeTest, RejectsCorruptChunks) {
    test::TempDir dir;
    NodeHarness harness(node_config("node-a", dir.path()));

    auto data = bytes_of(test::make_payload(4096));
    ChunkUploadRequest request = upload_request(data, 0);
    request.chunk_checksum = std::string(64, '0');

    ChunkUploadResult result = harness.client()->upload_chunk(request);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("mismatch"), std::string::npos);
    EXPECT_EQ(harness.node.get_store().used_bytes(), 0u);
}

TEST(StorageNodeTest, RejectsUploadsBeyondCapacity) {
    test::TempDir dir;
    StorageNodeConfig config = node_config("node-a", dir.path());
    config.set_capacity_bytes(1000);
    NodeHarness harness(config);

    auto data = bytes_of(test::make_payload(1500));
    ChunkUploadResult result = harness.client()->upload_chunk(upload_request(data, 0));
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.empty());
}

TEST(StorageNodeTest, InactiveNodeRefusesUploads) {
    test::TempDir dir;
    NodeHarness harness(node_config("node-a", dir.path()), false);
    auto client = harness.client();

    auto status = client->get_status();
    ASSERT_TRUE(status);
    EXPECT_FALSE(status->active);

    auto data = bytes_of(test::make_payload(10));
    EXPECT_FALSE(client->upload_chunk(upload_request(data, 0)).success);
}

TEST(StorageNodeTest, ChunksSurviveRestart) {
    test::TempDir dir;
    std::string locator;
    auto data = bytes_of(test::make_payload(2048, 9));
    {
        NodeHarness harness(node_config("node-a", dir.path()));
        ChunkUploadResult result = harness.client()->upload_chunk(upload_request(data, 1));
        ASSERT_TRUE(result.success) << result.error;
        locator = result.storage_locator;
    }

    NodeHarness harness(node_config("node-a", dir.path()));
    EXPECT_EQ(harness.node.get_store().used_bytes(), data.size());
    auto stored = harness.node.get_store().get(locator);
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored->size(), data.size());
}

TEST(RemoteStorageServerTest, UnreachableServerHasNoStatus) {
    // Grab a free port and close it again
    boost::asio::io_context io_context;
    tcp::acceptor probe(io_context, tcp::endpoint(tcp::v4(), 0));
    unsigned short port = probe.local_endpoint().port();
    probe.close();

    RemoteStorageServer client("gone", "127.0.0.1", port, std::chrono::seconds(1), std::chrono::seconds(1));
    EXPECT_FALSE(client.get_status());

    std::vector<uint8_t> data(16, 1);
    ChunkUploadResult result = client.upload_chunk(upload_request(data, 0));
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.empty());
}

TEST(RemoteStorageServerTest, SilentServerTimesOut) {
    boost::asio::io_context io_context;
    tcp::acceptor acceptor(io_context, tcp::endpoint(tcp::v4(), 0));
    unsigned short port = acceptor.local_endpoint().port();
    tcp::socket held(io_context);
    // Accepts the connection but never answers the TLS handshake
    acceptor.async_accept(held, [](const boost::system::error_code&) {});
    std::thread server([&io_context]() { io_context.run_for(std::chrono::seconds(3)); });

    RemoteStorageServer client("silent", "127.0.0.1", port,
                               std::chrono::milliseconds(200), std::chrono::milliseconds(200));
    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(client.get_status());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));

    io_context.stop();
    server.join();
}

TEST(StorageNodeTest, OrchestratorUploadsThroughRealNodes) {
    test::TempDir dir_a;
    test::TempDir dir_b;
    NodeHarness node_a(node_config("node-a", dir_a.path()));
    NodeHarness node_b(node_config("node-b", dir_b.path()));

    UploadSettings settings;
    settings.chunk_size = 64 * 1024;
    settings.max_in_flight = 4;
    settings.selection_timeout = std::chrono::seconds(5);
    settings.poll_interval = std::chrono::milliseconds(50);
    settings.backoff_step = std::chrono::milliseconds(10);
    settings.request_timeout = std::chrono::seconds(5);

    ServerRegistry registry;
    registry.add_server(node_a.client());
    registry.add_server(node_b.client());
    registry.refresh();
    PartialUploadLedger ledger;
    CapacityAccountant accountant;
    ProgressReporter reporter;
    UploadOrchestrator orchestrator(settings, registry, ledger, accountant, reporter);

    std::string data = test::make_payload(300 * 1024, 21);
    std::istringstream input(data);
    UploadOutcome outcome = orchestrator.start_upload(input, "report.pdf", "application/pdf", data.size());

    ASSERT_EQ(outcome.status, SessionStatus::COMPLETED) << outcome.error;
    ASSERT_EQ(outcome.placements.size(), 5u);

    std::string reassembled;
    for (const auto& placement : outcome.placements) {
        const StorageNode& node = placement.server_id() == "node-a" ? node_a.node : node_b.node;
        auto stored = node.get_store().get(placement.storage_locator());
        ASSERT_TRUE(stored) << placement.storage_locator();
        reassembled += *stored;
    }
    EXPECT_EQ(reassembled, data);
}
