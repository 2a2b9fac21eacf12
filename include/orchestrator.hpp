#pragma once

#include "capacity_accountant.hpp"
#include "chunker.hpp"
#include "config.hpp"
#include "ledger.hpp"
#include "progress_reporter.hpp"
#include "server_registry.hpp"
#include "upload_types.hpp"
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <condition_variable>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkflow {

// Drives file uploads chunk by chunk: server selection, capacity reservation,
// dispatch, retry with exclusion and backoff, ledger and progress updates.
// start_upload / resume_upload block the calling thread until the session
// reaches a terminal state; cancel_upload may be called from any thread.
class UploadOrchestrator {
public:
    UploadOrchestrator(UploadSettings settings,
                       ServerRegistry& registry,
                       PartialUploadLedger& ledger,
                       CapacityAccountant& accountant,
                       ProgressReporter& reporter);
    ~UploadOrchestrator();

    UploadOrchestrator(const UploadOrchestrator&) = delete;
    UploadOrchestrator& operator=(const UploadOrchestrator&) = delete;

    // Uploads a stream of total_size bytes. If the ledger already holds an
    // incomplete entry for the same content, completed chunks are skipped.
    UploadOutcome start_upload(std::istream& input,
                               const std::string& file_name,
                               const std::string& mime_type,
                               uint64_t total_size,
                               const UploadOptions& options = {});

    // Continues the ledger entry stored under checksum with the given stream
    UploadOutcome resume_upload(const std::string& checksum,
                                std::istream& input,
                                const UploadOptions& options = {});

    // Stops dispatching new chunks; requests already in flight finish
    bool cancel_upload(const std::string& session_id);

    std::vector<ServerDescriptor> list_available_servers();
    std::vector<LedgerEntry> list_partial_uploads(const std::string& owner_scope = {}) const;
    bool delete_partial_upload(const std::string& checksum);
    std::optional<LedgerEntry> check_resumable(const std::string& checksum, uint64_t total_size) const;

    const UploadSettings& settings() const { return settings_; }

private:
    struct ActiveSession {
        UploadSession session;
        std::mutex mutex;
        std::condition_variable cancel_cv;
        std::atomic<bool> cancelled{false};
        std::atomic<uint32_t> completed{0};
        std::string preferred_region;

        // Sleeps for the given duration; returns true if cancelled meanwhile
        bool wait_for(std::chrono::milliseconds duration);
    };

    UploadOutcome run(const std::shared_ptr<ActiveSession>& active,
                      std::istream& input,
                      const std::optional<std::string>& expected_checksum);
    void upload_chunks(ActiveSession& active, std::istream& input, const std::set<uint32_t>& completed);
    void process_chunk(ActiveSession& active, const Chunk& chunk);
    std::optional<ServerDescriptor> acquire_server(ActiveSession& active, ChunkDescriptor& chunk);

    void set_session_status(ActiveSession& active, SessionStatus status);
    void set_chunk_status(ActiveSession& active, ChunkDescriptor& chunk, ChunkStatus status);
    void fail_session(ActiveSession& active, FailureReason reason, const std::string& error);

    std::shared_ptr<ActiveSession> register_session(UploadSession session, const UploadOptions& options);
    void unregister_session(const std::string& session_id);
    UploadOutcome make_outcome(ActiveSession& active) const;
    std::string generate_session_id();

    UploadSettings settings_;
    ServerRegistry& registry_;
    PartialUploadLedger& ledger_;
    CapacityAccountant& accountant_;
    ProgressReporter& reporter_;

    boost::asio::thread_pool workers_;

    std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<ActiveSession>> sessions_;
};

}
