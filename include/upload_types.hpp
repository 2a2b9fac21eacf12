#pragma once

#include "chunkflow.pb.h"
#include <chrono>
#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunkflow {

// Default chunk size (4 MiB)
const uint64_t DEFAULT_CHUNK_SIZE = 4 * 1024 * 1024;

enum class SessionStatus { PREPARING, DISTRIBUTING, UPLOADING, COMPLETED, FAILED };

enum class ChunkStatus { PENDING, WAITING, UPLOADING, COMPLETED, FAILED };

// Terminal reason codes reported to callers
enum class FailureReason {
    NONE,
    INPUT_ERROR,        // unreadable or short input, file changed while reading
    CHECKSUM_MISMATCH,  // resume request does not match the stored entry or stream
    NO_CAPABLE_SERVER,  // placement exhausted within the selection timeout
    RETRIES_EXHAUSTED,  // dispatch failed on every attempt
    CANCELLED
};

const char* to_string(SessionStatus status);
const char* to_string(ChunkStatus status);
const char* to_string(FailureReason reason);

struct ChunkDescriptor {
    uint32_t index = 0;
    uint64_t offset = 0;
    uint64_t size = 0;
    std::string checksum;

    ChunkStatus status = ChunkStatus::PENDING;
    std::string server_id;
    std::string storage_locator;
    uint32_t attempts = 0;
    // Servers that already failed this chunk; never retried for it
    std::set<std::string> excluded;
    std::string last_error;
    FailureReason reason = FailureReason::NONE;
};

struct UploadSession {
    std::string id;
    std::string file_name;
    std::string mime_type;
    std::string owner_scope;
    uint64_t total_size = 0;
    uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
    uint32_t total_chunks = 0;
    std::string checksum;
    SessionStatus status = SessionStatus::PREPARING;
    bool resuming = false;
    FailureReason reason = FailureReason::NONE;
    std::string error;
    std::vector<ChunkDescriptor> chunks;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;
};

struct UploadOptions {
    // Generated when empty; set it to be able to cancel before the first event
    std::string session_id;
    std::string owner_scope;
    std::string preferred_region;
};

// Terminal result of start_upload / resume_upload
struct UploadOutcome {
    std::string session_id;
    std::string checksum;
    SessionStatus status = SessionStatus::FAILED;
    FailureReason reason = FailureReason::NONE;
    std::string error;
    uint32_t total_chunks = 0;
    uint32_t completed_chunks = 0;
    // Chunks that were already in the ledger and not sent again
    uint32_t skipped_chunks = 0;
    double progress_percent = 0.0;
    std::vector<ChunkDescriptor> chunks;
    std::vector<ChunkPlacement> placements;
};

class UploadError : public std::runtime_error {
public:
    UploadError(FailureReason reason, const std::string& what)
        : std::runtime_error(what), reason_(reason) {}
    FailureReason reason() const { return reason_; }
private:
    FailureReason reason_;
};

// A ledger entry matched by checksum disagrees with the declared size
class IntegrityError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace chunkflow
