#include "upload_types.hpp"

namespace chunkflow {

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::PREPARING: return "preparing";
        case SessionStatus::DISTRIBUTING: return "distributing";
        case SessionStatus::UPLOADING: return "uploading";
        case SessionStatus::COMPLETED: return "completed";
        case SessionStatus::FAILED: return "failed";
    }
    return "unknown";
}

const char* to_string(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::PENDING: return "pending";
        case ChunkStatus::WAITING: return "waiting";
        case ChunkStatus::UPLOADING: return "uploading";
        case ChunkStatus::COMPLETED: return "completed";
        case ChunkStatus::FAILED: return "failed";
    }
    return "unknown";
}

const char* to_string(FailureReason reason) {
    switch (reason) {
        case FailureReason::NONE: return "none";
        case FailureReason::INPUT_ERROR: return "input_error";
        case FailureReason::CHECKSUM_MISMATCH: return "checksum_mismatch";
        case FailureReason::NO_CAPABLE_SERVER: return "no_capable_server";
        case FailureReason::RETRIES_EXHAUSTED: return "retries_exhausted";
        case FailureReason::CANCELLED: return "cancelled";
    }
    return "unknown";
}

} // namespace chunkflow
