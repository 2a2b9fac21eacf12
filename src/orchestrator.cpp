#include "orchestrator.hpp"
#include "chunkflow/hex.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <future>
#include <iostream>
#include <random>

namespace chunkflow {

namespace {

double progress_of(uint32_t completed, uint32_t total) {
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(completed) / total * 100.0;
}

}

bool UploadOrchestrator::ActiveSession::wait_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex);
    return cancel_cv.wait_for(lock, duration, [this]() { return cancelled.load(); });
}

UploadOrchestrator::UploadOrchestrator(UploadSettings settings,
                                       ServerRegistry& registry,
                                       PartialUploadLedger& ledger,
                                       CapacityAccountant& accountant,
                                       ProgressReporter& reporter)
    : settings_(std::move(settings)),
      registry_(registry),
      ledger_(ledger),
      accountant_(accountant),
      reporter_(reporter),
      workers_(std::max<uint32_t>(1, settings_.max_in_flight)) {
    if (settings_.max_in_flight == 0) {
        settings_.max_in_flight = 1;
    }
    if (settings_.max_attempts == 0) {
        settings_.max_attempts = 1;
    }
}

UploadOrchestrator::~UploadOrchestrator() {
    workers_.join();
}

std::string UploadOrchestrator::generate_session_id() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t random_part = dis(gen);
    std::string random_bytes(reinterpret_cast<const char*>(&random_part), sizeof(random_part));

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::to_string(millis) + "_" + util::to_hex(random_bytes);
}

std::shared_ptr<UploadOrchestrator::ActiveSession> UploadOrchestrator::register_session(
    UploadSession session, const UploadOptions& options) {
    auto active = std::make_shared<ActiveSession>();
    active->session = std::move(session);
    active->session.started_at = std::chrono::system_clock::now();
    active->preferred_region = options.preferred_region.empty() ? settings_.preferred_region
                                                                : options.preferred_region;

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (!sessions_.emplace(active->session.id, active).second) {
        throw std::invalid_argument("Session " + active->session.id + " is already running");
    }
    return active;
}

void UploadOrchestrator::unregister_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(session_id);
}

UploadOutcome UploadOrchestrator::start_upload(std::istream& input,
                                               const std::string& file_name,
                                               const std::string& mime_type,
                                               uint64_t total_size,
                                               const UploadOptions& options) {
    UploadSession session;
    session.id = options.session_id.empty() ? generate_session_id() : options.session_id;
    session.file_name = file_name;
    session.mime_type = mime_type;
    session.owner_scope = options.owner_scope;
    session.total_size = total_size;
    session.chunk_size = settings_.chunk_size;

    auto active = register_session(std::move(session), options);
    std::cout << "[Orchestrator] Starting upload " << active->session.id << ": " << file_name
              << " (" << total_size << " bytes)" << std::endl;
    return run(active, input, std::nullopt);
}

UploadOutcome UploadOrchestrator::resume_upload(const std::string& checksum,
                                                std::istream& input,
                                                const UploadOptions& options) {
    auto entry = ledger_.find_by_checksum(checksum);
    if (!entry) {
        UploadOutcome outcome;
        outcome.checksum = checksum;
        outcome.status = SessionStatus::FAILED;
        outcome.reason = FailureReason::INPUT_ERROR;
        outcome.error = "No partial upload recorded for checksum " + checksum;
        return outcome;
    }

    UploadSession session;
    session.id = options.session_id.empty() ? generate_session_id() : options.session_id;
    session.file_name = entry->file_name();
    session.mime_type = entry->mime_type();
    session.owner_scope = entry->owner_scope();
    session.total_size = entry->total_size();
    session.chunk_size = entry->chunk_size() > 0 ? entry->chunk_size() : settings_.chunk_size;

    auto active = register_session(std::move(session), options);
    std::cout << "[Orchestrator] Resuming upload " << active->session.id << ": " << entry->file_name()
              << " (" << entry->completed_chunks_size() << "/" << entry->total_chunks()
              << " chunks already stored)" << std::endl;
    return run(active, input, checksum);
}

UploadOutcome UploadOrchestrator::run(const std::shared_ptr<ActiveSession>& active,
                                      std::istream& input,
                                      const std::optional<std::string>& expected_checksum) {
    UploadSession& session = active->session;
    set_session_status(*active, SessionStatus::PREPARING);

    try {
        session.checksum = Chunker::file_checksum(input, session.total_size);
        if (expected_checksum && *expected_checksum != session.checksum) {
            throw UploadError(FailureReason::CHECKSUM_MISMATCH,
                              "Stream checksum " + session.checksum + " does not match " + *expected_checksum);
        }

        std::set<uint32_t> completed;
        auto entry = ledger_.check_resumable(session.checksum, session.total_size);
        if (entry) {
            session.resuming = true;
            if (entry->chunk_size() > 0) {
                session.chunk_size = entry->chunk_size();
            }
            if (session.owner_scope.empty()) {
                session.owner_scope = entry->owner_scope();
            }
        }

        session.chunks = Chunker::plan(session.total_size, session.chunk_size);
        session.total_chunks = static_cast<uint32_t>(session.chunks.size());

        if (entry) {
            if (entry->total_chunks() != session.total_chunks) {
                throw IntegrityError("Partial upload " + session.checksum + " expects " +
                                     std::to_string(entry->total_chunks()) + " chunks, file has " +
                                     std::to_string(session.total_chunks));
            }
            for (uint32_t index : entry->completed_chunks()) {
                if (index >= session.total_chunks) {
                    throw IntegrityError("Partial upload " + session.checksum + " lists chunk " +
                                         std::to_string(index) + " beyond the end of the file");
                }
                completed.insert(index);
                session.chunks[index].status = ChunkStatus::COMPLETED;
            }
            for (const auto& placement : entry->placements()) {
                if (placement.chunk_index() >= session.total_chunks) {
                    continue;
                }
                ChunkDescriptor& chunk = session.chunks[placement.chunk_index()];
                chunk.server_id = placement.server_id();
                chunk.storage_locator = placement.storage_locator();
                chunk.checksum = placement.checksum();
            }
            std::cout << "[Orchestrator] Session " << session.id << " resumes with " << completed.size()
                      << " of " << session.total_chunks << " chunks already stored" << std::endl;
        } else {
            LedgerEntry fresh;
            fresh.set_checksum(session.checksum);
            fresh.set_file_name(session.file_name);
            fresh.set_total_size(session.total_size);
            fresh.set_mime_type(session.mime_type);
            fresh.set_total_chunks(session.total_chunks);
            fresh.set_chunk_size(session.chunk_size);
            fresh.set_owner_scope(session.owner_scope);
            ledger_.create_or_update(fresh);
        }
        active->completed = static_cast<uint32_t>(completed.size());

        set_session_status(*active, SessionStatus::DISTRIBUTING);
        set_session_status(*active, SessionStatus::UPLOADING);
        upload_chunks(*active, input, completed);
    } catch (const IntegrityError& e) {
        fail_session(*active, FailureReason::CHECKSUM_MISMATCH, e.what());
    } catch (const UploadError& e) {
        fail_session(*active, e.reason(), e.what());
    } catch (const std::exception& e) {
        // Local failures such as an unwritable ledger directory
        fail_session(*active, FailureReason::INPUT_ERROR, e.what());
    }

    if (session.status != SessionStatus::FAILED) {
        auto unfinished = std::find_if(session.chunks.begin(), session.chunks.end(), [](const ChunkDescriptor& c) {
            return c.status != ChunkStatus::COMPLETED;
        });
        if (unfinished == session.chunks.end()) {
            ledger_.remove(session.checksum);
            set_session_status(*active, SessionStatus::COMPLETED);
        } else if (active->cancelled) {
            fail_session(*active, FailureReason::CANCELLED, "Upload cancelled");
        } else {
            FailureReason reason = unfinished->reason != FailureReason::NONE ? unfinished->reason
                                                                             : FailureReason::RETRIES_EXHAUSTED;
            fail_session(*active, reason, "Chunk " + std::to_string(unfinished->index) + ": " + unfinished->last_error);
        }
    }

    session.finished_at = std::chrono::system_clock::now();
    UploadOutcome outcome = make_outcome(*active);
    unregister_session(session.id);

    std::cout << "[Orchestrator] Upload " << session.id << " " << to_string(session.status) << ": "
              << outcome.completed_chunks << "/" << outcome.total_chunks << " chunks" << std::endl;
    return outcome;
}

void UploadOrchestrator::upload_chunks(ActiveSession& active, std::istream& input,
                                       const std::set<uint32_t>& completed) {
    UploadSession& session = active.session;
    Chunker chunker(input, session.total_size, session.chunk_size);
    chunker.skip(completed);

    uint32_t batch_number = 0;
    const uint32_t total_batches =
        (session.total_chunks + settings_.max_in_flight - 1) / settings_.max_in_flight;

    while (!chunker.finished() && !active.cancelled) {
        // The next batch only starts once every task of the previous one settled
        std::vector<Chunk> batch;
        while (batch.size() < settings_.max_in_flight) {
            auto chunk = chunker.next();
            if (!chunk) {
                break;
            }
            batch.push_back(std::move(*chunk));
        }
        if (batch.empty()) {
            break;
        }

        ++batch_number;
        std::cout << "[Orchestrator] Session " << session.id << ": batch " << batch_number << "/"
                  << total_batches << " (chunks " << batch.front().descriptor.index << "-"
                  << batch.back().descriptor.index << ")" << std::endl;

        std::vector<std::future<void>> pending;
        pending.reserve(batch.size());
        for (const Chunk& chunk : batch) {
            auto task = std::make_shared<std::packaged_task<void()>>([this, &active, &chunk]() {
                process_chunk(active, chunk);
            });
            pending.push_back(task->get_future());
            boost::asio::post(workers_, [task]() { (*task)(); });
        }
        // Let every task settle before the batch goes out of scope
        for (auto& task : pending) {
            task.wait();
        }
        for (auto& task : pending) {
            task.get();
        }
    }

    if (active.cancelled) {
        // Chunks that never reached a batch
        for (ChunkDescriptor& chunk : session.chunks) {
            if (chunk.status == ChunkStatus::PENDING) {
                chunk.reason = FailureReason::CANCELLED;
                chunk.last_error = "Upload cancelled before dispatch";
                set_chunk_status(active, chunk, ChunkStatus::FAILED);
            }
        }
        return;
    }

    if (chunker.finished() && chunker.checksum() != session.checksum) {
        throw UploadError(FailureReason::INPUT_ERROR, "Input changed while it was being uploaded");
    }
}

void UploadOrchestrator::process_chunk(ActiveSession& active, const Chunk& chunk) {
    UploadSession& session = active.session;
    ChunkDescriptor& descriptor = session.chunks.at(chunk.descriptor.index);
    descriptor.checksum = chunk.descriptor.checksum;

    while (descriptor.attempts < settings_.max_attempts) {
        if (descriptor.attempts > 0) {
            set_chunk_status(active, descriptor, ChunkStatus::WAITING);
        }

        auto server = acquire_server(active, descriptor);
        if (!server) {
            if (active.cancelled) {
                descriptor.reason = FailureReason::CANCELLED;
                descriptor.last_error = "Upload cancelled before dispatch";
            } else {
                std::cerr << "[Orchestrator] No capable server found for chunk " << descriptor.index
                          << " after " << settings_.selection_timeout.count() << "ms" << std::endl;
                descriptor.reason = FailureReason::NO_CAPABLE_SERVER;
                descriptor.last_error = "No capable server available";
            }
            set_chunk_status(active, descriptor, ChunkStatus::FAILED);
            return;
        }
        if (active.cancelled) {
            registry_.release(server->id);
            accountant_.release(server->account_id, descriptor.size);
            descriptor.reason = FailureReason::CANCELLED;
            descriptor.last_error = "Upload cancelled before dispatch";
            set_chunk_status(active, descriptor, ChunkStatus::FAILED);
            return;
        }

        ++descriptor.attempts;
        descriptor.server_id = server->id;
        set_chunk_status(active, descriptor, ChunkStatus::UPLOADING);

        ChunkUploadRequest request;
        request.data = &chunk.data;
        request.chunk_index = descriptor.index;
        request.file_id = session.checksum;
        request.file_name = session.file_name;
        request.mime_type = session.mime_type;
        request.total_chunks = session.total_chunks;
        request.chunk_checksum = descriptor.checksum;

        auto started = std::chrono::steady_clock::now();
        ChunkUploadResult result;
        auto target = registry_.server(server->id);
        if (target) {
            try {
                result = target->upload_chunk(request);
            } catch (const std::exception& e) {
                result = ChunkUploadResult{};
                result.error = "Server " + server->id + " threw: " + e.what();
            }
        } else {
            result.error = "Server " + server->id + " is no longer registered";
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        registry_.record_outcome(server->id, result.success, elapsed);

        if (result.success) {
            accountant_.commit(server->account_id, descriptor.size);
            descriptor.storage_locator = result.storage_locator;
            descriptor.last_error.clear();

            ChunkPlacement placement;
            placement.set_chunk_index(descriptor.index);
            placement.set_server_id(server->id);
            placement.set_storage_locator(result.storage_locator);
            placement.set_checksum(descriptor.checksum);
            placement.set_size(descriptor.size);
            if (!ledger_.mark_chunk_complete(session.checksum, placement)) {
                std::cerr << "[Orchestrator] Ledger entry for " << session.checksum
                          << " disappeared, chunk " << descriptor.index << " is not recorded" << std::endl;
            }

            ++active.completed;
            set_chunk_status(active, descriptor, ChunkStatus::COMPLETED);
            return;
        }

        accountant_.release(server->account_id, descriptor.size);
        descriptor.excluded.insert(server->id);
        descriptor.last_error = result.error;
        std::cerr << "[Orchestrator] Chunk " << descriptor.index << " failed on server " << server->id
                  << " (attempt " << descriptor.attempts << "/" << settings_.max_attempts << "): "
                  << result.error << std::endl;
        set_chunk_status(active, descriptor, ChunkStatus::FAILED);

        if (descriptor.attempts < settings_.max_attempts) {
            if (active.wait_for(settings_.backoff_step * descriptor.attempts)) {
                descriptor.reason = FailureReason::CANCELLED;
                set_chunk_status(active, descriptor, ChunkStatus::FAILED);
                return;
            }
        }
    }

    std::cerr << "[Orchestrator] Chunk " << descriptor.index << " failed after "
              << settings_.max_attempts << " attempts" << std::endl;
    descriptor.reason = FailureReason::RETRIES_EXHAUSTED;
    set_chunk_status(active, descriptor, ChunkStatus::FAILED);
}

std::optional<ServerDescriptor> UploadOrchestrator::acquire_server(ActiveSession& active, ChunkDescriptor& chunk) {
    SelectionConstraints constraints;
    // Room for the chunk while the server processes it
    constraints.min_free_space = chunk.size * 2;
    constraints.preferred_region = active.preferred_region;

    // Servers whose account refused the reservation during this poll round
    std::set<std::string> rejected;
    const auto deadline = std::chrono::steady_clock::now() + settings_.selection_timeout;

    for (;;) {
        if (active.cancelled) {
            return std::nullopt;
        }

        constraints.excluded = chunk.excluded;
        constraints.excluded.insert(rejected.begin(), rejected.end());
        auto candidate = registry_.acquire(chunk.size, constraints);
        if (candidate) {
            if (accountant_.reserve(candidate->account_id, chunk.size)) {
                return candidate;
            }
            registry_.release(candidate->id);
            rejected.insert(candidate->id);
            continue;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        if (chunk.status != ChunkStatus::WAITING) {
            set_chunk_status(active, chunk, ChunkStatus::WAITING);
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::cout << "[Orchestrator] Waiting for capable server for chunk " << chunk.index << " ("
                  << remaining.count() / 1000 << "s remaining)" << std::endl;

        registry_.refresh_if_stale(settings_.poll_interval / 2);
        rejected.clear();
        if (active.wait_for(std::min(settings_.poll_interval, remaining))) {
            return std::nullopt;
        }
    }
}

void UploadOrchestrator::set_session_status(ActiveSession& active, SessionStatus status) {
    active.session.status = status;

    ProgressEvent event;
    event.set_session_id(active.session.id);
    event.set_chunk_index(-1);
    event.set_type(SESSION_STATE);
    event.set_status(to_string(status));
    event.set_progress_percent(progress_of(active.completed, active.session.total_chunks));
    if (status == SessionStatus::COMPLETED) {
        event.set_progress_percent(100.0);
    }
    if (status == SessionStatus::FAILED) {
        event.set_reason(to_string(active.session.reason));
    }
    reporter_.emit(event);
}

void UploadOrchestrator::set_chunk_status(ActiveSession& active, ChunkDescriptor& chunk, ChunkStatus status) {
    chunk.status = status;

    ProgressEvent event;
    event.set_session_id(active.session.id);
    event.set_chunk_index(static_cast<int32_t>(chunk.index));
    event.set_type(CHUNK_STATE);
    event.set_status(to_string(status));
    event.set_progress_percent(progress_of(active.completed, active.session.total_chunks));
    event.set_server_id(chunk.server_id);
    event.set_attempts(chunk.attempts);
    if (status == ChunkStatus::FAILED) {
        event.set_reason(chunk.reason != FailureReason::NONE ? to_string(chunk.reason) : chunk.last_error);
    }
    reporter_.emit(event);
}

void UploadOrchestrator::fail_session(ActiveSession& active, FailureReason reason, const std::string& error) {
    std::cerr << "[Orchestrator] Upload " << active.session.id << " failed (" << to_string(reason)
              << "): " << error << std::endl;
    active.session.reason = reason;
    active.session.error = error;
    set_session_status(active, SessionStatus::FAILED);
}

UploadOutcome UploadOrchestrator::make_outcome(ActiveSession& active) const {
    const UploadSession& session = active.session;
    UploadOutcome outcome;
    outcome.session_id = session.id;
    outcome.checksum = session.checksum;
    outcome.status = session.status;
    outcome.reason = session.reason;
    outcome.error = session.error;
    outcome.total_chunks = session.total_chunks;
    outcome.chunks = session.chunks;

    for (const auto& chunk : session.chunks) {
        if (chunk.status != ChunkStatus::COMPLETED) {
            continue;
        }
        ++outcome.completed_chunks;
        if (chunk.attempts == 0) {
            ++outcome.skipped_chunks;
        }
        ChunkPlacement placement;
        placement.set_chunk_index(chunk.index);
        placement.set_server_id(chunk.server_id);
        placement.set_storage_locator(chunk.storage_locator);
        placement.set_checksum(chunk.checksum);
        placement.set_size(chunk.size);
        outcome.placements.push_back(placement);
    }
    outcome.progress_percent = session.status == SessionStatus::COMPLETED
                                   ? 100.0
                                   : progress_of(outcome.completed_chunks, outcome.total_chunks);
    return outcome;
}

bool UploadOrchestrator::cancel_upload(const std::string& session_id) {
    std::shared_ptr<ActiveSession> active;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        active = it->second;
    }
    {
        std::lock_guard<std::mutex> lock(active->mutex);
        active->cancelled = true;
    }
    active->cancel_cv.notify_all();
    std::cout << "[Orchestrator] Cancelling upload " << session_id << std::endl;
    return true;
}

std::vector<ServerDescriptor> UploadOrchestrator::list_available_servers() {
    registry_.refresh();
    std::vector<ServerDescriptor> available;
    for (auto& server : registry_.list_servers()) {
        if (server.active) {
            available.push_back(std::move(server));
        }
    }
    return available;
}

std::vector<LedgerEntry> UploadOrchestrator::list_partial_uploads(const std::string& owner_scope) const {
    return ledger_.list(owner_scope);
}

bool UploadOrchestrator::delete_partial_upload(const std::string& checksum) {
    return ledger_.remove(checksum);
}

std::optional<LedgerEntry> UploadOrchestrator::check_resumable(const std::string& checksum,
                                                               uint64_t total_size) const {
    return ledger_.check_resumable(checksum, total_size);
}

}
