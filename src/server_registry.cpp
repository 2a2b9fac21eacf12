#include "server_registry.hpp"
#include <algorithm>
#include <iostream>

namespace chunkflow {

namespace {

// Score weights
const double LOAD_WEIGHT = 40.0;
const double RESPONSE_WEIGHT = 30.0;
const double SUCCESS_WEIGHT = 20.0;
const double SPACE_WEIGHT = 10.0;
const double REGION_BONUS = 15.0;

// Response times at or above this contribute nothing
const double RESPONSE_CEILING_MS = 1000.0;
// Free space counts in GiB, up to this many
const double SPACE_CAP_GIB = 10.0;

// Smoothing factor for locally observed outcomes
const double ROLLING_ALPHA = 0.2;

}

void ServerRegistry::add_server(std::shared_ptr<StorageServer> server) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = server->id();
    Entry& entry = servers_[id];
    entry.server = std::move(server);
    entry.descriptor.id = id;
    entry.descriptor.endpoint = entry.server->endpoint();
    std::cout << "[Registry] Added server " << id << " at " << entry.descriptor.endpoint << std::endl;
}

bool ServerRegistry::remove_server(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.erase(id) > 0;
}

void ServerRegistry::refresh() {
    std::vector<std::shared_ptr<StorageServer>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : servers_) {
            targets.push_back(entry.server);
        }
        last_refresh_ = std::chrono::steady_clock::now();
    }

    // Status calls go over the network, so collect them before taking the lock
    std::vector<std::pair<std::string, std::optional<ServerStatus>>> reports;
    for (const auto& server : targets) {
        reports.emplace_back(server->id(), server->get_status());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, status] : reports) {
        auto it = servers_.find(id);
        if (it == servers_.end()) {
            continue;
        }
        ServerDescriptor& descriptor = it->second.descriptor;
        if (!status) {
            if (descriptor.active) {
                std::cerr << "[Registry] Server " << id << " is unreachable, marking inactive" << std::endl;
            }
            descriptor.active = false;
            continue;
        }
        descriptor.active = status->active;
        descriptor.current_load = status->current_load;
        descriptor.max_load = status->max_load;
        descriptor.capabilities = status->capabilities;
        descriptor.response_time_ms = status->response_time_ms;
        descriptor.success_rate = status->success_rate;
        descriptor.region = status->region;
        descriptor.account_id = status->account_id;
    }
}

bool ServerRegistry::refresh_if_stale(std::chrono::milliseconds max_age) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (last_refresh_ && std::chrono::steady_clock::now() - *last_refresh_ < max_age) {
            return false;
        }
    }
    refresh();
    return true;
}

bool ServerRegistry::is_eligible(const ServerDescriptor& server, uint64_t chunk_size,
                                 const SelectionConstraints& constraints) {
    if (!server.active) return false;
    if (server.current_load >= server.max_load) return false;
    if (server.capabilities.max_chunk_size < chunk_size) return false;
    if (server.capabilities.free_space < constraints.min_free_space) return false;
    if (constraints.excluded.count(server.id)) return false;
    return true;
}

double ServerRegistry::score(const ServerDescriptor& server, const SelectionConstraints& constraints) {
    double score = 0.0;

    // Load balancing (lower load is better)
    if (server.max_load > 0) {
        score += (1.0 - static_cast<double>(server.current_load) / server.max_load) * LOAD_WEIGHT;
    }

    // Response time (faster is better)
    score += std::max(0.0, (RESPONSE_CEILING_MS - server.response_time_ms) / RESPONSE_CEILING_MS) * RESPONSE_WEIGHT;

    score += server.success_rate * SUCCESS_WEIGHT;

    // Free space in GiB, capped
    double free_gib = static_cast<double>(server.capabilities.free_space) / (1024.0 * 1024.0 * 1024.0);
    score += std::min(free_gib, SPACE_CAP_GIB) * SPACE_WEIGHT;

    if (!constraints.preferred_region.empty() && server.region == constraints.preferred_region) {
        score += REGION_BONUS;
    }
    return score;
}

ServerDescriptor ServerRegistry::snapshot(const Entry& entry) const {
    ServerDescriptor descriptor = entry.descriptor;
    // The reported load may not include our own dispatches yet
    descriptor.current_load = std::max(descriptor.current_load, entry.in_flight);
    return descriptor;
}

const ServerRegistry::Entry* ServerRegistry::select_locked(
    uint64_t chunk_size, const SelectionConstraints& constraints) const {
    const Entry* best = nullptr;
    ServerDescriptor best_view;
    double best_score = 0.0;

    for (const auto& [id, entry] : servers_) {
        ServerDescriptor view = snapshot(entry);
        if (!is_eligible(view, chunk_size, constraints)) {
            continue;
        }
        double candidate_score = score(view, constraints);
        // Ties: lowest load, then lowest id (map order already gives the id)
        bool better = best == nullptr ||
                      candidate_score > best_score ||
                      (candidate_score == best_score && view.current_load < best_view.current_load);
        if (better) {
            best = &entry;
            best_view = view;
            best_score = candidate_score;
        }
    }
    return best;
}

std::optional<ServerDescriptor> ServerRegistry::select_server(
    uint64_t chunk_size, const SelectionConstraints& constraints) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Entry* best = select_locked(chunk_size, constraints);
    if (!best) {
        return std::nullopt;
    }
    return snapshot(*best);
}

std::optional<ServerDescriptor> ServerRegistry::acquire(
    uint64_t chunk_size, const SelectionConstraints& constraints) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Entry* best = select_locked(chunk_size, constraints);
    if (!best) {
        return std::nullopt;
    }
    Entry& entry = servers_.at(best->descriptor.id);
    ++entry.in_flight;
    return snapshot(entry);
}

void ServerRegistry::release(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(id);
    if (it != servers_.end() && it->second.in_flight > 0) {
        --it->second.in_flight;
    }
}

void ServerRegistry::record_outcome(const std::string& id, bool success, std::chrono::milliseconds elapsed) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end()) {
        return;
    }
    Entry& entry = it->second;
    if (entry.in_flight > 0) {
        --entry.in_flight;
    }
    ServerDescriptor& descriptor = entry.descriptor;
    descriptor.success_rate = (1.0 - ROLLING_ALPHA) * descriptor.success_rate +
                              ROLLING_ALPHA * (success ? 1.0 : 0.0);
    descriptor.response_time_ms = (1.0 - ROLLING_ALPHA) * descriptor.response_time_ms +
                                  ROLLING_ALPHA * static_cast<double>(elapsed.count());
}

std::vector<ServerDescriptor> ServerRegistry::list_servers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ServerDescriptor> result;
    result.reserve(servers_.size());
    for (const auto& [id, entry] : servers_) {
        result.push_back(snapshot(entry));
    }
    return result;
}

std::shared_ptr<StorageServer> ServerRegistry::server(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end()) {
        return nullptr;
    }
    return it->second.server;
}

size_t ServerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.size();
}

}
