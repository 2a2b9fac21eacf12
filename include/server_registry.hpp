#pragma once

#include "storage_server.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chunkflow {

// Best known snapshot of one upload server
struct ServerDescriptor {
    std::string id;
    std::string endpoint;
    std::string region;
    std::string account_id;
    bool active = false;
    uint32_t current_load = 0;
    uint32_t max_load = 0;
    ServerCapabilities capabilities;
    double response_time_ms = 0.0;
    double success_rate = 1.0;
};

struct SelectionConstraints {
    uint64_t min_free_space = 0;
    std::set<std::string> excluded;
    std::string preferred_region;
};

// Owns the candidate servers and their load counters. All mutation happens
// under one mutex; network calls are made without holding it.
class ServerRegistry {
public:
    void add_server(std::shared_ptr<StorageServer> server);
    bool remove_server(const std::string& id);

    // Re-queries every server; unreachable servers become inactive
    void refresh();
    // Refreshes only if the last refresh is older than max_age
    bool refresh_if_stale(std::chrono::milliseconds max_age);

    // Highest-scoring eligible server, or nullopt as a back-pressure signal
    std::optional<ServerDescriptor> select_server(uint64_t chunk_size,
                                                  const SelectionConstraints& constraints) const;

    // select_server() plus a load slot taken in the same critical section
    std::optional<ServerDescriptor> acquire(uint64_t chunk_size,
                                            const SelectionConstraints& constraints);
    // Returns a slot that was never used for a dispatch
    void release(const std::string& id);
    // Returns a slot and folds the dispatch outcome into the rolling figures
    void record_outcome(const std::string& id, bool success, std::chrono::milliseconds elapsed);

    std::vector<ServerDescriptor> list_servers() const;
    std::shared_ptr<StorageServer> server(const std::string& id) const;
    size_t size() const;

    static bool is_eligible(const ServerDescriptor& server, uint64_t chunk_size,
                            const SelectionConstraints& constraints);
    static double score(const ServerDescriptor& server, const SelectionConstraints& constraints);

private:
    struct Entry {
        std::shared_ptr<StorageServer> server;
        ServerDescriptor descriptor;
        uint32_t in_flight = 0;
    };

    ServerDescriptor snapshot(const Entry& entry) const;
    const Entry* select_locked(uint64_t chunk_size, const SelectionConstraints& constraints) const;

    mutable std::mutex mutex_;
    // Ordered by id so iteration (and tie-breaking) is deterministic
    std::map<std::string, Entry> servers_;
    std::optional<std::chrono::steady_clock::time_point> last_refresh_;
};

}
