#pragma once

#include "chunkflow.pb.h"
#include <boost/asio/thread_pool.hpp>
#include <memory>
#include <mutex>
#include <vector>

namespace chunkflow {

// Transport hook; whatever the host process wires in
class ProgressListener {
public:
    virtual ~ProgressListener() = default;
    virtual void on_chunk_state_changed(const ProgressEvent& event) = 0;
    virtual void on_session_state_changed(const ProgressEvent& event) = 0;
};

// Logs every event to stdout
class ConsoleProgressListener : public ProgressListener {
public:
    void on_chunk_state_changed(const ProgressEvent& event) override;
    void on_session_state_changed(const ProgressEvent& event) override;
};

// Delivers events on its own thread so emitters never wait for listeners.
// Events are delivered in emission order.
class ProgressReporter {
public:
    ProgressReporter();
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void add_listener(std::shared_ptr<ProgressListener> listener);

    void emit(const ProgressEvent& event);

    // Blocks until everything emitted so far has been delivered
    void flush();

private:
    void deliver(const ProgressEvent& event);

    std::mutex mutex_;
    std::vector<std::shared_ptr<ProgressListener>> listeners_;
    boost::asio::thread_pool delivery_;
};

}
