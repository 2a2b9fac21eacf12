#include "progress_reporter.hpp"
#include <boost/asio/post.hpp>
#include <future>
#include <iomanip>
#include <iostream>

namespace chunkflow {

void ConsoleProgressListener::on_chunk_state_changed(const ProgressEvent& event) {
    std::cout << "[Progress] " << event.session_id() << " chunk " << event.chunk_index()
              << " -> " << event.status();
    if (!event.server_id().empty()) {
        std::cout << " on " << event.server_id();
    }
    if (!event.reason().empty()) {
        std::cout << " (" << event.reason() << ")";
    }
    std::cout << " [" << std::fixed << std::setprecision(1) << event.progress_percent() << "%]" << std::endl;
}

void ConsoleProgressListener::on_session_state_changed(const ProgressEvent& event) {
    std::cout << "[Progress] " << event.session_id() << " -> " << event.status();
    if (!event.reason().empty()) {
        std::cout << " (" << event.reason() << ")";
    }
    std::cout << " [" << std::fixed << std::setprecision(1) << event.progress_percent() << "%]" << std::endl;
}

// A single delivery thread keeps events in order
ProgressReporter::ProgressReporter() : delivery_(1) {}

ProgressReporter::~ProgressReporter() {
    delivery_.join();
}

void ProgressReporter::add_listener(std::shared_ptr<ProgressListener> listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void ProgressReporter::emit(const ProgressEvent& event) {
    boost::asio::post(delivery_, [this, event]() {
        deliver(event);
    });
}

void ProgressReporter::flush() {
    auto done = std::make_shared<std::promise<void>>();
    std::future<void> delivered = done->get_future();
    boost::asio::post(delivery_, [done]() {
        done->set_value();
    });
    delivered.wait();
}

void ProgressReporter::deliver(const ProgressEvent& event) {
    std::vector<std::shared_ptr<ProgressListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        try {
            if (event.type() == CHUNK_STATE) {
                listener->on_chunk_state_changed(event);
            } else {
                listener->on_session_state_changed(event);
            }
        } catch (const std::exception& e) {
            std::cerr << "[Progress] Listener failed on event for " << event.session_id()
                      << ": " << e.what() << std::endl;
        }
    }
}

}
