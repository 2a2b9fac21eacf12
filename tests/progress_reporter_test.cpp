#include "progress_reporter.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace chunkflow;

namespace {

ProgressEvent chunk_event(int32_t index, const std::string& status) {
    ProgressEvent event;
    event.set_session_id("s1");
    event.set_type(CHUNK_STATE);
    event.set_chunk_index(index);
    event.set_status(status);
    return event;
}

class ThrowingListener : public ProgressListener {
public:
    void on_chunk_state_changed(const ProgressEvent&) override {
        throw std::runtime_error("listener broke");
    }
    void on_session_state_changed(const ProgressEvent&) override {
        throw std::runtime_error("listener broke");
    }
};

}

TEST(ProgressReporterTest, DeliversInEmissionOrder) {
    ProgressReporter reporter;
    auto listener = std::make_shared<test::RecordingListener>();
    reporter.add_listener(listener);

    for (int32_t i = 0; i < 50; ++i) {
        reporter.emit(chunk_event(i, "uploading"));
    }
    ProgressEvent session;
    session.set_session_id("s1");
    session.set_type(SESSION_STATE);
    session.set_chunk_index(-1);
    session.set_status("completed");
    reporter.emit(session);
    reporter.flush();

    auto chunks = listener->chunk_events();
    ASSERT_EQ(chunks.size(), 50u);
    for (int32_t i = 0; i < 50; ++i) {
        EXPECT_EQ(chunks[static_cast<size_t>(i)].chunk_index(), i);
    }
    auto sessions = listener->session_events();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].status(), "completed");
}

TEST(ProgressReporterTest, FailingListenerDoesNotStopDelivery) {
    ProgressReporter reporter;
    auto recorder = std::make_shared<test::RecordingListener>();
    reporter.add_listener(std::make_shared<ThrowingListener>());
    reporter.add_listener(recorder);

    reporter.emit(chunk_event(0, "completed"));
    reporter.emit(chunk_event(1, "completed"));
    reporter.flush();

    EXPECT_EQ(recorder->chunk_events().size(), 2u);
}

TEST(ProgressReporterTest, FlushWithoutListenersReturns) {
    ProgressReporter reporter;
    reporter.emit(chunk_event(0, "pending"));
    reporter.flush();
    SUCCEED();
}
