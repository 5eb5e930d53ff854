/**
 * @file test_progress_tracker.cpp
 * @brief Unit tests for progress_tracker
 */

#include <gtest/gtest.h>

#include <chunk_relay/core/progress_tracker.h>

#include <atomic>
#include <thread>
#include <vector>

namespace chunk_relay::test {

class ProgressTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tracker_ = std::make_unique<progress_tracker>();
        id_ = session_id::generate();
    }

    std::unique_ptr<progress_tracker> tracker_;
    session_id id_;
};

// =============================================================================
// Registration
// =============================================================================

TEST_F(ProgressTrackerTest, Register_InitialSnapshot) {
    ASSERT_TRUE(tracker_->register_session(id_, transfer_direction::upload, 1000).has_value());

    auto snap = tracker_->snapshot(id_);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap.value().id, id_);
    EXPECT_EQ(snap.value().state, session_state::active);
    EXPECT_EQ(snap.value().direction, transfer_direction::upload);
    EXPECT_EQ(snap.value().bytes_transferred, 0u);
    EXPECT_EQ(snap.value().total_size.value_or(0), 1000u);
    EXPECT_DOUBLE_EQ(snap.value().percent, 0.0);
}

TEST_F(ProgressTrackerTest, Register_Duplicate) {
    ASSERT_TRUE(tracker_->register_session(id_, transfer_direction::upload, 1000).has_value());
    auto again = tracker_->register_session(id_, transfer_direction::upload, 1000);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::invalid_state);
}

TEST_F(ProgressTrackerTest, UnknownSession) {
    auto snap = tracker_->snapshot(id_);
    ASSERT_FALSE(snap.has_value());
    EXPECT_EQ(snap.error().code, error_code::session_not_found);

    auto rec = tracker_->record_progress(id_, 10);
    ASSERT_FALSE(rec.has_value());
    EXPECT_EQ(rec.error().code, error_code::session_not_found);
}

// =============================================================================
// Progress updates
// =============================================================================

TEST_F(ProgressTrackerTest, RecordProgress_Percent) {
    ASSERT_TRUE(tracker_->register_session(id_, transfer_direction::upload, 1000).has_value());
    ASSERT_TRUE(tracker_->record_progress(id_, 250).has_value());

    auto snap = tracker_->snapshot(id_);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap.value().bytes_transferred, 250u);
    EXPECT_DOUBLE_EQ(snap.value().percent, 25.0);
}

TEST_F(ProgressTrackerTest, RecordProgress_IgnoresRegression) {
    ASSERT_TRUE(tracker_->register_session(id_, transfer_direction::upload, 1000).has_value());
    ASSERT_TRUE(tracker_->record_progress(id_, 500).has_value());
    ASSERT_TRUE(tracker_->record_progress(id_, 300).has_value());
    ASSERT_TRUE(tracker_->record_progress(id_, 500).has_value());

    auto snap = tracker_->snapshot(id_);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap.value().bytes_transferred, 500u);
}

TEST_F(ProgressTrackerTest, RecordProgress_RateAndEta) {
    ASSERT_TRUE(tracker_->register_session(id_, transfer_direction::upload, 10000).has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ASSERT_TRUE(tracker_->record_progress(id_, 1000).has_value());

    auto snap = tracker_->snapshot(id_);
    ASSERT_TRUE(snap.has_value());
    EXPECT_GT(snap.value().current_rate_bytes_per_sec, 0.0);
    ASSERT_TRUE(snap.value().eta_seconds.has_value());
    EXPECT_GT(*snap.value().eta_seconds, 0.0);
}

TEST_F(ProgressTrackerTest, UnknownTotal_PercentZeroUntilComplete) {
    ASSERT_TRUE(
        tracker_->register_session(id_, transfer_direction::upload, std::nullopt).has_value());
    ASSERT_TRUE(tracker_->record_progress(id_, 4096).has_value());

    auto snap = tracker_->snapshot(id_);
    ASSERT_TRUE(snap.has_value());
    EXPECT_DOUBLE_EQ(snap.value().percent, 0.0);
    EXPECT_FALSE(snap.value().eta_seconds.has_value());

    ASSERT_TRUE(tracker_->mark_terminal(id_, session_state::completed).has_value());
    auto done = tracker_->snapshot(id_);
    ASSERT_TRUE(done.has_value());
    EXPECT_DOUBLE_EQ(done.value().percent, 100.0);
    EXPECT_DOUBLE_EQ(done.value().eta_seconds.value_or(-1.0), 0.0);
}

TEST_F(ProgressTrackerTest, SetTotalSize) {
    ASSERT_TRUE(
        tracker_->register_session(id_, transfer_direction::upload, std::nullopt).has_value());
    ASSERT_TRUE(tracker_->record_progress(id_, 500).has_value());
    ASSERT_TRUE(tracker_->set_total_size(id_, 1000).has_value());

    auto snap = tracker_->snapshot(id_);
    ASSERT_TRUE(snap.has_value());
    EXPECT_DOUBLE_EQ(snap.value().percent, 50.0);
}

// =============================================================================
// Terminal states
// =============================================================================

TEST_F(ProgressTrackerTest, MarkTerminal_RejectsNonTerminalState) {
    ASSERT_TRUE(tracker_->register_session(id_, transfer_direction::upload, 100).has_value());
    auto r = tracker_->mark_terminal(id_, session_state::active);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::invalid_state);
}

TEST_F(ProgressTrackerTest, MarkTerminal_OnlyOnce) {
    ASSERT_TRUE(tracker_->register_session(id_, transfer_direction::upload, 100).has_value());
    ASSERT_TRUE(tracker_->mark_terminal(id_, session_state::failed).has_value());
    auto again = tracker_->mark_terminal(id_, session_state::completed);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::invalid_state);
}

TEST_F(ProgressTrackerTest, TerminalEntry_IgnoresProgress) {
    ASSERT_TRUE(tracker_->register_session(id_, transfer_direction::upload, 100).has_value());
    ASSERT_TRUE(tracker_->record_progress(id_, 40).has_value());
    ASSERT_TRUE(tracker_->mark_terminal(id_, session_state::cancelled).has_value());
    ASSERT_TRUE(tracker_->record_progress(id_, 90).has_value());

    auto snap = tracker_->snapshot(id_);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap.value().state, session_state::cancelled);
    EXPECT_EQ(snap.value().bytes_transferred, 40u);
    EXPECT_DOUBLE_EQ(snap.value().current_rate_bytes_per_sec, 0.0);
}

TEST_F(ProgressTrackerTest, TerminalSnapshot_ObservedOnce) {
    ASSERT_TRUE(tracker_->register_session(id_, transfer_direction::upload, 100).has_value());
    ASSERT_TRUE(tracker_->record_progress(id_, 100).has_value());
    ASSERT_TRUE(tracker_->mark_terminal(id_, session_state::completed).has_value());

    auto first = tracker_->snapshot(id_);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value().state, session_state::completed);
    EXPECT_DOUBLE_EQ(first.value().percent, 100.0);

    auto second = tracker_->snapshot(id_);
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::session_not_found);
    EXPECT_EQ(tracker_->size(), 0u);
}

TEST_F(ProgressTrackerTest, PurgeExpired) {
    progress_tracker::config cfg;
    cfg.retention = std::chrono::milliseconds(0);
    progress_tracker tracker(cfg);

    auto running = session_id::generate();
    ASSERT_TRUE(tracker.register_session(id_, transfer_direction::upload, 10).has_value());
    ASSERT_TRUE(tracker.register_session(running, transfer_direction::upload, 10).has_value());
    ASSERT_TRUE(tracker.mark_terminal(id_, session_state::failed).has_value());

    EXPECT_EQ(tracker.purge_expired(), 1u);
    EXPECT_EQ(tracker.size(), 1u);
    EXPECT_TRUE(tracker.snapshot(running).has_value());
}

TEST_F(ProgressTrackerTest, PurgeKeepsFreshTerminalEntries) {
    ASSERT_TRUE(tracker_->register_session(id_, transfer_direction::upload, 10).has_value());
    ASSERT_TRUE(tracker_->mark_terminal(id_, session_state::failed).has_value());
    EXPECT_EQ(tracker_->purge_expired(), 0u);
    EXPECT_EQ(tracker_->size(), 1u);
}

// =============================================================================
// Listener and concurrency
// =============================================================================

TEST_F(ProgressTrackerTest, Listener_SeesEveryPublish) {
    std::vector<progress_snapshot> seen;
    tracker_->set_listener([&](const progress_snapshot& snap) { seen.push_back(snap); });

    ASSERT_TRUE(tracker_->register_session(id_, transfer_direction::download, 30).has_value());
    ASSERT_TRUE(tracker_->record_progress(id_, 10).has_value());
    ASSERT_TRUE(tracker_->record_progress(id_, 30).has_value());
    ASSERT_TRUE(tracker_->mark_terminal(id_, session_state::completed).has_value());

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].bytes_transferred, 10u);
    EXPECT_EQ(seen[2].state, session_state::completed);
}

TEST_F(ProgressTrackerTest, ConcurrentReadersSeeMonotonicBytes) {
    ASSERT_TRUE(tracker_->register_session(id_, transfer_direction::upload, 100000).has_value());

    std::atomic<bool> done{false};
    std::atomic<bool> regressed{false};
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            uint64_t last = 0;
            while (!done.load()) {
                auto snap = tracker_->snapshot(id_);
                if (snap && snap.value().bytes_transferred < last) {
                    regressed = true;
                }
                if (snap) {
                    last = snap.value().bytes_transferred;
                }
            }
        });
    }

    for (uint64_t b = 1; b <= 100000; b += 97) {
        ASSERT_TRUE(tracker_->record_progress(id_, b).has_value());
    }
    done = true;
    for (auto& t : readers) {
        t.join();
    }
    EXPECT_FALSE(regressed.load());
}

}  // namespace chunk_relay::test
