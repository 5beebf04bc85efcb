/**
 * @file test_upload_coordinator.cpp
 * @brief Unit tests for the local storage to node leg
 */

#include <gtest/gtest.h>

#include <kcenon/media_relay/transfer/upload_coordinator.h>

#include "../../support/fake_upload_sink.h"
#include "../../support/inline_io_pool.h"
#include "../../support/manual_dispatcher.h"
#include "../../support/recording_leg_events.h"
#include "../../support/recording_notifier.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>

namespace kcenon::media_relay::test {

class UploadCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("media_relay_test_upload_" +
                     std::to_string(std::chrono::steady_clock::now()
                                        .time_since_epoch()
                                        .count()));
        std::filesystem::create_directories(test_dir_);

        command_queue_config config;
        config.name = "server";
        config.start_enabled = true;
        queue_ = std::make_unique<command_queue>(dispatcher_, notifier_, config);
        leg_ = std::make_unique<upload_coordinator>(
            dispatcher_, *queue_, notifier_, pool_, sink_, catalog_);
        leg_->set_upload_events(&events_);
        leg_->set_state_listener([this](const transfer_state& state) {
            last_ = state;
            if (on_publish_) {
                on_publish_(state);
            }
        });
    }

    void TearDown() override {
        leg_.reset();
        queue_.reset();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto write_file(const std::string& file_name, std::size_t size) -> std::filesystem::path {
        auto path = test_dir_ / file_name;
        std::ofstream out(path, std::ios::binary);
        for (std::size_t i = 0; i < size; ++i) {
            out.put(static_cast<char>('A' + (i + file_name.size()) % 26));
        }
        return path;
    }

    static auto read_file(const std::filesystem::path& path) -> std::string {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    auto local(const std::string& name, std::size_t size) -> local_media {
        return local_media{write_file(name, size), name};
    }

    auto hand_off(const std::string& name, std::size_t size) -> local_media {
        return local_media{write_file(temp_name(name), size), name};
    }

    auto settle() -> bool {
        return dispatcher_.run_until([this] { return !leg_->is_active(); });
    }

    auto settle_paused() -> bool {
        return dispatcher_.run_until([this] {
            auto s = leg_->snapshot();
            return s && s->is_paused() && !leg_->has_in_flight();
        });
    }

    void pause_on_first_publish() {
        on_publish_ = [this, fired = false](const transfer_state&) mutable {
            if (!fired) {
                fired = true;
                leg_->pause();
            }
        };
    }

    std::filesystem::path test_dir_;
    manual_dispatcher dispatcher_;
    recording_notifier notifier_;
    inline_io_pool pool_;
    fake_upload_sink sink_{64};
    remote_catalog catalog_;
    recording_upload_events events_;
    std::unique_ptr<command_queue> queue_;
    std::unique_ptr<upload_coordinator> leg_;
    std::optional<transfer_state> last_;
    std::function<void(const transfer_state&)> on_publish_;
};

// ============================================================================
// Completion
// ============================================================================

TEST_F(UploadCoordinatorTest, UploadsLocalFiles) {
    auto a = local("a.mp4", 100);
    auto b = local("b.mp4", 300);

    leg_->request_upload({a, b}, {});
    ASSERT_TRUE(settle());

    auto received = sink_.received();
    EXPECT_EQ(received["a.mp4"], read_file(a.path));
    EXPECT_EQ(received["b.mp4"], read_file(b.path));
    EXPECT_EQ(sink_.calls(), (std::vector<std::string>{"a.mp4", "b.mp4"}));
    EXPECT_TRUE(catalog_.contains("a.mp4"));
    EXPECT_TRUE(catalog_.contains("b.mp4"));
    EXPECT_TRUE(std::filesystem::exists(a.path));

    ASSERT_TRUE(last_.has_value());
    EXPECT_EQ(last_->transferred_files(), 2u);
    EXPECT_EQ(last_->transferred_bytes(), 400u);
}

TEST_F(UploadCoordinatorTest, HandOffFileRemovedAfterUpload) {
    auto a = hand_off("a.mp4", 120);
    const auto content = read_file(a.path);

    leg_->request_upload({a}, {});
    ASSERT_TRUE(settle());

    EXPECT_EQ(sink_.received()["a.mp4"], content);
    EXPECT_FALSE(std::filesystem::exists(a.path));
}

TEST_F(UploadCoordinatorTest, RemoteAndEmptyFilesAreSkipped) {
    catalog_.insert("a.mp4");
    catalog_.insert("c.mp4");
    auto a = hand_off("a.mp4", 100);
    auto empty = local("empty.mp4", 0);

    leg_->request_upload({a, empty}, {{"c.mp4", 10}});
    dispatcher_.run_ready();

    EXPECT_FALSE(leg_->is_active());
    EXPECT_TRUE(sink_.calls().empty());
    EXPECT_FALSE(std::filesystem::exists(a.path));
    EXPECT_EQ(events_.cancelled, (std::vector<std::string>{"c.mp4"}));
    ASSERT_EQ(notifier_.count(), 1u);
    EXPECT_EQ(notifier_.notices()[0].title, "Upload Skipped");
    EXPECT_NE(notifier_.notices()[0].message.find("(3)"), std::string::npos);
}

// ============================================================================
// Waiting entries
// ============================================================================

TEST_F(UploadCoordinatorTest, WaitingOnlySetForcePauses) {
    leg_->request_upload({}, {{"a.mp4", 90}});
    ASSERT_TRUE(settle_paused());

    EXPECT_EQ(leg_->paused_reason(), pause_reason::system);
    auto r = leg_->resume();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::transfer_force_paused);

    auto arrived = hand_off("a.mp4", 90);
    leg_->on_download_completed("a.mp4", arrived.path);
    EXPECT_EQ(leg_->paused_reason(), pause_reason::none);

    ASSERT_TRUE(settle());
    EXPECT_EQ(sink_.received().count("a.mp4"), 1u);
    EXPECT_FALSE(std::filesystem::exists(arrived.path));
}

TEST_F(UploadCoordinatorTest, EarlyArrivalIsRemembered) {
    auto arrived = hand_off("a.mp4", 70);
    leg_->on_download_completed("a.mp4", arrived.path);
    EXPECT_EQ(leg_->local_copy_for("a.mp4"), std::optional<std::filesystem::path>(arrived.path));

    leg_->request_upload({}, {{"a.mp4", 70}});
    ASSERT_TRUE(settle());

    EXPECT_EQ(sink_.calls(), (std::vector<std::string>{"a.mp4"}));
    EXPECT_FALSE(leg_->local_copy_for("a.mp4").has_value());
}

TEST_F(UploadCoordinatorTest, CancelledDownloadsDropWaitingEntries) {
    auto a = local("a.mp4", 64);
    pause_on_first_publish();

    leg_->request_upload({a}, {{"b.mp4", 10}, {"c.mp4", 10}});
    ASSERT_TRUE(settle_paused());
    const auto before = *leg_->snapshot();

    leg_->on_download_cancelled({"b.mp4"});
    const auto after = *leg_->snapshot();
    EXPECT_FALSE(after.has_waiting("b.mp4"));
    EXPECT_TRUE(after.has_waiting("c.mp4"));
    EXPECT_EQ(after.total_bytes(), before.total_bytes() - 10);
    EXPECT_EQ(after.total_files(), before.total_files() - 1);
    EXPECT_TRUE(after.invariant_holds());

    leg_->stop();
    leg_->request_upload({}, {{"d.mp4", 10}});
    ASSERT_TRUE(settle_paused());
    leg_->on_download_cancelled({"d.mp4"});
    EXPECT_FALSE(leg_->is_active());
}

// ============================================================================
// Pause / resume
// ============================================================================

TEST_F(UploadCoordinatorTest, PauseBeforeFirstStepHoldsLeg) {
    auto a = local("a.mp4", 200);
    pause_on_first_publish();

    leg_->request_upload({a}, {});
    ASSERT_TRUE(settle_paused());
    EXPECT_EQ(leg_->paused_reason(), pause_reason::user);
    EXPECT_TRUE(sink_.calls().empty());

    ASSERT_TRUE(leg_->resume());
    ASSERT_TRUE(settle());
    EXPECT_EQ(sink_.calls(), (std::vector<std::string>{"a.mp4"}));
}

TEST_F(UploadCoordinatorTest, ProgressQueuedBeforePauseIsIgnored) {
    auto a = local("a.mp4", 300);
    // Four chunks of progress are queued before the first one is applied
    sink_.fail_next_after(256, error_code::upload_cancelled);

    std::vector<uint64_t> offsets_while_paused;
    on_publish_ = [this, &offsets_while_paused](const transfer_state& state) {
        if (state.is_paused()) {
            if (state.cursor()) {
                offsets_while_paused.push_back(state.cursor()->offset);
            }
            return;
        }
        if (state.cursor() && state.cursor()->offset > 0) {
            leg_->pause();
        }
    };

    leg_->request_upload({a}, {});
    ASSERT_TRUE(settle_paused());

    EXPECT_EQ(sink_.calls(), (std::vector<std::string>{"a.mp4"}));
    for (auto offset : offsets_while_paused) {
        EXPECT_EQ(offset, 0u);
    }
    auto snapshot = leg_->snapshot();
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->transferred_bytes(), 0u);
    if (snapshot->cursor()) {
        EXPECT_EQ(snapshot->cursor()->offset, 0u);
    }
}

TEST_F(UploadCoordinatorTest, UserPausedLegRestartsOnlyWhenAsked) {
    auto a = local("a.mp4", 64);
    pause_on_first_publish();
    leg_->request_upload({a}, {});
    ASSERT_TRUE(settle_paused());

    leg_->request_upload({local("b.mp4", 64)}, {}, false);
    dispatcher_.run_ready();
    EXPECT_EQ(leg_->paused_reason(), pause_reason::user);
    EXPECT_TRUE(sink_.calls().empty());

    leg_->request_upload({local("c.mp4", 64)}, {}, true);
    ASSERT_TRUE(settle());
    EXPECT_EQ(sink_.calls().size(), 3u);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(UploadCoordinatorTest, RejectionPausesLeg) {
    auto a = local("a.mp4", 100);
    sink_.fail_next(error_code::remote_rejected, "quota exceeded");

    leg_->request_upload({a}, {});
    ASSERT_TRUE(settle_paused());

    EXPECT_EQ(leg_->paused_reason(), pause_reason::user);
    EXPECT_EQ(leg_->snapshot()->cursor()->offset, 0u);
    ASSERT_EQ(notifier_.count(), 1u);
    EXPECT_EQ(notifier_.notices()[0].title, "Error Uploading Media");
    EXPECT_EQ(notifier_.notices()[0].message, "quota exceeded");

    ASSERT_TRUE(leg_->resume());
    ASSERT_TRUE(settle());
    EXPECT_EQ(sink_.calls(), (std::vector<std::string>{"a.mp4", "a.mp4"}));
}

TEST_F(UploadCoordinatorTest, LocalReadFailureDropsEntry) {
    auto a = local("a.mp4", 100);
    auto b = local("b.mp4", 100);
    sink_.fail_next(error_code::file_read_error, "unreadable");

    leg_->request_upload({a, b}, {});
    ASSERT_TRUE(settle());

    EXPECT_EQ(sink_.received().count("a.mp4"), 0u);
    EXPECT_EQ(sink_.received().count("b.mp4"), 1u);
    EXPECT_EQ(events_.cancelled, (std::vector<std::string>{"a.mp4"}));
    ASSERT_EQ(notifier_.count(), 1u);
    EXPECT_EQ(notifier_.notices()[0].message, "unreadable");
}

TEST_F(UploadCoordinatorTest, MissingLocalCopyDropsEntry) {
    auto a = local("a.mp4", 100);
    auto b = local("b.mp4", 100);
    pause_on_first_publish();
    leg_->request_upload({a, b}, {});
    ASSERT_TRUE(settle_paused());

    std::filesystem::remove(a.path);
    ASSERT_TRUE(leg_->resume());
    ASSERT_TRUE(settle());

    EXPECT_EQ(sink_.calls(), (std::vector<std::string>{"b.mp4"}));
    EXPECT_EQ(events_.cancelled, (std::vector<std::string>{"a.mp4"}));
    EXPECT_EQ(notifier_.count(), 1u);
}

TEST_F(UploadCoordinatorTest, InterruptedUploadRestartsFromZero) {
    auto a = local("a.mp4", 300);
    sink_.fail_next_after(128, error_code::connection_lost);

    std::vector<uint64_t> offsets;
    on_publish_ = [&offsets](const transfer_state& state) {
        if (state.cursor()) {
            offsets.push_back(state.cursor()->offset);
        }
    };

    leg_->request_upload({a}, {});
    ASSERT_TRUE(settle());

    EXPECT_EQ(sink_.received()["a.mp4"], read_file(a.path));
    EXPECT_EQ(queue_->retries_scheduled(), 1u);
    ASSERT_GE(offsets.size(), 2u);
    EXPECT_NE(std::find(offsets.begin(), offsets.end(), 128u), offsets.end());
    EXPECT_EQ(last_->transferred_bytes(), 300u);
}

TEST_F(UploadCoordinatorTest, NodeUnreachableForcePausesAfterRetries) {
    auto a = local("a.mp4", 100);
    for (int i = 0; i < 4; ++i) {
        sink_.fail_next(error_code::connection_refused);
    }

    leg_->request_upload({a}, {});
    ASSERT_TRUE(settle_paused());

    EXPECT_EQ(leg_->paused_reason(), pause_reason::system);
    EXPECT_EQ(sink_.calls().size(), 4u);
    EXPECT_EQ(notifier_.count(), 1u);

    leg_->release_force_pause();
    ASSERT_TRUE(settle());
    EXPECT_EQ(sink_.received().count("a.mp4"), 1u);
}

// ============================================================================
// Stop
// ============================================================================

TEST_F(UploadCoordinatorTest, StopDiscardsHandOffsAndCancelsDownloads) {
    auto a = hand_off("a.mp4", 100);
    pause_on_first_publish();
    leg_->request_upload({a}, {{"b.mp4", 50}});
    ASSERT_TRUE(settle_paused());

    auto early = hand_off("z.mp4", 10);
    leg_->on_download_completed("z.mp4", early.path);

    leg_->stop();

    EXPECT_FALSE(leg_->is_active());
    EXPECT_FALSE(std::filesystem::exists(a.path));
    EXPECT_FALSE(std::filesystem::exists(early.path));
    EXPECT_EQ(events_.cancelled, (std::vector<std::string>{"a.mp4", "b.mp4"}));
    EXPECT_TRUE(sink_.calls().empty());
}

}  // namespace kcenon::media_relay::test
