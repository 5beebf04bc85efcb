/**
 * @file test_leg_cascade.cpp
 * @brief Download and upload legs wired to each other
 */

#include <gtest/gtest.h>

#include <kcenon/media_relay/transfer/download_coordinator.h>
#include <kcenon/media_relay/transfer/upload_coordinator.h>

#include "../../support/fake_upload_sink.h"
#include "../../support/inline_io_pool.h"
#include "../../support/manual_dispatcher.h"
#include "../../support/recording_notifier.h"
#include "../../support/scripted_media_source.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>

namespace kcenon::media_relay::test {

class LegCascadeTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("media_relay_test_cascade_" +
                     std::to_string(std::chrono::steady_clock::now()
                                        .time_since_epoch()
                                        .count()));
        store_ = std::make_unique<local_store>(test_dir_);
        ASSERT_TRUE(store_->prepare());

        command_queue_config device;
        device.name = "device";
        device.start_enabled = true;
        command_queue_config server;
        server.name = "server";
        server.start_enabled = true;
        device_queue_ = std::make_unique<command_queue>(dispatcher_, notifier_, device);
        server_queue_ = std::make_unique<command_queue>(dispatcher_, notifier_, server);

        download_ = std::make_unique<download_coordinator>(
            dispatcher_, *device_queue_, notifier_, pool_, source_, *store_);
        upload_ = std::make_unique<upload_coordinator>(
            dispatcher_, *server_queue_, notifier_, pool_, sink_, catalog_);
        download_->set_download_events(upload_.get());
        upload_->set_upload_events(download_.get());
    }

    void TearDown() override {
        download_->set_download_events(nullptr);
        upload_->set_upload_events(nullptr);
        download_.reset();
        upload_.reset();
        device_queue_.reset();
        server_queue_.reset();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto add(const std::string& name, std::size_t size) -> media_file {
        source_.add_file(name, size);
        media_file file;
        file.name = name;
        file.size = size;
        return file;
    }

    /**
     * @brief Ask for a device file on the node: upload waits, download fetches a hand-off
     */
    void relay(const std::vector<media_file>& files) {
        std::vector<waiting_entry> waiting;
        for (const auto& file : files) {
            waiting.push_back({file.name, file.size});
        }
        upload_->request_upload({}, waiting);
        download_->request_download(files, true);
    }

    auto both_idle() -> bool {
        return dispatcher_.run_until(
            [this] { return !download_->is_active() && !upload_->is_active(); });
    }

    static auto as_string(const std::vector<std::byte>& bytes) -> std::string {
        std::string out(bytes.size(), '\0');
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            out[i] = static_cast<char>(bytes[i]);
        }
        return out;
    }

    std::filesystem::path test_dir_;
    manual_dispatcher dispatcher_;
    recording_notifier notifier_;
    inline_io_pool pool_;
    scripted_media_source source_{64};
    fake_upload_sink sink_{64};
    remote_catalog catalog_;
    std::unique_ptr<local_store> store_;
    std::unique_ptr<command_queue> device_queue_;
    std::unique_ptr<command_queue> server_queue_;
    std::unique_ptr<download_coordinator> download_;
    std::unique_ptr<upload_coordinator> upload_;
};

TEST_F(LegCascadeTest, DeviceFilesReachNodeThroughHandOffs) {
    auto a = add("a.mp4", 100);
    auto b = add("b.mp4", 200);

    relay({a, b});
    ASSERT_TRUE(both_idle());

    auto received = sink_.received();
    EXPECT_EQ(received["a.mp4"], as_string(source_.content("a.mp4")));
    EXPECT_EQ(received["b.mp4"], as_string(source_.content("b.mp4")));

    EXPECT_FALSE(std::filesystem::exists(store_->temp_path("a.mp4")));
    EXPECT_FALSE(std::filesystem::exists(store_->temp_path("b.mp4")));
    EXPECT_FALSE(store_->contains("a.mp4"));
    EXPECT_EQ(notifier_.count(), 0u);
}

TEST_F(LegCascadeTest, LocalFilesSkipTheDevice) {
    auto a = add("a.mp4", 100);
    {
        std::ofstream out(store_->final_path("a.mp4"), std::ios::binary);
        out << "local copy";
    }

    relay({a});
    ASSERT_TRUE(both_idle());

    EXPECT_TRUE(source_.fetch_offsets("a.mp4").empty());
    EXPECT_EQ(sink_.received()["a.mp4"], "local copy");
    EXPECT_TRUE(store_->contains("a.mp4"));
}

TEST_F(LegCascadeTest, StoppingDownloadDropsWaitingUploads) {
    auto a = add("a.mp4", 256);
    auto b = add("b.mp4", 64);
    source_.set_chunk_hook([this, fired = false](const std::string&, uint64_t) mutable {
        if (!fired) {
            fired = true;
            download_->pause();
        }
    });

    relay({a, b});
    ASSERT_TRUE(dispatcher_.run_until([this] {
        return upload_->paused_reason() == pause_reason::system &&
               download_->paused_reason() == pause_reason::user &&
               !download_->has_in_flight();
    }));

    download_->stop();

    EXPECT_FALSE(download_->is_active());
    EXPECT_FALSE(upload_->is_active());
    EXPECT_TRUE(sink_.calls().empty());
}

TEST_F(LegCascadeTest, StoppingUploadDropsTemporaryDownloads) {
    auto a = add("a.mp4", 256);
    auto b = add("b.mp4", 64);
    source_.set_chunk_hook([this, fired = false](const std::string&, uint64_t) mutable {
        if (!fired) {
            fired = true;
            download_->pause();
        }
    });

    relay({a, b});
    ASSERT_TRUE(dispatcher_.run_until([this] {
        return download_->paused_reason() == pause_reason::user && !download_->has_in_flight();
    }));
    ASSERT_TRUE(std::filesystem::exists(store_->temp_path("a.mp4")));

    upload_->stop();

    EXPECT_FALSE(upload_->is_active());
    EXPECT_FALSE(download_->is_active());
    EXPECT_FALSE(std::filesystem::exists(store_->temp_path("a.mp4")));
}

TEST_F(LegCascadeTest, HandOffHeldByUploadIsReusedForLocalCopy) {
    auto a = add("a.mp4", 128);
    sink_.fail_next(error_code::remote_rejected);

    relay({a});
    ASSERT_TRUE(dispatcher_.run_until([this] {
        return !download_->is_active() && upload_->paused_reason() == pause_reason::user;
    }));
    ASSERT_TRUE(std::filesystem::exists(store_->temp_path("a.mp4")));

    download_->request_download({a}, false);
    dispatcher_.run_ready();

    EXPECT_TRUE(store_->contains("a.mp4"));
    EXPECT_EQ(source_.fetch_offsets("a.mp4").size(), 1u);
}

}  // namespace kcenon::media_relay::test
