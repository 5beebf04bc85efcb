/**
 * @file test_node_session.cpp
 * @brief Unit tests for node_session and the node's reply formats
 */

#include <gtest/gtest.h>

#include <kcenon/media_relay/session/node_session.h>
#include <kcenon/media_relay/session/session_commands.h>

#include "../../support/deferred_io_pool.h"
#include "../../support/inline_io_pool.h"
#include "../../support/manual_dispatcher.h"
#include "../../support/recording_notifier.h"
#include "../../support/scripted_connection.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <thread>

namespace kcenon::media_relay::test {

namespace {

auto response_with(int status, const std::string& body) -> http_response {
    http_response response;
    response.status_code = status;
    response.status_line = "HTTP/1.1 " + std::to_string(status) + (status == 200 ? " OK" : " Error");
    response.body.assign(reinterpret_cast<const std::byte*>(body.data()),
                         reinterpret_cast<const std::byte*>(body.data()) + body.size());
    return response;
}

}  // namespace

// ============================================================================
// Upload reply parsing
// ============================================================================

TEST(UploadReplyTest, TaskIdIsReturned) {
    auto r = parse_upload_reply(response_with(200, "{\"taskID\": \"7f3a\"}"));
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), "7f3a");
}

TEST(UploadReplyTest, NodeErrorCarriesCodeAndMessage) {
    auto r = parse_upload_reply(response_with(200, "{\"code\": 12, \"message\": \"disk full\"}"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().category(), error_category::protocol);
    EXPECT_NE(r.error().message.find("error(12): disk full"), std::string::npos);
}

TEST(UploadReplyTest, ErrorStatusWithoutBody) {
    auto r = parse_upload_reply(response_with(503, ""));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::remote_rejected);
    EXPECT_NE(r.error().message.find("503"), std::string::npos);
}

TEST(UploadReplyTest, UnrecognizedBody) {
    auto r = parse_upload_reply(response_with(200, "<html>ok</html>"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::malformed_response);
    EXPECT_FALSE(r.error().retryable());
}

// ============================================================================
// Session
// ============================================================================

class NodeSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("media_relay_test_session_" +
                     std::to_string(std::chrono::steady_clock::now()
                                        .time_since_epoch()
                                        .count()));
        std::filesystem::create_directories(test_dir_);
        server_ = std::make_shared<scripted_server>();
        pool_ = std::make_shared<inline_io_pool>();
        queue_ = std::make_unique<command_queue>(dispatcher_, notifier_);
    }

    void TearDown() override {
        session_.reset();
        queue_.reset();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void make_session(node_session_config config = {}) {
        config.reconnect.initial_delay = std::chrono::milliseconds(1);
        config.reconnect.max_delay = std::chrono::milliseconds(2);
        session_ = std::make_unique<node_session>(
            dispatcher_, *queue_, catalog_,
            std::make_shared<scripted_connection_factory>(server_), pool_, config);
        session_->set_disconnect_handler([this] { ++disconnects_; });
    }

    void connect_with_catalog(const std::string& catalog_json) {
        server_->reply(http_reply(200, "OK", "{}"));
        server_->reply(http_reply(200, "OK", catalog_json));
        auto r = session_->connect({"10.0.0.9"});
        ASSERT_TRUE(r);
        dispatcher_.run_ready();
    }

    std::filesystem::path test_dir_;
    manual_dispatcher dispatcher_;
    recording_notifier notifier_;
    remote_catalog catalog_;
    std::shared_ptr<scripted_server> server_;
    std::shared_ptr<inline_io_pool> pool_;
    std::unique_ptr<command_queue> queue_;
    std::unique_ptr<node_session> session_;
    int disconnects_ = 0;
};

TEST_F(NodeSessionTest, ConnectRequiresAddresses) {
    make_session();
    auto r = session_->connect({});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::invalid_configuration);
}

TEST_F(NodeSessionTest, ConnectProbesCandidatesInOrder) {
    make_session();
    server_->accept_only({"10.0.0.2"});
    server_->reply(http_reply(200, "OK", "{}"));

    auto r = session_->connect({"10.0.0.1", "10.0.0.2"});
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), "10.0.0.2");
    EXPECT_EQ(session_->host(), "10.0.0.2");
    EXPECT_TRUE(session_->is_connected());
    EXPECT_EQ(server_->written().rfind("GET /node/connectuser HTTP/1.1\r\n", 0), 0u);
    EXPECT_EQ(server_->opens(), 2);
}

TEST_F(NodeSessionTest, ConnectFailsWhenNoNodeAnswers) {
    make_session();
    server_->accept_only({"10.0.0.7"});

    auto r = session_->connect({"10.0.0.1", "10.0.0.2"});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::connection_failed);
    EXPECT_FALSE(session_->is_connected());
    EXPECT_EQ(session_->state(), connection_state::disconnected);
}

TEST_F(NodeSessionTest, ProbeRejectsErrorStatus) {
    make_session();
    server_->reply(http_reply(500, "Internal Server Error", ""));

    auto r = session_->probe("10.0.0.3");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::unexpected_status);
}

TEST_F(NodeSessionTest, ConnectedEnablesQueueAndLoadsCatalog) {
    make_session();
    EXPECT_FALSE(queue_->is_enabled());

    connect_with_catalog("[\"x.mp4\", \"y.mp4\"]");

    EXPECT_TRUE(queue_->is_enabled());
    EXPECT_EQ(catalog_.size(), 2u);
    EXPECT_TRUE(catalog_.contains("x.mp4"));
    EXPECT_NE(server_->written().find("GET /project/list?folder=data HTTP/1.1\r\n"),
              std::string::npos);
}

TEST_F(NodeSessionTest, MalformedCatalogIsReported) {
    make_session();
    connect_with_catalog("{\"not\": \"a list\"}");

    EXPECT_EQ(catalog_.size(), 0u);
    ASSERT_EQ(notifier_.count(), 1u);
    EXPECT_EQ(notifier_.notices()[0].title, "Error Loading Files");
}

TEST_F(NodeSessionTest, RequestsCarrySessionHeaders) {
    node_session_config config;
    config.token = "secret-token";
    config.session_id = "s-42";
    make_session(config);

    auto request = session_->make_request("/project/list?folder=data", http_method::get);
    EXPECT_EQ(request.headers["Authorization"], "Bearer secret-token");
    EXPECT_EQ(request.headers["Session"], "s-42");
    EXPECT_EQ(request.headers.count("Content-Type"), 0u);

    auto post = session_->make_request("/project/command", http_method::post);
    EXPECT_EQ(post.headers["Content-Type"], "application/octet-stream");
}

TEST_F(NodeSessionTest, SendFileReturnsTaskId) {
    make_session();
    connect_with_catalog("[]");

    auto path = test_dir_ / "clip one.mp4";
    {
        std::ofstream out(path, std::ios::binary);
        out << std::string(300, 'v');
    }
    server_->reply(http_reply(200, "OK", "{\"taskID\":\"t-1\"}"));

    std::size_t sent = 0;
    auto r = session_->send_file("clip one.mp4", path, {}, [&](std::size_t n) { sent += n; });
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), "t-1");
    EXPECT_EQ(sent, 300u);
    EXPECT_NE(server_->written().find("POST /project/command?name=add&param1=clip%20one.mp4 "),
              std::string::npos);
}

TEST_F(NodeSessionTest, SendFileWithoutConnection) {
    make_session();
    auto r = session_->send_file("a.mp4", test_dir_ / "a.mp4", {}, nullptr);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::not_connected);
}

TEST_F(NodeSessionTest, DownloadRemoteWritesOutput) {
    make_session();
    connect_with_catalog("[]");
    server_->reply(http_reply(200, "OK", "rendered"));

    auto destination = test_dir_ / "out.mp4";
    ASSERT_TRUE(session_->download_remote("out.mp4", destination, nullptr));

    std::ifstream in(destination, std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "rendered");
}

TEST_F(NodeSessionTest, FetchCommandReportsMissingRemoteFile) {
    make_session();
    connect_with_catalog("[]");
    server_->reply(http_reply(404, "Not Found", "missing"));

    auto destination = test_dir_ / "out.mp4";
    queue_->push(std::make_unique<fetch_remote_file_command>(*session_, "out.mp4", destination));
    dispatcher_.run_ready();

    EXPECT_FALSE(std::filesystem::exists(destination));
    ASSERT_EQ(notifier_.count(), 1u);
    EXPECT_EQ(notifier_.notices()[0].title, "Error Downloading Result");
}

TEST_F(NodeSessionTest, DisconnectDisablesQueueAndNotifies) {
    make_session();
    connect_with_catalog("[]");
    ASSERT_TRUE(queue_->is_enabled());

    session_->disconnect();
    dispatcher_.run_ready();

    EXPECT_FALSE(queue_->is_enabled());
    EXPECT_EQ(disconnects_, 1);
    EXPECT_EQ(session_->state(), connection_state::disconnected);
}

TEST_F(NodeSessionTest, ReconnectFailureEndsSession) {
    node_session_config config;
    config.reconnect.max_attempts = 1;
    make_session(config);
    connect_with_catalog("[]");

    server_->refuse_opens(3);
    auto r = session_->fetch_catalog();
    ASSERT_FALSE(r);
    dispatcher_.run_ready();

    EXPECT_FALSE(queue_->is_enabled());
    EXPECT_EQ(disconnects_, 1);
}

TEST_F(NodeSessionTest, DestructionWaitsForCatalogTask) {
    auto deferred = std::make_shared<deferred_io_pool>();
    auto session = std::make_unique<node_session>(
        dispatcher_, *queue_, catalog_,
        std::make_shared<scripted_connection_factory>(server_), deferred, node_session_config{});

    bool completed = false;
    session->run_catalog_refresh([&](bool, bool, std::optional<user_error>) { completed = true; });
    ASSERT_EQ(deferred->active_tasks(), 1u);

    std::atomic<bool> destroyed{false};
    std::thread destroyer([&] {
        session.reset();
        destroyed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(destroyed.load());

    EXPECT_EQ(deferred->run_all(), 1u);
    destroyer.join();
    EXPECT_TRUE(destroyed.load());

    dispatcher_.run_ready();
    EXPECT_FALSE(completed);
    EXPECT_EQ(server_->opens(), 0);
}

}  // namespace kcenon::media_relay::test
