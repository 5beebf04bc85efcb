/**
 * @file test_command_queue.cpp
 * @brief Unit tests for command_queue
 */

#include <gtest/gtest.h>

#include <kcenon/media_relay/executor/command_queue.h>

#include "../../support/manual_dispatcher.h"
#include "../../support/recording_notifier.h"

#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::media_relay::test {

namespace {

struct outcome {
    bool success = true;
    bool retryable = false;
    std::optional<user_error> err;
};

/**
 * @brief Records its runs and answers from a script; the last answer repeats
 */
class scripted_command : public command {
public:
    scripted_command(std::string label, std::vector<std::string>& log,
                     std::deque<outcome> script = {}, bool complete_now = true)
        : label_(std::move(label)), log_(log), script_(std::move(script)),
          complete_now_(complete_now) {}

    void execute(command_completion completion) override {
        log_.push_back(label_);
        if (!complete_now_) {
            held_ = std::move(completion);
            return;
        }
        outcome next;
        if (!script_.empty()) {
            next = script_.front();
            if (script_.size() > 1) {
                script_.pop_front();
            }
        }
        completion(next.success, next.retryable, next.err);
    }

    [[nodiscard]] auto name() const -> std::string override { return label_; }

    void on_abandoned(const std::optional<user_error>&) override {
        log_.push_back(label_ + ":abandoned");
    }

    command_completion held_;

private:
    std::string label_;
    std::vector<std::string>& log_;
    std::deque<outcome> script_;
    bool complete_now_;
};

class other_command : public command {
public:
    explicit other_command(std::vector<std::string>& log) : log_(log) {}
    void execute(command_completion completion) override {
        log_.push_back("other");
        completion(true, false, std::nullopt);
    }
    [[nodiscard]] auto name() const -> std::string override { return "other"; }

private:
    std::vector<std::string>& log_;
};

}  // namespace

class CommandQueueTest : public ::testing::Test {
protected:
    auto make_queue(uint32_t retries = 3, bool enabled = true) -> std::unique_ptr<command_queue> {
        command_queue_config config;
        config.retries = retries;
        config.retry_delay = std::chrono::milliseconds(1000);
        config.name = "test";
        config.start_enabled = enabled;
        return std::make_unique<command_queue>(dispatcher_, notifier_, config);
    }

    auto cmd(const std::string& label, std::deque<outcome> script = {})
        -> std::unique_ptr<scripted_command> {
        return std::make_unique<scripted_command>(label, log_, std::move(script));
    }

    manual_dispatcher dispatcher_;
    recording_notifier notifier_;
    std::vector<std::string> log_;
};

// ============================================================================
// Ordering
// ============================================================================

TEST_F(CommandQueueTest, RunsInPushOrder) {
    auto queue = make_queue();
    queue->push(cmd("a"));
    queue->push(cmd("b"));
    queue->push(cmd("c"));
    dispatcher_.run_ready();

    EXPECT_EQ(log_, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(queue->size(), 0u);
    EXPECT_FALSE(queue->is_executing());
}

TEST_F(CommandQueueTest, OneAtATime) {
    auto queue = make_queue();
    auto held = std::make_unique<scripted_command>("slow", log_, std::deque<outcome>{}, false);
    auto* slow = held.get();
    queue->push(std::move(held));
    queue->push(cmd("next"));
    dispatcher_.run_ready();

    EXPECT_EQ(log_, (std::vector<std::string>{"slow"}));
    EXPECT_TRUE(queue->is_executing());

    slow->held_(true, false, std::nullopt);
    dispatcher_.run_ready();
    EXPECT_EQ(log_, (std::vector<std::string>{"slow", "next"}));
}

TEST_F(CommandQueueTest, PrependRunsNext) {
    auto queue = make_queue(3, false);
    queue->push(cmd("a"));
    queue->push(cmd("b"));
    queue->prepend(cmd("first"));
    queue->set_enabled(true);
    dispatcher_.run_ready();

    EXPECT_EQ(log_, (std::vector<std::string>{"first", "a", "b"}));
}

TEST_F(CommandQueueTest, PushOnceSkipsSameType) {
    auto queue = make_queue(3, false);
    EXPECT_TRUE(queue->push_once(cmd("a")));
    EXPECT_FALSE(queue->push_once(cmd("b")));
    EXPECT_TRUE(queue->push_once(std::make_unique<other_command>(log_)));
    EXPECT_EQ(queue->size(), 2u);

    queue->set_enabled(true);
    dispatcher_.run_ready();
    EXPECT_EQ(log_, (std::vector<std::string>{"a", "other"}));
}

TEST_F(CommandQueueTest, DisabledQueueHoldsCommands) {
    auto queue = make_queue(3, false);
    queue->push(cmd("a"));
    dispatcher_.run_ready();
    EXPECT_TRUE(log_.empty());
    EXPECT_EQ(queue->size(), 1u);

    queue->set_enabled(true);
    dispatcher_.run_ready();
    EXPECT_EQ(log_, (std::vector<std::string>{"a"}));
}

TEST_F(CommandQueueTest, StartsDisabledByDefault) {
    command_queue queue(dispatcher_, notifier_);
    EXPECT_FALSE(queue.is_enabled());
}

// ============================================================================
// Retry
// ============================================================================

TEST_F(CommandQueueTest, RetryableFailureRunsRetriesPlusOneTimes) {
    auto queue = make_queue(3);
    queue->push(cmd("flaky", {outcome{false, true, user_error{"Title", "boom"}}}));
    queue->push(cmd("after"));

    dispatcher_.run_until([&] { return log_.size() >= 6; });

    EXPECT_EQ(log_, (std::vector<std::string>{"flaky", "flaky", "flaky", "flaky",
                                              "flaky:abandoned", "after"}));
    EXPECT_EQ(queue->retries_scheduled(), 3u);
    ASSERT_EQ(notifier_.count(), 1u);
    EXPECT_EQ(notifier_.notices()[0], (user_error{"Title", "boom"}));
}

TEST_F(CommandQueueTest, RetryWaitsForDelay) {
    auto queue = make_queue(1);
    queue->push(cmd("flaky", {outcome{false, true, std::nullopt}, outcome{}}));
    dispatcher_.run_ready();
    EXPECT_EQ(log_.size(), 1u);

    dispatcher_.advance(std::chrono::milliseconds(999));
    EXPECT_EQ(log_.size(), 1u);

    dispatcher_.advance(std::chrono::milliseconds(1));
    EXPECT_EQ(log_, (std::vector<std::string>{"flaky", "flaky"}));
    EXPECT_EQ(notifier_.count(), 0u);
}

TEST_F(CommandQueueTest, RetryCountResetsAfterSuccess) {
    auto queue = make_queue(1);
    queue->push(cmd("a", {outcome{false, true, std::nullopt}, outcome{}}));
    queue->push(cmd("b", {outcome{false, true, std::nullopt}, outcome{}}));
    dispatcher_.run_until([&] { return log_.size() >= 4; });

    EXPECT_EQ(log_, (std::vector<std::string>{"a", "a", "b", "b"}));
    EXPECT_EQ(notifier_.count(), 0u);
    EXPECT_EQ(queue->retries_scheduled(), 2u);
}

TEST_F(CommandQueueTest, NonRetryableRunsOnce) {
    auto queue = make_queue(3);
    queue->push(cmd("bad", {outcome{false, false, user_error{"Error Uploading Media", "no"}}}));
    queue->push(cmd("after"));
    dispatcher_.run_ready();

    EXPECT_EQ(log_, (std::vector<std::string>{"bad", "bad:abandoned", "after"}));
    EXPECT_EQ(queue->retries_scheduled(), 0u);
    ASSERT_EQ(notifier_.count(), 1u);
    EXPECT_EQ(notifier_.notices()[0].title, "Error Uploading Media");
}

TEST_F(CommandQueueTest, MissingErrorUsesGenericNotice) {
    auto queue = make_queue(0);
    queue->push(cmd("bad", {outcome{false, false, std::nullopt}}));
    dispatcher_.run_ready();

    ASSERT_EQ(notifier_.count(), 1u);
    EXPECT_EQ(notifier_.notices()[0].title, generic_error_title);
    EXPECT_EQ(notifier_.notices()[0].message, generic_error_message);
}

// ============================================================================
// Disable / clear
// ============================================================================

TEST_F(CommandQueueTest, FailureWhileDisabledIsKeptAtHead) {
    auto queue = make_queue(3);
    auto held = std::make_unique<scripted_command>("upload", log_, std::deque<outcome>{}, false);
    auto* upload = held.get();
    queue->push(std::move(held));
    queue->push(cmd("after"));
    dispatcher_.run_ready();

    queue->set_enabled(false);
    upload->held_(false, true, std::nullopt);
    dispatcher_.run_ready();

    EXPECT_EQ(queue->size(), 2u);
    EXPECT_EQ(notifier_.count(), 0u);
    EXPECT_EQ(queue->retries_scheduled(), 0u);

    upload->held_ = nullptr;
    queue->set_enabled(true);
    dispatcher_.run_ready();
    EXPECT_EQ(log_, (std::vector<std::string>{"upload", "upload"}));
}

TEST_F(CommandQueueTest, SuccessWhileDisabledIsRequeuedAtHead) {
    auto queue = make_queue(3);
    auto held = std::make_unique<scripted_command>("slow", log_, std::deque<outcome>{}, false);
    auto* slow = held.get();
    queue->push(std::move(held));
    queue->push(cmd("after"));
    dispatcher_.run_ready();

    queue->set_enabled(false);
    slow->held_(true, false, std::nullopt);
    dispatcher_.run_ready();
    EXPECT_EQ(log_, (std::vector<std::string>{"slow"}));
    EXPECT_EQ(queue->size(), 2u);
    EXPECT_EQ(queue->retries_scheduled(), 0u);

    queue->set_enabled(true);
    dispatcher_.run_ready();
    EXPECT_EQ(log_, (std::vector<std::string>{"slow", "slow"}));

    slow->held_(true, false, std::nullopt);
    dispatcher_.run_ready();
    EXPECT_EQ(log_, (std::vector<std::string>{"slow", "slow", "after"}));
    EXPECT_EQ(queue->size(), 0u);
}

TEST_F(CommandQueueTest, RetryTimerDoesNotRunDisabledQueue) {
    auto queue = make_queue(3);
    queue->push(cmd("flaky", {outcome{false, true, std::nullopt}, outcome{}}));
    dispatcher_.run_ready();
    ASSERT_EQ(queue->retries_scheduled(), 1u);

    queue->set_enabled(false);
    dispatcher_.advance(std::chrono::seconds(5));
    EXPECT_EQ(log_.size(), 1u);

    queue->set_enabled(true);
    dispatcher_.run_ready();
    EXPECT_EQ(log_.size(), 2u);
}

TEST_F(CommandQueueTest, ClearIgnoresLateCompletion) {
    auto queue = make_queue(3);
    auto held = std::make_unique<scripted_command>("slow", log_, std::deque<outcome>{}, false);
    auto* slow = held.get();
    queue->push(std::move(held));
    queue->push(cmd("dropped"));
    dispatcher_.run_ready();

    auto completion = slow->held_;
    queue->clear();
    EXPECT_EQ(queue->size(), 0u);

    completion(false, false, user_error{"late", "late"});
    dispatcher_.run_ready();
    EXPECT_EQ(notifier_.count(), 0u);

    queue->push(cmd("fresh"));
    dispatcher_.run_ready();
    EXPECT_EQ(log_, (std::vector<std::string>{"slow", "fresh"}));
}

TEST_F(CommandQueueTest, CompletionAfterDestructionIsIgnored) {
    auto queue = make_queue(3);
    auto held = std::make_unique<scripted_command>("slow", log_, std::deque<outcome>{}, false);
    auto* slow = held.get();
    queue->push(std::move(held));
    dispatcher_.run_ready();

    auto completion = slow->held_;
    queue.reset();
    completion(true, false, std::nullopt);
    dispatcher_.run_ready();
    EXPECT_EQ(notifier_.count(), 0u);
}

}  // namespace kcenon::media_relay::test
