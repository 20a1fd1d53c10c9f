#include <gtest/gtest.h>

#include "broker_state.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <atomic>
#include <future>
#include <memory>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using hengjing::MismatchError;
using hengjing::NothingPendingError;
using hengjing::ipc::BrokerState;
using hengjing::ipc::RequestChannel;

namespace {

class BrokerStateTest : public ::testing::Test {
protected:
    std::shared_ptr<RequestChannel> channel = std::make_shared<RequestChannel>();
    BrokerState state{channel};

    std::future<std::string> park(const std::string& id) {
        std::promise<std::string> resolver;
        auto answer = resolver.get_future();
        state.set_pending(make_request(id, "question " + id), std::move(resolver));
        return answer;
    }
};

bool is_cancelled(std::future<std::string>& answer) {
    try {
        answer.get();
    } catch (const std::future_error& exc) {
        return exc.code() == std::future_errc::broken_promise;
    }
    return false;
}

} // namespace

TEST_F(BrokerStateTest, ResolveWithNothingPendingFails) {
    EXPECT_THROW(state.resolve("r1", "Yes"), NothingPendingError);
}

TEST_F(BrokerStateTest, ResolveMatchingIdDeliversAnswer) {
    auto answer = park("r1");
    ASSERT_EQ(state.pending_id(), std::optional<std::string>("r1"));

    state.resolve("r1", "Yes");

    ASSERT_EQ(answer.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(answer.get(), "Yes");
    EXPECT_FALSE(state.has_pending());
    EXPECT_THROW(state.resolve("r1", "again"), NothingPendingError);
}

TEST_F(BrokerStateTest, MismatchedResolveLeavesEntryInPlace) {
    auto answer = park("r1");

    EXPECT_THROW(state.resolve("someone-else", "No"), MismatchError);
    EXPECT_EQ(answer.wait_for(0ms), std::future_status::timeout);
    ASSERT_EQ(state.pending_id(), std::optional<std::string>("r1"));

    state.resolve("r1", "Yes");
    EXPECT_EQ(answer.get(), "Yes");
}

TEST_F(BrokerStateTest, SecondRequestCancelsFirst) {
    auto first = park("first");
    auto second = park("second");

    EXPECT_TRUE(is_cancelled(first));
    EXPECT_EQ(state.pending_id(), std::optional<std::string>("second"));
    EXPECT_THROW(state.resolve("first", "late"), MismatchError);

    state.resolve("second", "ok");
    EXPECT_EQ(second.get(), "ok");
}

TEST_F(BrokerStateTest, NotifyChannelIsTheSharedHandle) {
    EXPECT_EQ(state.notify_channel(), channel);
}

TEST_F(BrokerStateTest, ShutdownCancelsPendingAndClosesChannel) {
    auto answer = park("r1");

    state.shutdown();

    EXPECT_TRUE(is_cancelled(answer));
    EXPECT_TRUE(state.is_shut_down());
    EXPECT_TRUE(channel->is_closed());
    EXPECT_THROW(state.resolve("r1", "Yes"), NothingPendingError);
}

TEST_F(BrokerStateTest, SetPendingAfterShutdownCancelsImmediately) {
    state.shutdown();

    auto answer = park("late");

    EXPECT_TRUE(is_cancelled(answer));
    EXPECT_FALSE(state.has_pending());
}

TEST_F(BrokerStateTest, ConcurrentResolveDeliversExactlyOnce) {
    auto answer = park("r1");

    std::vector<std::thread> resolvers;
    std::atomic<int> delivered{0};
    for (int i = 0; i < 8; ++i) {
        resolvers.emplace_back([this, i, &delivered] {
            try {
                state.resolve("r1", "answer-" + std::to_string(i));
                ++delivered;
            } catch (const NothingPendingError&) {
            }
        });
    }
    for (auto& t : resolvers) {
        t.join();
    }

    EXPECT_EQ(delivered.load(), 1);
    EXPECT_EQ(answer.get().rfind("answer-", 0), 0u);
}
