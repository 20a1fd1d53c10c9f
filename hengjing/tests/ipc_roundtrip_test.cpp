#include <gtest/gtest.h>

#include "broker_state.hpp"
#include "errors.hpp"
#include "ipc_client.hpp"
#include "ipc_server.hpp"
#include "test_helpers.hpp"
#include "transport.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>

using namespace std::chrono_literals;
using namespace hengjing::ipc;

namespace {

bool path_exists(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

class IpcRoundtripTest : public ::testing::Test {
protected:
    void SetUp() override {
        socket_path = unique_socket_path();
        channel = std::make_shared<RequestChannel>();
        state = std::make_shared<BrokerState>(channel);
        server = std::make_unique<IpcServer>(socket_path, state);
        ASSERT_TRUE(server->start());
    }

    void TearDown() override {
        server->stop();
    }

    bool wait_for_pending(const std::string& id) {
        return wait_until([&] { return state->pending_id() == std::optional<std::string>(id); });
    }

    std::string socket_path;
    std::shared_ptr<RequestChannel> channel;
    std::shared_ptr<BrokerState> state;
    std::unique_ptr<IpcServer> server;
};

} // namespace

TEST_F(IpcRoundtripTest, AnswerReachesWaitingClient) {
    IpcClient client(socket_path);
    auto request = make_request("r1", "Continue?", std::vector<std::string>{"Yes", "No"});

    auto answer = std::async(std::launch::async, [&] { return client.send_request(request); });

    auto forwarded = channel->receive_for(5s);
    ASSERT_TRUE(forwarded.has_value());
    EXPECT_EQ(*forwarded, request);

    ASSERT_TRUE(wait_for_pending("r1"));
    state->resolve("r1", "Yes");

    ASSERT_EQ(answer.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(answer.get(), "Yes");
    EXPECT_FALSE(state->has_pending());
}

TEST_F(IpcRoundtripTest, AnswerTextIsDeliveredVerbatim) {
    IpcClient client(socket_path);
    const std::string text = "  first line\nsecond line with \"quotes\" and \\ backslash\n";

    auto answer = std::async(std::launch::async, [&] { return client.send_request(make_request("r2", "Explain")); });

    ASSERT_TRUE(wait_for_pending("r2"));
    state->resolve("r2", text);

    EXPECT_EQ(answer.get(), text);
}

TEST_F(IpcRoundtripTest, RunningServerIsReachable) {
    IpcClient client(socket_path);

    EXPECT_EQ(client.probe(), Reachability::Running);
    EXPECT_TRUE(client.is_reachable());
}

TEST_F(IpcRoundtripTest, NewerRequestPreemptsOlderOne) {
    IpcClient client(socket_path);

    auto first = std::async(std::launch::async, [&] { return client.send_request(make_request("a", "first")); });
    ASSERT_TRUE(wait_for_pending("a"));

    auto second = std::async(std::launch::async, [&] { return client.send_request(make_request("b", "second")); });
    ASSERT_TRUE(wait_for_pending("b"));

    try {
        first.get();
        FAIL() << "preempted request should fail";
    } catch (const hengjing::CancellationError& exc) {
        EXPECT_STREQ(exc.what(), kResponseChannelClosed);
    }

    EXPECT_THROW(state->resolve("a", "late"), hengjing::MismatchError);
    state->resolve("b", "ok");
    EXPECT_EQ(second.get(), "ok");
}

TEST_F(IpcRoundtripTest, ClientTimesOutWhileServerKeepsWaiting) {
    IpcClient client(socket_path, 150ms);

    EXPECT_THROW(client.send_request(make_request("slow", "Nobody answers")), hengjing::TimeoutError);

    ASSERT_TRUE(wait_for_pending("slow"));
    EXPECT_NO_THROW(state->resolve("slow", "too late"));
    EXPECT_FALSE(state->has_pending());
}

TEST_F(IpcRoundtripTest, MalformedRequestClosesConnectionWithoutResponse) {
    UnixSocketTransport transport;
    UniqueFd fd(transport.connect(socket_path));
    write_line(fd.get(), "{not json");

    std::string line;
    EXPECT_EQ(read_line(fd.get(), line, 5000ms), ReadStatus::Closed);
    EXPECT_TRUE(line.empty());
    EXPECT_FALSE(state->has_pending());
    EXPECT_EQ(channel->size(), 0u);
}

TEST_F(IpcRoundtripTest, EmptyConnectionIsIgnored) {
    UnixSocketTransport transport;
    {
        UniqueFd fd(transport.connect(socket_path));
    }

    EXPECT_TRUE(wait_until([&] { return server->active_connections() == 0; }));
    EXPECT_FALSE(state->has_pending());

    IpcClient client(socket_path);
    auto answer = std::async(std::launch::async, [&] { return client.send_request(make_request("after", "still up")); });
    ASSERT_TRUE(wait_for_pending("after"));
    state->resolve("after", "yes");
    EXPECT_EQ(answer.get(), "yes");
}

TEST_F(IpcRoundtripTest, StopCancelsWaitingRequestAndRemovesSocket) {
    IpcClient client(socket_path);
    auto answer = std::async(std::launch::async, [&] { return client.send_request(make_request("r1", "pending")); });
    ASSERT_TRUE(wait_for_pending("r1"));

    server->stop();

    EXPECT_THROW(answer.get(), hengjing::CancellationError);
    EXPECT_FALSE(server->is_running());
    EXPECT_FALSE(path_exists(socket_path));
    EXPECT_TRUE(channel->is_closed());
    EXPECT_EQ(client.probe(), Reachability::NotRunning);
}

TEST(IpcServer, StartReplacesStaleSocketFile) {
    std::string socket_path = unique_socket_path();
    create_stale_socket(socket_path);
    ASSERT_TRUE(path_exists(socket_path));

    IpcClient client(socket_path);
    EXPECT_FALSE(client.is_reachable());

    IpcServer server(socket_path, std::make_shared<BrokerState>(std::make_shared<RequestChannel>()));
    ASSERT_TRUE(server.start());
    EXPECT_TRUE(client.is_reachable());
    server.stop();
}

TEST(IpcServer, StartFailsWithoutListenableDirectory) {
    IpcServer server("/nonexistent-hengjing-dir/ui.sock",
                     std::make_shared<BrokerState>(std::make_shared<RequestChannel>()));

    EXPECT_FALSE(server.start());
    EXPECT_FALSE(server.is_running());
}

TEST(IpcClient, MissingSocketIsNotReachable) {
    IpcClient client(unique_socket_path());

    EXPECT_EQ(client.probe(), Reachability::NotRunning);
    EXPECT_FALSE(client.is_reachable());
    EXPECT_THROW(client.send_request(make_request("r1", "hello")), hengjing::ConnectionError);
}

TEST(IpcClient, UnsupportedTransportCannotProbe) {
    IpcClient client(unique_socket_path(), IpcClient::kDefaultTimeout, std::make_shared<UnsupportedTransport>());

    EXPECT_EQ(client.probe(), Reachability::Unsupported);
    EXPECT_THROW(client.is_reachable(), hengjing::UnsupportedError);
    EXPECT_THROW(client.send_request(make_request("r1", "hello")), hengjing::UnsupportedError);
}

TEST(IpcClient, SendsOneRequestLine) {
    std::string socket_path = unique_socket_path();
    OneShotPeer peer(socket_path, std::string(R"({"id":"r1","response":"fine","success":true,"error":null})"));
    IpcClient client(socket_path, 5s);

    EXPECT_EQ(client.send_request(make_request("r1", "How are you?")), "fine");
    EXPECT_EQ(peer.received(), R"({"id":"r1","message":"How are you?","predefined_options":null,"is_markdown":false})");
}

TEST(IpcClient, FailureWithoutErrorTextIsUnknown) {
    std::string socket_path = unique_socket_path();
    OneShotPeer peer(socket_path, std::string(R"({"id":"r1","response":"","success":false,"error":null})"));
    IpcClient client(socket_path, 5s);

    try {
        client.send_request(make_request("r1", "hello"));
        FAIL() << "failure response should throw";
    } catch (const hengjing::CancellationError& exc) {
        EXPECT_STREQ(exc.what(), "unknown error");
    }
}

TEST(IpcClient, MalformedResponseIsProtocolError) {
    std::string socket_path = unique_socket_path();
    OneShotPeer peer(socket_path, std::string("definitely not json"));
    IpcClient client(socket_path, 5s);

    EXPECT_THROW(client.send_request(make_request("r1", "hello")), hengjing::ProtocolError);
}

TEST(IpcClient, PeerClosingWithoutReplyIsConnectionClosed) {
    std::string socket_path = unique_socket_path();
    OneShotPeer peer(socket_path, std::nullopt);
    IpcClient client(socket_path, 5s);

    EXPECT_THROW(client.send_request(make_request("r1", "hello")), hengjing::ConnectionClosedError);
}

TEST(IpcServer, UnsupportedTransportCannotStart) {
    IpcServer server(unique_socket_path(),
                     std::make_shared<BrokerState>(std::make_shared<RequestChannel>()),
                     std::make_shared<UnsupportedTransport>());

    EXPECT_FALSE(server.start());
    EXPECT_FALSE(server.is_running());
}

TEST(LocalTransport, DefaultIsUnixSocket) {
    EXPECT_STREQ(make_local_transport()->name(), "unix");
}
