#include "test_helpers.hpp"

#include "errors.hpp"
#include "logger.hpp"
#include "transport.hpp"

#include <gtest/gtest.h>

#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <system_error>

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override {
        static std::once_flag once;
        std::call_once(once, []() { init_logging(HENGJING_TEST_LOG_CONFIG); });
    }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

} // namespace

std::string unique_socket_path() {
    static std::atomic<int> counter{0};
    std::string path = "/tmp/hj-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++) + ".sock";
    ::unlink(path.c_str());
    return path;
}

hengjing::ipc::Request make_request(const std::string& id,
                                    const std::string& message,
                                    std::optional<std::vector<std::string>> options,
                                    bool is_markdown) {
    hengjing::ipc::Request request;
    request.id = id;
    request.message = message;
    request.predefined_options = std::move(options);
    request.is_markdown = is_markdown;
    return request;
}

bool wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

ScratchDir::ScratchDir() {
    std::string pattern = (std::filesystem::temp_directory_path() / "hengjing-test-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (!::mkdtemp(buffer.data())) {
        throw std::runtime_error("mkdtemp failed");
    }
    path_ = buffer.data();
}

ScratchDir::~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::filesystem::path ScratchDir::write_file(const std::string& relative, const std::string& contents, bool executable) {
    auto target = path_ / relative;
    std::filesystem::create_directories(target.parent_path());
    {
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << contents;
    }
    ::chmod(target.c_str(), executable ? 0755 : 0644);
    return target;
}

void create_stale_socket(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ::close(fd);
}

OneShotPeer::OneShotPeer(std::string socket_path, std::optional<std::string> reply)
    : socket_path_(std::move(socket_path)) {
    hengjing::ipc::UnixSocketTransport transport;
    listen_fd_ = transport.listen(socket_path_, 4);

    thread_ = std::thread([this, reply]() {
        pollfd pfd{listen_fd_, POLLIN, 0};
        if (::poll(&pfd, 1, 10000) <= 0) {
            return;
        }
        hengjing::ipc::UniqueFd client(::accept(listen_fd_, nullptr, nullptr));
        if (!client.valid()) {
            return;
        }
        try {
            hengjing::ipc::read_line(client.get(), received_, std::chrono::milliseconds(10000));
            if (reply) {
                hengjing::ipc::write_line(client.get(), *reply);
            }
        } catch (const hengjing::Error& exc) {
            ADD_FAILURE() << "OneShotPeer exchange failed: " << exc.what();
        }
    });
}

OneShotPeer::~OneShotPeer() {
    if (thread_.joinable()) {
        thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
    }
    ::unlink(socket_path_.c_str());
}

std::string OneShotPeer::received() {
    if (thread_.joinable()) {
        thread_.join();
    }
    return received_;
}
