#include "popup_launcher.hpp"

#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"
#include "transport.hpp"

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include <log4cplus/loggingmacros.h>

extern char** environ;

namespace hengjing::popup {

namespace {

std::string trim_copy(const std::string& text) {
    const char* whitespace = " \t\r\n\f\v";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

bool is_executable(const std::filesystem::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

/**
 * Owner-only request file, removed on every path out of launch(). The name
 * is predictable, so an existing symlink at that path is refused rather
 * than followed.
 */
class RequestFile {
public:
    RequestFile(std::filesystem::path path, const std::string& contents) : path_(std::move(path)) {
        int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0600);
        if (fd < 0) {
            throw IoError("Cannot create request file " + path_.string() + ": " + std::strerror(errno));
        }
        ipc::UniqueFd file(fd);

        // An existing file keeps its old mode through O_CREAT
        if (::fchmod(file.get(), 0600) < 0) {
            int err = errno;
            remove();
            throw IoError("Cannot restrict request file " + path_.string() + ": " + std::strerror(err));
        }

        size_t written = 0;
        while (written < contents.size()) {
            ssize_t n = ::write(file.get(), contents.data() + written, contents.size() - written);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                int err = errno;
                remove();
                throw IoError("Cannot write request file " + path_.string() + ": " + std::strerror(err));
            }
            written += static_cast<size_t>(n);
        }
    }

    ~RequestFile() { remove(); }

    RequestFile(const RequestFile&) = delete;
    RequestFile& operator=(const RequestFile&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    void remove() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec) {
            LOG4CPLUS_DEBUG(launcher_logger(), "Could not remove " << path_.string() << ": " << ec.message());
        }
    }

    std::filesystem::path path_;
};

class SpawnFileActions {
public:
    SpawnFileActions() { posix_spawn_file_actions_init(&actions_); }
    ~SpawnFileActions() { posix_spawn_file_actions_destroy(&actions_); }

    SpawnFileActions(const SpawnFileActions&) = delete;
    SpawnFileActions& operator=(const SpawnFileActions&) = delete;

    posix_spawn_file_actions_t* get() { return &actions_; }

private:
    posix_spawn_file_actions_t actions_;
};

void drain_pipes(int out_fd, int err_fd, std::string& out_text, std::string& err_text) {
    pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
    std::string* sinks[2] = {&out_text, &err_text};
    int open_count = 2;
    char buf[4096];

    while (open_count > 0) {
        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG4CPLUS_ERROR(launcher_logger(), "poll on child output failed: " << std::strerror(errno));
            return;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                fds[i].fd = -1;
                --open_count;
            }
        }
    }
}

} // namespace

LauncherOptions LauncherOptions::from_config(const BrokerConfig& config) {
    LauncherOptions options;
    options.ui_command = config.ui_command;
    options.request_flag = config.request_flag;
    options.version_flag = config.version_flag;
    options.cancel_sentinel = config.cancel_sentinel;
    return options;
}

std::filesystem::path current_executable_dir() {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return {};
    }
    return exe.parent_path();
}

ProcessResult run_process(const std::vector<std::string>& argv, bool search_path) {
    if (argv.empty()) {
        throw ProcessError("No command to run");
    }

    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        throw ProcessError(std::string("pipe failed: ") + std::strerror(errno));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        throw ProcessError(std::string("pipe failed: ") + std::strerror(err));
    }

    SpawnFileActions actions;
    int action_error = posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    if (action_error == 0) {
        action_error = posix_spawn_file_actions_adddup2(actions.get(), out_pipe[1], STDOUT_FILENO);
    }
    if (action_error == 0) {
        action_error = posix_spawn_file_actions_adddup2(actions.get(), err_pipe[1], STDERR_FILENO);
    }
    if (action_error != 0) {
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
            ::close(fd);
        }
        throw ProcessError("Cannot redirect stdio for " + argv[0] + ": " + std::strerror(action_error));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = 0;
    int ret = search_path ? ::posix_spawnp(&pid, args[0], actions.get(), nullptr, args.data(), environ)
                          : ::posix_spawn(&pid, args[0], actions.get(), nullptr, args.data(), environ);

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    if (ret != 0) {
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        throw ProcessError("Cannot start " + argv[0] + ": " + std::strerror(ret));
    }

    ProcessResult result;
    drain_pipes(out_pipe[0], err_pipe[0], result.stdout_text, result.stderr_text);
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);

    int status = 0;
    pid_t waited = 0;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        throw ProcessError("waitpid failed for " + argv[0] + ": " + std::strerror(errno));
    }

    if (WIFEXITED(status)) {
        result.exited = true;
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }
    return result;
}

PopupLauncher::PopupLauncher(LauncherOptions options)
    : options_(std::move(options)) {}

std::filesystem::path PopupLauncher::request_file_path(const std::string& request_id) const {
    std::filesystem::path dir = options_.temp_dir;
    if (dir.empty()) {
        std::error_code ec;
        dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            dir = "/tmp";
        }
    }

    std::string name = "mcp_request_" + request_id + ".json";
    for (auto& c : name) {
        if (c == '/' || c == '\\') {
            c = '_';
        }
    }
    return dir / name;
}

bool PopupLauncher::command_available(const std::string& command) const {
    try {
        return run_process({command, options_.version_flag}, true).succeeded();
    } catch (const ProcessError& exc) {
        LOG4CPLUS_DEBUG(launcher_logger(), command << " is not on PATH: " << exc.what());
        return false;
    }
}

std::string PopupLauncher::find_ui_command() const {
    std::filesystem::path dir = options_.search_dir.empty() ? current_executable_dir() : options_.search_dir;
    if (!dir.empty()) {
        auto local = dir / options_.ui_command;
        if (is_executable(local)) {
            return local.string();
        }
    }

    if (command_available(options_.ui_command)) {
        return options_.ui_command;
    }

    throw ConfigurationError("Cannot find the " + options_.ui_command +
                             " UI command. Make sure that:\n"
                             "  1. the project is built (cmake --build build), or\n"
                             "  2. it is installed on PATH (cmake --install build), or\n"
                             "  3. " + options_.ui_command + " sits in the same directory as this program");
}

std::string PopupLauncher::launch(const ipc::Request& request) const {
    RequestFile request_file(request_file_path(request.id), ipc::codec::encode_request_pretty(request));

    std::string command = find_ui_command();
    LOG4CPLUS_INFO(launcher_logger(), "Launching " << command << " for request " << request.id);

    ProcessResult result =
        run_process({command, options_.request_flag, request_file.path().string()}, command == options_.ui_command);

    if (!result.succeeded()) {
        LOG4CPLUS_WARN(launcher_logger(), command << " failed, exit code " << result.exit_code << ", signal "
                                                  << result.term_signal);
        std::string detail = trim_copy(result.stderr_text);
        if (detail.empty() && !result.exited) {
            detail = "terminated by signal " + std::to_string(result.term_signal);
        }
        throw ProcessError("UI process failed: " + detail);
    }

    std::string answer = trim_copy(result.stdout_text);
    if (answer.empty()) {
        LOG4CPLUS_INFO(launcher_logger(), "Request " << request.id << " cancelled by the user");
        return options_.cancel_sentinel;
    }
    return answer;
}

} // namespace hengjing::popup
