#pragma once

#include "config.hpp"
#include "protocol.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace hengjing::popup {

struct LauncherOptions {
    std::string ui_command = "deng";
    std::string request_flag = "--mcp-request";
    std::string version_flag = "--version";
    std::string cancel_sentinel = "User cancelled the operation";

    // Empty means the directory of the running executable
    std::filesystem::path search_dir;

    // Empty means the system temp directory
    std::filesystem::path temp_dir;

    static LauncherOptions from_config(const BrokerConfig& config);
};

struct ProcessResult {
    bool exited = false;  // false when killed by a signal
    int exit_code = -1;
    int term_signal = 0;
    std::string stdout_text;
    std::string stderr_text;

    bool succeeded() const { return exited && exit_code == 0; }
};

/**
 * Runs argv to completion with stdin on /dev/null, capturing stdout and
 * stderr. search_path resolves argv[0] through PATH. Throws ProcessError
 * when the process cannot be started.
 */
ProcessResult run_process(const std::vector<std::string>& argv, bool search_path);

std::filesystem::path current_executable_dir();

/**
 * Starts a fresh front-end for one request: the request goes to a temp
 * file, the front-end gets the file path and prints the answer on stdout.
 */
class PopupLauncher {
public:
    explicit PopupLauncher(LauncherOptions options = {});
    virtual ~PopupLauncher() = default;

    /**
     * Answer text, or the cancel sentinel when the front-end printed nothing.
     * Throws IoError, ConfigurationError or ProcessError. The temp file is
     * gone when this returns, whatever the outcome.
     */
    virtual std::string launch(const ipc::Request& request) const;

    /// Local binary next to the caller first, then the bare command on PATH
    std::string find_ui_command() const;

    std::filesystem::path request_file_path(const std::string& request_id) const;

    const LauncherOptions& options() const { return options_; }

private:
    bool command_available(const std::string& command) const;

    LauncherOptions options_;
};

} // namespace hengjing::popup
