#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace hengjing {

/**
 * Tunables shared by the backend CLI and the front-end process.
 * Defaults come from default_config(); both executables override a subset
 * from the command line.
 */
struct BrokerConfig {
    std::string socket_path;
    std::chrono::seconds request_timeout{600};

    std::string ui_command = "deng";
    std::string request_flag = "--mcp-request";
    std::string version_flag = "--version";

    // Published in order for every incoming request; new and legacy listeners
    std::vector<std::string> notification_channels{"mcp-request", "ipc-mcp-request"};

    std::string cancel_sentinel = "User cancelled the operation";
    size_t notify_capacity = 32;
    std::string log_config = "log4cplus.ini";
};

/// Well-known socket path: <system temp dir>/hengjing-ui.sock
std::string default_socket_path();

BrokerConfig default_config();

} // namespace hengjing
