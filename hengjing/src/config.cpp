#include "config.hpp"

#include <filesystem>
#include <system_error>

namespace hengjing {

std::string default_socket_path() {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }
    return (dir / "hengjing-ui.sock").string();
}

BrokerConfig default_config() {
    BrokerConfig config;
    config.socket_path = default_socket_path();
    return config;
}

} // namespace hengjing
