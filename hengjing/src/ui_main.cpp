#include "config.hpp"
#include "console_prompt.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "json_codec.hpp"
#include "logger.hpp"
#include "ui_bridge.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace {

/// One-shot mode: ask on the controlling terminal, answer on stdout
int answer_request_file(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        std::cerr << "Cannot open request file " << path << std::endl;
        return 1;
    }
    std::stringstream contents;
    contents << input.rdbuf();

    hengjing::ipc::Request request;
    try {
        request = hengjing::ipc::codec::decode_request(contents.str());
    } catch (const hengjing::ProtocolError& exc) {
        std::cerr << "Invalid request file " << path << ": " << exc.what() << std::endl;
        return 1;
    }

    LOG4CPLUS_INFO(ui_logger(), "Answering request " << request.id << " from " << path);

    std::FILE* tty = std::fopen("/dev/tty", "r+");
    if (!tty) {
        LOG4CPLUS_WARN(ui_logger(), "No terminal available, request " << request.id << " cancelled");
        return 0;
    }

    std::string prompt = hengjing::ui::format_request(request);
    std::fputs(prompt.c_str(), tty);
    std::fflush(tty);

    std::string line;
    char buf[1024];
    while (std::fgets(buf, sizeof(buf), tty)) {
        line += buf;
        if (!line.empty() && line.back() == '\n') {
            break;
        }
    }
    std::fclose(tty);

    std::cout << hengjing::ui::resolve_choice(request, line) << std::endl;
    return 0;
}

/// Resident mode: serve backend requests until stdin closes
int run_resident(const hengjing::BrokerConfig& config) {
    hengjing::ui::EventBus bus;
    std::mutex current_mutex;
    std::optional<hengjing::ipc::Request> current;

    const std::string listen_channel =
        config.notification_channels.empty() ? std::string("mcp-request") : config.notification_channels.front();
    bus.subscribe(listen_channel,
                  [&current_mutex, &current](const nlohmann::ordered_json& payload) {
                      auto request = hengjing::ipc::codec::request_from_json(payload);
                      std::cout << "\n" << hengjing::ui::format_request(request) << std::flush;
                      std::lock_guard<std::mutex> lock(current_mutex);
                      current = std::move(request);
                  });

    hengjing::ui::UiBridge bridge(config, bus);
    if (!bridge.start()) {
        LOG4CPLUS_ERROR(ui_logger(), "Failed to start the UI bridge on " << config.socket_path);
        return 1;
    }

    LOG4CPLUS_INFO(ui_logger(), "Waiting for requests on " << config.socket_path);

    std::string line;
    while (std::getline(std::cin, line)) {
        std::optional<hengjing::ipc::Request> request;
        {
            std::lock_guard<std::mutex> lock(current_mutex);
            request = current;
        }
        if (!request) {
            std::cout << "No request is waiting for an answer" << std::endl;
            continue;
        }

        try {
            bridge.send_ipc_response(request->id, hengjing::ui::resolve_choice(*request, line));
            std::lock_guard<std::mutex> lock(current_mutex);
            if (current && current->id == request->id) {
                current.reset();
            }
        } catch (const hengjing::Error& exc) {
            std::cout << "Cannot deliver answer: " << exc.what() << std::endl;
        }
    }

    bridge.stop();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    hengjing::BrokerConfig config = hengjing::default_config();
    std::string request_file;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "Version: " << HENGJING_VERSION_STRING << std::endl;
            std::cout << "Commit: " << HENGJING_GIT_VERSION << std::endl;
            std::cout << "Build Time: " << HENGJING_BUILD_TIMESTAMP << std::endl;
            return 0;
        }

        if (strcmp(argv[i], "--mcp-request") == 0 && i + 1 < argc) {
            request_file = argv[++i];
            continue;
        }

        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config.log_config = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--config=", 9) == 0) {
            config.log_config = argv[i] + 9;
            continue;
        }

        if (strcmp(argv[i], "--socket") == 0 && i + 1 < argc) {
            config.socket_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--socket=", 9) == 0) {
            config.socket_path = argv[i] + 9;
            continue;
        }
    }

    init_logging(config.log_config);

    if (!request_file.empty()) {
        return answer_request_file(request_file);
    }

    LOG4CPLUS_INFO(ui_logger(), "deng " << HENGJING_VERSION_STRING << " starting");
    LOG4CPLUS_INFO(ui_logger(), "Commit: " << HENGJING_GIT_VERSION << ", Build Time: " << HENGJING_BUILD_TIMESTAMP);
    return run_resident(config);
}
