#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "popup_orchestrator.hpp"
#include "protocol.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <message>\n"
              << "  --option <text>      predefined answer (repeatable)\n"
              << "  --markdown           message is markdown\n"
              << "  --id <id>            request id (generated when absent)\n"
              << "  --socket <path>      UI socket path\n"
              << "  --timeout <seconds>  IPC response timeout\n"
              << "  --ui-command <name>  front-end executable for the fallback\n"
              << "  --config <ini>       log4cplus configuration\n"
              << "  -v, --version        print version and exit\n";
}

std::string generate_request_id() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<uint32_t> dist;

    std::ostringstream id;
    id << "req-" << millis << "-" << ::getpid() << "-" << std::hex << dist(gen);
    return id.str();
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    hengjing::BrokerConfig config = hengjing::default_config();
    hengjing::ipc::Request request;
    std::vector<std::string> options;
    std::string message;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "Version: " << HENGJING_VERSION_STRING << std::endl;
            std::cout << "Commit: " << HENGJING_GIT_VERSION << std::endl;
            std::cout << "Build Time: " << HENGJING_BUILD_TIMESTAMP << std::endl;
            return 0;
        }

        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
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

        if (strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            try {
                config.request_timeout = std::chrono::seconds(std::stol(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Invalid --timeout value: " << argv[i] << std::endl;
                return 2;
            }
            continue;
        }

        if (strcmp(argv[i], "--id") == 0 && i + 1 < argc) {
            request.id = argv[++i];
            continue;
        }

        if (strcmp(argv[i], "--option") == 0 && i + 1 < argc) {
            options.emplace_back(argv[++i]);
            continue;
        }

        if (strcmp(argv[i], "--markdown") == 0) {
            request.is_markdown = true;
            continue;
        }

        if (strcmp(argv[i], "--ui-command") == 0 && i + 1 < argc) {
            config.ui_command = argv[++i];
            continue;
        }

        if (argv[i][0] != '-') {
            if (!message.empty()) {
                message += " ";
            }
            message += argv[i];
            continue;
        }

        std::cerr << "Unknown option: " << argv[i] << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    if (message.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    init_logging(config.log_config);

    request.message = message;
    if (!options.empty()) {
        request.predefined_options = options;
    }
    if (request.id.empty()) {
        request.id = generate_request_id();
    }

    LOG4CPLUS_INFO(core_logger(), "hengjing " << HENGJING_VERSION_STRING << " asking " << request.id
                                              << " via " << config.socket_path);

    auto orchestrator = hengjing::popup::make_orchestrator(config);
    try {
        std::cout << orchestrator->resolve_popup(request) << std::endl;
    } catch (const hengjing::Error& exc) {
        LOG4CPLUS_ERROR(core_logger(), "Request " << request.id << " failed: " << exc.what());
        std::cerr << "Error (" << hengjing::to_string(exc.kind()) << "): " << exc.what() << std::endl;
        return 1;
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(core_logger(), "Request " << request.id << " failed: " << exc.what());
        std::cerr << "Error: " << exc.what() << std::endl;
        return 1;
    }

    return 0;
}
