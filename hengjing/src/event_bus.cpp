#include "event_bus.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace hengjing::ui {

void EventBus::subscribe(const std::string& channel, Handler handler) {
    if (!handler) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[channel].push_back(std::move(handler));
}

size_t EventBus::emit(const std::string& channel, const nlohmann::ordered_json& payload) {
    std::vector<Handler> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(channel);
        if (it == handlers_.end()) {
            return 0;
        }
        targets = it->second;
    }

    size_t delivered = 0;
    for (const auto& handler : targets) {
        try {
            handler(payload);
            ++delivered;
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(ui_logger(), "Failed to emit " << channel << " event: " << exc.what());
        }
    }
    return delivered;
}

size_t EventBus::subscriber_count(const std::string& channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(channel);
    return it == handlers_.end() ? 0 : it->second.size();
}

} // namespace hengjing::ui
