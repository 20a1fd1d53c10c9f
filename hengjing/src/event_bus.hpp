#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace hengjing::ui {

/// Named-channel fan-out from the broker to whatever renders requests
class EventBus {
public:
    using Handler = std::function<void(const nlohmann::ordered_json& payload)>;

    void subscribe(const std::string& channel, Handler handler);

    /// Returns the number of handlers reached; handler exceptions are logged
    size_t emit(const std::string& channel, const nlohmann::ordered_json& payload);

    size_t subscriber_count(const std::string& channel) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Handler>> handlers_;
};

} // namespace hengjing::ui
