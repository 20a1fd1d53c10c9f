#pragma once

#include <optional>
#include <string>
#include <vector>

namespace hengjing::ipc {

struct Request {
    std::string id;
    std::string message;
    std::optional<std::vector<std::string>> predefined_options;
    bool is_markdown = false;

    bool operator==(const Request& other) const {
        return id == other.id && message == other.message &&
               predefined_options == other.predefined_options && is_markdown == other.is_markdown;
    }
    bool operator!=(const Request& other) const { return !(*this == other); }
};

/**
 * A successful response never carries an error; a failed one carries an
 * error and an empty response text. Use the factories to keep that shape.
 */
struct Response {
    std::string id;
    std::string response;
    bool success = false;
    std::optional<std::string> error;

    static Response answered(std::string id, std::string text) {
        return Response{std::move(id), std::move(text), true, std::nullopt};
    }

    static Response failed(std::string id, std::string error_message) {
        return Response{std::move(id), std::string(), false, std::move(error_message)};
    }
};

} // namespace hengjing::ipc
