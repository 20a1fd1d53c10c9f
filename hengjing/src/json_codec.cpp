#include "json_codec.hpp"

#include "errors.hpp"

namespace hengjing::ipc::codec {

namespace {

nlohmann::json parse_object(const std::string& text, const char* what) {
    nlohmann::json value = nlohmann::json::parse(text, nullptr, false);
    if (value.is_discarded()) {
        throw ProtocolError(std::string("Malformed ") + what + ": not valid JSON");
    }
    if (!value.is_object()) {
        throw ProtocolError(std::string("Malformed ") + what + ": expected a JSON object");
    }
    return value;
}

template <typename Json>
const Json& require(const Json& obj, const char* key, const char* what) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw ProtocolError(std::string("Malformed ") + what + ": missing field '" + key + "'");
    }
    return *it;
}

template <typename Json>
std::string require_string(const Json& obj, const char* key, const char* what) {
    const auto& value = require(obj, key, what);
    if (!value.is_string()) {
        throw ProtocolError(std::string("Malformed ") + what + ": field '" + key + "' must be a string");
    }
    return value.template get<std::string>();
}

template <typename Json>
bool require_bool(const Json& obj, const char* key, const char* what) {
    const auto& value = require(obj, key, what);
    if (!value.is_boolean()) {
        throw ProtocolError(std::string("Malformed ") + what + ": field '" + key + "' must be a boolean");
    }
    return value.template get<bool>();
}

template <typename Json>
Request request_from_json_impl(const Json& value) {
    if (!value.is_object()) {
        throw ProtocolError("Malformed request: expected a JSON object");
    }

    Request request;
    request.id = require_string(value, "id", "request");
    request.message = require_string(value, "message", "request");
    request.is_markdown = require_bool(value, "is_markdown", "request");

    auto options = value.find("predefined_options");
    if (options != value.end() && !options->is_null()) {
        if (!options->is_array()) {
            throw ProtocolError("Malformed request: field 'predefined_options' must be an array or null");
        }
        std::vector<std::string> items;
        items.reserve(options->size());
        for (const auto& item : *options) {
            if (!item.is_string()) {
                throw ProtocolError("Malformed request: 'predefined_options' entries must be strings");
            }
            items.push_back(item.template get<std::string>());
        }
        request.predefined_options = std::move(items);
    }

    return request;
}

} // namespace

nlohmann::ordered_json request_to_json(const Request& request) {
    nlohmann::ordered_json value;
    value["id"] = request.id;
    value["message"] = request.message;
    if (request.predefined_options) {
        value["predefined_options"] = *request.predefined_options;
    } else {
        value["predefined_options"] = nullptr;
    }
    value["is_markdown"] = request.is_markdown;
    return value;
}

Request request_from_json(const nlohmann::json& value) {
    return request_from_json_impl(value);
}

Request request_from_json(const nlohmann::ordered_json& value) {
    return request_from_json_impl(value);
}

std::string encode_request(const Request& request) {
    return request_to_json(request).dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string encode_request_pretty(const Request& request) {
    return request_to_json(request).dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string encode_response(const Response& response) {
    nlohmann::ordered_json value;
    value["id"] = response.id;
    value["response"] = response.response;
    value["success"] = response.success;
    if (response.error) {
        value["error"] = *response.error;
    } else {
        value["error"] = nullptr;
    }
    return value.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

Request decode_request(const std::string& text) {
    return request_from_json(parse_object(text, "request"));
}

Response decode_response(const std::string& text) {
    nlohmann::json value = parse_object(text, "response");

    Response response;
    response.id = require_string(value, "id", "response");
    response.response = require_string(value, "response", "response");
    response.success = require_bool(value, "success", "response");

    auto error = value.find("error");
    if (error != value.end() && !error->is_null()) {
        if (!error->is_string()) {
            throw ProtocolError("Malformed response: field 'error' must be a string or null");
        }
        response.error = error->get<std::string>();
    }

    if (response.success && response.error) {
        throw ProtocolError("Malformed response: a successful response cannot carry an error");
    }
    // A failure without error text is tolerated; the client reports it as unknown
    if (!response.success && !response.response.empty()) {
        throw ProtocolError("Malformed response: a failed response cannot carry response text");
    }

    return response;
}

} // namespace hengjing::ipc::codec
