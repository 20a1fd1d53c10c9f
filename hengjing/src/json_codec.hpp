#pragma once

#include "protocol.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace hengjing::ipc::codec {

nlohmann::ordered_json request_to_json(const Request& request);
Request request_from_json(const nlohmann::json& value);
Request request_from_json(const nlohmann::ordered_json& value);

/// Single-line JSON without the trailing newline
std::string encode_request(const Request& request);
std::string encode_response(const Response& response);

/// Multi-line JSON, as written to the fallback request file
std::string encode_request_pretty(const Request& request);

/// All decoders throw ProtocolError on malformed text or a schema violation
Request decode_request(const std::string& text);
Response decode_response(const std::string& text);

} // namespace hengjing::ipc::codec
