#pragma once

#include "protocol.hpp"

#include <string>

namespace hengjing::ui {

/// Question text followed by numbered options, ready for a terminal
std::string format_request(const ipc::Request& request);

/**
 * Turns what the user typed into the answer text. A number between 1 and
 * the option count picks that predefined option; anything else is taken
 * literally, minus surrounding whitespace.
 */
std::string resolve_choice(const ipc::Request& request, const std::string& input);

} // namespace hengjing::ui
