#include "console_prompt.hpp"

#include <cctype>
#include <sstream>

namespace hengjing::ui {

namespace {

std::string trim_copy(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

bool all_digits(const std::string& text) {
    if (text.empty() || text.size() > 6) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string format_request(const ipc::Request& request) {
    std::ostringstream out;
    out << "[" << request.id << "]" << (request.is_markdown ? " (markdown)" : "") << "\n";
    out << request.message << "\n";
    if (request.predefined_options && !request.predefined_options->empty()) {
        size_t index = 1;
        for (const auto& option : *request.predefined_options) {
            out << "  " << index++ << ") " << option << "\n";
        }
    }
    out << "> ";
    return out.str();
}

std::string resolve_choice(const ipc::Request& request, const std::string& input) {
    std::string text = trim_copy(input);
    if (request.predefined_options && all_digits(text)) {
        size_t index = static_cast<size_t>(std::stoul(text));
        if (index >= 1 && index <= request.predefined_options->size()) {
            return (*request.predefined_options)[index - 1];
        }
    }
    return text;
}

} // namespace hengjing::ui
