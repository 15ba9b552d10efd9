#include "mcp/mcp_stdio.hpp"

#include <iostream>
#include <string>

namespace mcp_stdio {

static bool is_blank(const std::string &line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::optional<std::string> read_message(std::istream &input) {
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        // Blank lines between messages are tolerated.
        if (is_blank(line)) {
            continue;
        }
        return line;
    }
    return std::nullopt;
}

std::optional<std::string> read_message() {
    return read_message(std::cin);
}

void write_message(std::ostream &output, const std::string &json_string) {
    output << json_string << "\n";
    output.flush();
}

void write_message(const std::string &json_string) {
    write_message(std::cout, json_string);
}

void log_message(const std::string &message) {
    std::cerr << "[edmcps] " << message << std::endl;
}

} // namespace mcp_stdio
