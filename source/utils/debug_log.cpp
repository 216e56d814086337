#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace debug_log {

// Reader threads of several connections log at the same time.
static std::mutex output_mutex;

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

static void write_line(const std::string &prefix, const std::string &message) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << "[mcphost] " << prefix << message << std::endl;
}

bool is_debug_enabled() {
    const char *value = std::getenv("MCPHOST_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    write_line("", message);
}

void warn(const std::string &message) {
    write_line("Warning: ", message);
}

void error(const std::string &message) {
    write_line("Error: ", message);
}

} // namespace debug_log
