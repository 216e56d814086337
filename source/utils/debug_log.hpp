#ifndef MCPHOST_DEBUG_LOG_HPP
#define MCPHOST_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if MCPHOST_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [mcphost] prefix only when is_debug_enabled().
void log(const std::string &message);

// Always writes "[mcphost] Warning: <message>" to stderr.
void warn(const std::string &message);

// Always writes "[mcphost] Error: <message>" to stderr.
void error(const std::string &message);

} // namespace debug_log

#endif // MCPHOST_DEBUG_LOG_HPP
