#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace mcptk::log {

struct LogOptions {
    std::string level = "info";
    std::string file_path;  // empty: console only
    std::string pattern = "%Y-%m-%d %H:%M:%S - %n - %l - %v";
    size_t max_bytes = 10 * 1024 * 1024;
    size_t backup_count = 5;
    std::map<std::string, std::string> module_levels;  // logger name -> level
};

/// Install the shared sink set and apply levels to every mcptk logger,
/// including those created earlier. Throws McpConfigError on a bad level name.
void configure(const LogOptions& opts);

/// Named logger ("mcptk.http", ...) sharing the configured sinks.
std::shared_ptr<spdlog::logger> get(const std::string& name);

/// Parse trace|debug|info|warning|warn|error|critical|off.
spdlog::level::level_enum level_from_string(const std::string& name);

} // namespace mcptk::log
