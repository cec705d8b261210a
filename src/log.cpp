#include "mcptk/log.hpp"
#include "mcptk/error.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mcptk::log {

namespace {

constexpr const char* kPrefix = "mcptk.";

struct State {
    std::mutex mutex;
    std::vector<spdlog::sink_ptr> sinks;
    LogOptions opts;
    bool initialized = false;
};

State& state() {
    static State s;
    return s;
}

// Caller holds state().mutex
void ensure_sinks(State& s) {
    if (s.initialized) return;
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern(s.opts.pattern);
    s.sinks = {console};
    s.initialized = true;
}

spdlog::level::level_enum level_for(const State& s, const std::string& name) {
    auto it = s.opts.module_levels.find(name);
    return level_from_string(it != s.opts.module_levels.end() ? it->second : s.opts.level);
}

bool owned(const std::string& name) {
    return name.rfind(kPrefix, 0) == 0;
}

} // anonymous namespace

spdlog::level::level_enum level_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warning" || lower == "warn") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    throw McpConfigError("Unknown log level: " + name);
}

void configure(const LogOptions& opts) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    // Validate every level before touching anything
    level_from_string(opts.level);
    for (const auto& [name, level] : opts.module_levels) level_from_string(level);

    std::vector<spdlog::sink_ptr> sinks;
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern(opts.pattern);
    sinks.push_back(console);
    if (!opts.file_path.empty()) {
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                opts.file_path, opts.max_bytes, opts.backup_count);
            file->set_pattern(opts.pattern);
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            throw McpConfigError(std::string("Cannot open log file: ") + e.what());
        }
    }

    s.opts = opts;
    s.sinks = std::move(sinks);
    s.initialized = true;

    spdlog::apply_all([&s](std::shared_ptr<spdlog::logger> logger) {
        if (!owned(logger->name())) return;
        logger->sinks() = s.sinks;
        logger->set_level(level_for(s, logger->name()));
    });
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (auto existing = spdlog::get(name)) return existing;

    ensure_sinks(s);
    auto logger = std::make_shared<spdlog::logger>(name, s.sinks.begin(), s.sinks.end());
    logger->set_level(level_for(s, name));
    spdlog::register_logger(logger);
    return logger;
}

} // namespace mcptk::log
