#include "clinmcp/log.hpp"
#include "clinmcp/error.hpp"
#include <mutex>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace clinmcp {
namespace log {

namespace {

constexpr const char* kLoggerName = "clinmcp";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_logger(std::vector<spdlog::sink_ptr> sinks,
                                            spdlog::level::level_enum level) {
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // namespace

spdlog::level::level_enum parse_level(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    throw ConfigError("Unknown log level '" + std::string(name) + "'");
}

void init(const Options& opts) {
    auto level = parse_level(opts.level);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!opts.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                opts.file, opts.max_file_bytes, opts.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigError("Cannot open log file '" + opts.file + "': " + e.what());
        }
    }

    std::lock_guard<std::mutex> lock(g_mutex);
    g_logger = make_logger(std::move(sinks), level);
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
        g_logger = make_logger(std::move(sinks), spdlog::level::info);
    }
    return g_logger;
}

} // namespace log
} // namespace clinmcp
