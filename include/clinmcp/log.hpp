#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>

#define CLINMCP_TRACE(...) ::clinmcp::log::get()->trace(__VA_ARGS__)
#define CLINMCP_DEBUG(...) ::clinmcp::log::get()->debug(__VA_ARGS__)
#define CLINMCP_INFO(...)  ::clinmcp::log::get()->info(__VA_ARGS__)
#define CLINMCP_WARN(...)  ::clinmcp::log::get()->warn(__VA_ARGS__)
#define CLINMCP_ERROR(...) ::clinmcp::log::get()->error(__VA_ARGS__)

namespace clinmcp {
namespace log {

struct Options {
    std::string level = "info";
    /// Optional rotating log file, in addition to stderr.
    std::string file;
    size_t max_file_bytes = 5 * 1024 * 1024;
    size_t max_files = 3;
};

/// Installs the process-wide "clinmcp" logger. Output goes to stderr,
/// never stdout, which belongs to the JSON-RPC stream.
/// Throws ConfigError for an unknown level name.
void init(const Options& opts);

/// The "clinmcp" logger; a stderr-only logger is created on first use if
/// init() has not run.
std::shared_ptr<spdlog::logger> get();

/// trace, debug, info, warn, error, critical, off.
spdlog::level::level_enum parse_level(std::string_view name);

} // namespace log
} // namespace clinmcp
