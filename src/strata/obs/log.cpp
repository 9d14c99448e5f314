/**
 * @file log.cpp
 * @brief spdlog-backed library logger.
 */
#include "strata/obs/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <system_error>
#include <vector>

#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "strata/version.hpp"

namespace fs = std::filesystem;

namespace strata::obs {

namespace {

// g_mu serializes (re)builds only; readers load g_logger without locking.
std::mutex                                   g_mu;
std::atomic<std::shared_ptr<spdlog::logger>> g_logger;

spdlog::level::level_enum map_level(LogLevel l) {
  switch (l) {
    case LogLevel::trace:    return spdlog::level::trace;
    case LogLevel::debug:    return spdlog::level::debug;
    case LogLevel::info:     return spdlog::level::info;
    case LogLevel::warn:     return spdlog::level::warn;
    case LogLevel::err:      return spdlog::level::err;
    case LogLevel::critical: return spdlog::level::critical;
    case LogLevel::off:      return spdlog::level::off;
  }
  return spdlog::level::info;
}

// Per-level colors on the console sink only; file output stays plain.
void configure_console_colors(const std::shared_ptr<spdlog::sinks::ansicolor_stdout_sink_mt>& sink) {
  const std::string BGRAY   = "\x1b[90m";
  const std::string CYAN    = "\x1b[36m";
  const std::string GREEN   = "\x1b[32m";
  const std::string YELLOW  = "\x1b[33m";
  const std::string RED     = "\x1b[31m";
  const std::string MAGENTA = "\x1b[35m";

  sink->set_color(spdlog::level::trace,    BGRAY);
  sink->set_color(spdlog::level::debug,    CYAN);
  sink->set_color(spdlog::level::info,     GREEN);
  sink->set_color(spdlog::level::warn,     YELLOW);
  sink->set_color(spdlog::level::err,      RED);
  sink->set_color(spdlog::level::critical, MAGENTA);
}

// Caller holds g_mu.
std::shared_ptr<spdlog::logger> build(const LogConfig& cfg) {
  const std::string name = strata::config::constants::LOGGER_NAME;
  if (auto prev = spdlog::get(name)) spdlog::drop(prev->name());

  std::vector<spdlog::sink_ptr> sinks;
  if (cfg.console) {
    auto console = std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>();
    configure_console_colors(console);
    sinks.push_back(console);
  }
  if (!cfg.file_path.empty()) {
    const fs::path path{cfg.file_path};
    if (path.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(path.parent_path(), ec);
    }
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        path.string(), cfg.file_max_bytes, cfg.file_count));
  }

  auto lg = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  lg->set_pattern(cfg.pattern);
  lg->set_level(map_level(cfg.level));
  lg->flush_on(spdlog::level::err);
  spdlog::register_logger(lg);
  return lg;
}

} // namespace

std::optional<LogLevel> parse_level(std::string_view text) {
  std::string s(text);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (s == "trace")                    return LogLevel::trace;
  if (s == "debug")                    return LogLevel::debug;
  if (s == "info")                     return LogLevel::info;
  if (s == "warn" || s == "warning")   return LogLevel::warn;
  if (s == "err" || s == "error")      return LogLevel::err;
  if (s == "critical")                 return LogLevel::critical;
  if (s == "off")                      return LogLevel::off;
  return std::nullopt;
}

void init_logging(const LogConfig& cfg) {
  std::lock_guard<std::mutex> lk(g_mu);
  auto lg = build(cfg);
  g_logger.store(lg, std::memory_order_release);
  lg->debug("strata {} logging initialized", strata::version_string);
}

std::shared_ptr<spdlog::logger> logger() {
  if (auto lg = g_logger.load(std::memory_order_acquire)) return lg;

  // First use without init_logging(): build the default once.
  std::lock_guard<std::mutex> lk(g_mu);
  auto lg = g_logger.load(std::memory_order_acquire);
  if (!lg) {
    lg = build(LogConfig{});
    g_logger.store(lg, std::memory_order_release);
  }
  return lg;
}

void set_level(LogLevel level) {
  logger()->set_level(map_level(level));
}

} // namespace strata::obs
