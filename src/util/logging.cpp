// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace foldchain {
namespace util {

namespace {

std::recursive_mutex g_log_mutex;
bool g_initialized = false;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;

const std::vector<std::string> &Components() {
  static const std::vector<std::string> components = {
      "default", "chain", "crypto", "accumulator", "consensus", "app"};
  return components;
}

} // namespace

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::lock_guard<std::recursive_mutex> lock(g_log_mutex);
  if (g_initialized) {
    return;
  }

  try {
    std::vector<spdlog::sink_ptr> sinks;

    if (log_to_file) {
      // Append mode
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          log_file_path, true);
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
      sinks.push_back(file_sink);
    } else {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
      sinks.push_back(console_sink);
    }

    const auto level = spdlog::level::from_str(log_level);
    for (const auto &component : Components()) {
      // Drop any registration left over from a previous session
      spdlog::drop(component);
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      logger->set_level(level);
      logger->flush_on(spdlog::level::warn);
      spdlog::register_logger(logger);
      g_loggers[component] = logger;
    }

    spdlog::set_default_logger(g_loggers["default"]);
    g_initialized = true;

    g_loggers["default"]->debug("Logging system initialized (level: {})",
                                log_level);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

void LogManager::Shutdown() {
  std::lock_guard<std::recursive_mutex> lock(g_log_mutex);
  if (!g_initialized) {
    return;
  }

  for (auto &[name, logger] : g_loggers) {
    logger->flush();
  }
  g_loggers.clear();
  spdlog::shutdown();
  g_initialized = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  std::lock_guard<std::recursive_mutex> lock(g_log_mutex);
  if (!g_initialized) {
    // Auto-initialize with defaults if not initialized
    Initialize();
  }

  auto it = g_loggers.find(name);
  if (it != g_loggers.end()) {
    return it->second;
  }

  // Initialization failed: fall back to whatever spdlog provides
  auto def = g_loggers.find("default");
  if (def == g_loggers.end()) {
    return spdlog::default_logger();
  }
  return def->second;
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::recursive_mutex> lock(g_log_mutex);
  if (!g_initialized) {
    return;
  }

  auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : g_loggers) {
    logger->set_level(log_level);
  }
}

void LogManager::SetComponentLevel(const std::string &component,
                                   const std::string &level) {
  std::lock_guard<std::recursive_mutex> lock(g_log_mutex);
  if (!g_initialized) {
    return;
  }

  auto it = g_loggers.find(component);
  if (it != g_loggers.end()) {
    it->second->set_level(spdlog::level::from_str(level));
  } else {
    g_loggers["default"]->warn("Unknown log component: {}", component);
  }
}

bool LogManager::IsInitialized() {
  std::lock_guard<std::recursive_mutex> lock(g_log_mutex);
  return g_initialized;
}

} // namespace util
} // namespace foldchain
