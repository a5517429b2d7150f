// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace foldchain {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * (default, chain, crypto, accumulator, consensus, app).
 *
 * Thread-safety: All methods are thread-safe. Logger access and
 * reconfiguration are protected by a mutex.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Multiple calls are safe; only the first call after startup (or after
   * Shutdown()) performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  /**
   * Shutdown logging system (flushes buffers)
   *
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "chain", "crypto", "consensus")
   *
   * Auto-initializes if not initialized. Unknown names map to the default
   * logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name
   * @param level Log level (trace, debug, info, warn, error, critical)
   */
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);

  static bool IsInitialized();
};

} // namespace util
} // namespace foldchain

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  foldchain::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  foldchain::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  foldchain::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  foldchain::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  foldchain::util::LogManager::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  foldchain::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Component-specific logging
#define LOG_CHAIN_TRACE(...)                                                   \
  foldchain::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  foldchain::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  foldchain::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  foldchain::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  foldchain::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_CRYPTO_TRACE(...)                                                  \
  foldchain::util::LogManager::GetLogger("crypto")->trace(__VA_ARGS__)
#define LOG_CRYPTO_DEBUG(...)                                                  \
  foldchain::util::LogManager::GetLogger("crypto")->debug(__VA_ARGS__)
#define LOG_CRYPTO_INFO(...)                                                   \
  foldchain::util::LogManager::GetLogger("crypto")->info(__VA_ARGS__)
#define LOG_CRYPTO_WARN(...)                                                   \
  foldchain::util::LogManager::GetLogger("crypto")->warn(__VA_ARGS__)
#define LOG_CRYPTO_ERROR(...)                                                  \
  foldchain::util::LogManager::GetLogger("crypto")->error(__VA_ARGS__)

#define LOG_ACCUM_TRACE(...)                                                   \
  foldchain::util::LogManager::GetLogger("accumulator")->trace(__VA_ARGS__)
#define LOG_ACCUM_DEBUG(...)                                                   \
  foldchain::util::LogManager::GetLogger("accumulator")->debug(__VA_ARGS__)
#define LOG_ACCUM_INFO(...)                                                    \
  foldchain::util::LogManager::GetLogger("accumulator")->info(__VA_ARGS__)
#define LOG_ACCUM_WARN(...)                                                    \
  foldchain::util::LogManager::GetLogger("accumulator")->warn(__VA_ARGS__)
#define LOG_ACCUM_ERROR(...)                                                   \
  foldchain::util::LogManager::GetLogger("accumulator")->error(__VA_ARGS__)

#define LOG_CONSENSUS_TRACE(...)                                               \
  foldchain::util::LogManager::GetLogger("consensus")->trace(__VA_ARGS__)
#define LOG_CONSENSUS_DEBUG(...)                                               \
  foldchain::util::LogManager::GetLogger("consensus")->debug(__VA_ARGS__)
#define LOG_CONSENSUS_INFO(...)                                                \
  foldchain::util::LogManager::GetLogger("consensus")->info(__VA_ARGS__)
#define LOG_CONSENSUS_WARN(...)                                                \
  foldchain::util::LogManager::GetLogger("consensus")->warn(__VA_ARGS__)
#define LOG_CONSENSUS_ERROR(...)                                               \
  foldchain::util::LogManager::GetLogger("consensus")->error(__VA_ARGS__)
