// Copyright (c) 2024 FoldChain
// Unit tests for LogManager

#include <catch2/catch_test_macros.hpp>
#include "util/logging.hpp"

using foldchain::util::LogManager;

TEST_CASE("LogManager - Component loggers", "[logging]") {
    LogManager::Shutdown();
    REQUIRE_FALSE(LogManager::IsInitialized());

    LogManager::Initialize("warn", false, "");
    REQUIRE(LogManager::IsInitialized());

    SECTION("Every component has its own logger") {
        for (const char* name : {"chain", "crypto", "accumulator", "consensus", "app"}) {
            auto logger = LogManager::GetLogger(name);
            REQUIRE(logger != nullptr);
            REQUIRE(logger->name() == name);
            REQUIRE(logger->level() == spdlog::level::warn);
        }
    }

    SECTION("Unknown components fall back to the default logger") {
        REQUIRE(LogManager::GetLogger("no-such-component") == LogManager::GetLogger());
    }

    SECTION("Component level is independent") {
        LogManager::SetComponentLevel("accumulator", "trace");
        REQUIRE(LogManager::GetLogger("accumulator")->level() == spdlog::level::trace);
        REQUIRE(LogManager::GetLogger("chain")->level() == spdlog::level::warn);

        LogManager::SetLogLevel("error");
        REQUIRE(LogManager::GetLogger("accumulator")->level() == spdlog::level::err);
        REQUIRE(LogManager::GetLogger("chain")->level() == spdlog::level::err);
    }

    SECTION("Second Initialize is ignored") {
        LogManager::Initialize("trace", false, "");
        REQUIRE(LogManager::GetLogger("chain")->level() == spdlog::level::warn);
    }

    SECTION("Macros log without throwing") {
        LOG_CHAIN_INFO("chain message {}", 1);
        LOG_ACCUM_WARN("accumulator message {}", 2);
        LOG_CONSENSUS_ERROR("consensus message {}", 3);
        LOG_CRYPTO_DEBUG("crypto message {}", 4);
    }

    SECTION("Logging after shutdown reinitializes") {
        LogManager::Shutdown();
        REQUIRE(LogManager::GetLogger("chain") != nullptr);
        REQUIRE(LogManager::IsInitialized());
    }

    // Leave the run quiet for later tests
    LogManager::Shutdown();
    LogManager::Initialize("off", false, "");
}
