// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "util/logging.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace bitwire::util;

TEST_CASE("Logger access without explicit initialization", "[logging]") {
  LogManager::Shutdown();
  auto logger = LogManager::GetLogger("network");
  REQUIRE(logger != nullptr);
  CHECK(logger->level() == spdlog::level::off);
  LogManager::Shutdown();
}

TEST_CASE("Unknown components fall back to the default logger", "[logging]") {
  LogManager::Shutdown();
  LogManager::Initialize("info");
  auto fallback = LogManager::GetLogger("no-such-component");
  auto def = LogManager::GetLogger("default");
  CHECK(fallback == def);
  LogManager::Shutdown();
}

TEST_CASE("Log levels can be changed at runtime", "[logging]") {
  LogManager::Shutdown();
  LogManager::Initialize("warn");
  CHECK(LogManager::GetLogger("chain")->level() == spdlog::level::warn);

  LogManager::SetLogLevel("debug");
  CHECK(LogManager::GetLogger("chain")->level() == spdlog::level::debug);
  CHECK(LogManager::GetLogger("network")->level() == spdlog::level::debug);

  LogManager::SetComponentLevel("network", "error");
  CHECK(LogManager::GetLogger("network")->level() == spdlog::level::err);
  CHECK(LogManager::GetLogger("chain")->level() == spdlog::level::debug);
  LogManager::Shutdown();
}

TEST_CASE("Second Initialize is a no-op until Shutdown", "[logging]") {
  LogManager::Shutdown();
  LogManager::Initialize("error");
  LogManager::Initialize("trace");
  CHECK(LogManager::GetLogger()->level() == spdlog::level::err);
  LogManager::Shutdown();

  LogManager::Initialize("trace");
  CHECK(LogManager::GetLogger()->level() == spdlog::level::trace);
  LogManager::Shutdown();
}

TEST_CASE("File sink receives log lines", "[logging]") {
  namespace fs = std::filesystem;
  const fs::path path = fs::temp_directory_path() / "bitwire_logging_test.log";
  std::error_code ec;
  fs::remove(path, ec);

  LogManager::Shutdown();
  LogManager::Initialize("info", true, path.string());
  LOG_NET_INFO("peer={} marker line", 42);
  LogManager::Shutdown();

  std::ifstream in(path);
  REQUIRE(in.good());
  std::stringstream contents;
  contents << in.rdbuf();
  CHECK(contents.str().find("peer=42 marker line") != std::string::npos);
  CHECK(contents.str().find("[network]") != std::string::npos);

  in.close();
  fs::remove(path, ec);
}
