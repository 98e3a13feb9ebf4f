// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace bitwire {

constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

constexpr const char* CLIENT_NAME = "bitwire";

inline std::string GetFullVersion() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." + std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// BIP 14 user agent, e.g. "/bitwire:0.3.0/"
inline std::string GetUserAgent() {
  return std::string("/") + CLIENT_NAME + ":" + GetFullVersion() + "/";
}

}  // namespace bitwire
