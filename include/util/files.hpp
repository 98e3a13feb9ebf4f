// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace bitwire {
namespace util {

// Whole file as text; nullopt if it cannot be opened or is larger than 16MB
std::optional<std::string> read_file_string(const std::filesystem::path& path);

// Create directory (and parents). True if it exists afterwards.
bool ensure_directory(const std::filesystem::path& dir);

// ~/.bitwire, or an empty path if HOME is not set
std::filesystem::path get_default_datadir();

}  // namespace util
}  // namespace bitwire
