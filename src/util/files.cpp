// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include "util/files.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace bitwire {
namespace util {

std::optional<std::string> read_file_string(const std::filesystem::path& path) {
  // Config files are small; refuse anything that is clearly not one
  constexpr std::uintmax_t MAX_FILE_SIZE = 16 * 1024 * 1024;

  std::error_code ec;
  std::uintmax_t size = std::filesystem::file_size(path, ec);
  if (ec) {
    LOG_DEBUG("read_file_string: cannot stat {}: {}", path.string(), ec.message());
    return std::nullopt;
  }
  if (size > MAX_FILE_SIZE) {
    LOG_ERROR("read_file_string: {} exceeds max size ({} bytes)", path.string(), size);
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    LOG_ERROR("read_file_string: failed to open {}: {} (errno={})", path.string(), std::strerror(errno), errno);
    return std::nullopt;
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  return contents.str();
}

bool ensure_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::is_directory(dir);
}

std::filesystem::path get_default_datadir() {
  const char* home = std::getenv("HOME");
  if (home && *home) {
    return std::filesystem::path(home) / ".bitwire";
  }
  LOG_ERROR("get_default_datadir: HOME environment variable not set. "
            "Please use --datadir to specify the data directory explicitly.");
  return std::filesystem::path();
}

}  // namespace util
}  // namespace bitwire
