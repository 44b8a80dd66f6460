#include "almanac/common/fs.hpp"

#include "almanac/common/random.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <regex>
#include <sstream>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace almanac::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        ErrorKind::Io, "Failed to create directory: " + path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return Result<std::string>::failure(ErrorKind::Io, "Unable to open " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return Result<std::string>::failure(ErrorKind::Io, "Unable to read " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

Result<std::filesystem::path> stage_file(const std::filesystem::path &path,
                                         const std::string &content) {
  if (!path.parent_path().empty()) {
    auto dir = ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return dir;
    }
  }

  const std::filesystem::path staged = path.string() + ".tmp-" + random_hex(4);
  std::FILE *file = std::fopen(staged.c_str(), "wb");
  if (file == nullptr) {
    return Result<std::filesystem::path>::failure(
        ErrorKind::Io, "Unable to create " + staged.string() + ": " + std::strerror(errno));
  }

  const bool written =
      content.empty() || std::fwrite(content.data(), 1, content.size(), file) == content.size();
  bool flushed = std::fflush(file) == 0;
#ifndef _WIN32
  flushed = flushed && ::fsync(::fileno(file)) == 0;
#endif
  const bool closed = std::fclose(file) == 0;
  if (!written || !flushed || !closed) {
    std::error_code ec;
    std::filesystem::remove(staged, ec);
    return Result<std::filesystem::path>::failure(ErrorKind::Io,
                                                  "Failed writing " + staged.string());
  }
  return Result<std::filesystem::path>::success(staged);
}

Status commit_staged_file(const std::filesystem::path &staged, const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::rename(staged, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(staged, ignored);
    return Status::error(ErrorKind::Io, "Failed to replace " + path.string() + ": " + ec.message());
  }
  return Status::success();
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &content) {
  auto staged = stage_file(path, content);
  if (!staged.ok()) {
    return staged.status();
  }
  return commit_staged_file(staged.value(), path);
}

} // namespace almanac::common
