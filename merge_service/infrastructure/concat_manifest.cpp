#include "concat_manifest.hpp"
#include <fstream>
#include <system_error>
#include <utility>
#include <uuid/uuid.h>

namespace merge_service {
namespace fs = std::filesystem;

ConcatManifest::ConcatManifest(fs::path path) : path_(std::move(path)) {}

ConcatManifest::ConcatManifest(ConcatManifest&& other) noexcept
  : path_(std::exchange(other.path_, fs::path{})) {}

ConcatManifest& ConcatManifest::operator=(ConcatManifest&& other) noexcept {
  if (this != &other) {
    release();
    path_ = std::exchange(other.path_, fs::path{});
  }
  return *this;
}

ConcatManifest::~ConcatManifest() {
  release();
}

void ConcatManifest::release() {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  fs::remove(path_, ec);
  path_.clear();
}

std::string ConcatManifest::formatEntry(const fs::path& absolute_path) {
  std::string line = "file '";
  for (char c : absolute_path.string()) {
    if (c == '\'') {
      line += "'\\''";
    } else {
      line += c;
    }
  }
  line += "'";
  return line;
}

std::expected<ConcatManifest, MergeError> ConcatManifest::create(
  const std::vector<fs::path>& input_files,
  const fs::path& directory,
  const std::string& prefix,
  const std::string& suffix
) {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse(uuid, uuid_str);

  // owns the path from here on, so every early return below cleans up
  ConcatManifest manifest(directory / (prefix + uuid_str + suffix));

  std::ofstream file(manifest.path(), std::ios::out | std::ios::trunc);
  if (!file) {
    return std::unexpected(MergeError(ErrorKind::IoError,
      "Failed to create temporary file: " + manifest.path().string(), manifest.path()));
  }

  for (const auto& input : input_files) {
    std::error_code ec;
    auto absolute_path = fs::canonical(input, ec);
    if (ec) {
      return std::unexpected(MergeError(ErrorKind::PathResolutionError,
        "Failed to get absolute path for: " + input.string() + " (" + ec.message() + ")",
        input));
    }

    file << formatEntry(absolute_path) << '\n';
    if (!file) {
      return std::unexpected(MergeError(ErrorKind::IoError,
        "Failed to write to temporary file: " + manifest.path().string(), manifest.path()));
    }
  }

  file.flush();
  if (!file) {
    return std::unexpected(MergeError(ErrorKind::IoError,
      "Failed to flush temporary file: " + manifest.path().string(), manifest.path()));
  }
  file.close();

  return manifest;
}

} // namespace merge_service
