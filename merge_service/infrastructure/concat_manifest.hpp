#pragma once

// project
#include "common/types.hpp"

// std
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace merge_service {

// Temporary list file for FFmpeg's concat demuxer. The file lives exactly as
// long as the handle: the destructor removes it.
class ConcatManifest {
public:
  static std::expected<ConcatManifest, MergeError> create(
    const std::vector<std::filesystem::path>& input_files,
    const std::filesystem::path& directory,
    const std::string& prefix,
    const std::string& suffix
  );

  ConcatManifest(ConcatManifest&& other) noexcept;
  ConcatManifest& operator=(ConcatManifest&& other) noexcept;
  ConcatManifest(const ConcatManifest&) = delete;
  ConcatManifest& operator=(const ConcatManifest&) = delete;
  ~ConcatManifest();

  const std::filesystem::path& path() const { return path_; }

  // One concat demuxer line: file '<path>', with ' escaped as '\''.
  static std::string formatEntry(const std::filesystem::path& absolute_path);

private:
  explicit ConcatManifest(std::filesystem::path path);
  void release();

  std::filesystem::path path_;
};

} // namespace merge_service
