#pragma once
#include "common/types.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace merge_service {

// Parsed user intent for one invocation. Built once, then only read.
struct MergeRequest {
  std::vector<std::filesystem::path> input_files;
  std::optional<std::string> output_format;   // container format like "mp4", "mkv"
  std::optional<std::filesystem::path> output_path;
  std::optional<std::string> video_codec;
  std::optional<std::string> audio_codec;
  std::optional<std::string> video_quality;   // bitrate like "1M", "2000k"
  bool verbose{false};

  // Explicit output path if given, otherwise "<stem>_merged.<format>".
  std::expected<std::filesystem::path, MergeError> resolvedOutputPath() const;

  // Explicit override, then the format table, then "copy".
  std::string videoCodec() const;
  std::string audioCodec() const;
};

} // namespace merge_service
