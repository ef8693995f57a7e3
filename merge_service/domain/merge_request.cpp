#include "merge_request.hpp"
#include <algorithm>
#include <cctype>

namespace merge_service {

namespace {

struct FormatCodecs {
  const char* format;
  const char* video_codec;
  const char* audio_codec;
};

constexpr FormatCodecs kFormatCodecs[] = {
  {"mp4", "libx264", "aac"},
  {"mkv", "libx264", "aac"},
  {"avi", "libxvid", "mp3"},
  {"mov", "libx264", "aac"},
};

const FormatCodecs* lookupFormat(const std::optional<std::string>& format) {
  if (!format) {
    return nullptr;
  }
  std::string lowered = *format;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
    [](unsigned char c) { return std::tolower(c); });
  for (const auto& entry : kFormatCodecs) {
    if (lowered == entry.format) {
      return &entry;
    }
  }
  return nullptr;
}

} // namespace

std::expected<std::filesystem::path, MergeError> MergeRequest::resolvedOutputPath() const {
  if (output_path) {
    return *output_path;
  }

  if (input_files.empty()) {
    return std::unexpected(MergeError(ErrorKind::NoInputFiles, "No input files provided"));
  }

  const auto& first_input = input_files.front();
  auto filename = first_input.filename();
  if (filename.empty() || filename == "." || filename == "..") {
    return std::unexpected(MergeError(ErrorKind::InvalidFilename,
      "Invalid input filename: " + first_input.string(), first_input));
  }

  auto stem = first_input.stem().string();
  auto format = output_format.value_or(DEFAULT_OUTPUT_FORMAT);
  return std::filesystem::path(stem + MERGED_FILE_SUFFIX + "." + format);
}

std::string MergeRequest::videoCodec() const {
  if (video_codec) {
    return *video_codec;
  }
  if (const auto* entry = lookupFormat(output_format)) {
    return entry->video_codec;
  }
  return "copy";
}

std::string MergeRequest::audioCodec() const {
  if (audio_codec) {
    return *audio_codec;
  }
  if (const auto* entry = lookupFormat(output_format)) {
    return entry->audio_codec;
  }
  return "copy";
}

} // namespace merge_service
