#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace merge_service {

enum class ErrorKind {
  NoInputFiles,
  MissingInput,
  NotAFile,
  InvalidFilename,
  ToolNotFound,
  PathResolutionError,
  IoError,
  ExecutionFailed,
  OutputNotCreated
};

// Error value returned by every stage of a merge. chain.front() is the
// outermost context, chain.back() the root cause.
class MergeError {
public:
  MergeError(ErrorKind kind, std::string message)
    : kind_(kind), chain_{std::move(message)} {}

  MergeError(ErrorKind kind, std::string message, std::filesystem::path path)
    : kind_(kind), chain_{std::move(message)}, path_(std::move(path)) {}

  static MergeError executionFailed(std::string stderr_text) {
    MergeError error(ErrorKind::ExecutionFailed, "FFmpeg execution failed: " + stderr_text);
    error.stderr_text_ = std::move(stderr_text);
    return error;
  }

  MergeError& withContext(std::string context) {
    chain_.insert(chain_.begin(), std::move(context));
    return *this;
  }

  MergeError& withCause(std::string cause) {
    chain_.push_back(std::move(cause));
    return *this;
  }

  ErrorKind kind() const { return kind_; }
  const std::string& message() const { return chain_.front(); }
  const std::vector<std::string>& chain() const { return chain_; }
  const std::optional<std::filesystem::path>& path() const { return path_; }
  const std::string& stderrText() const { return stderr_text_; }

private:
  ErrorKind kind_;
  std::vector<std::string> chain_;
  std::optional<std::filesystem::path> path_;
  std::string stderr_text_;
};

struct CapturedOutput {
  int exit_code{0};
  std::string stdout_text;
  std::string stderr_text;
};

struct MergeReport {
  std::filesystem::path output_path;
  std::optional<std::uintmax_t> size_bytes;
};

#define DEFAULT_OUTPUT_FORMAT "mp4"
#define MERGED_FILE_SUFFIX "_merged"

} // namespace merge_service
