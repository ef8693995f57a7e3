// subprocess_runner.hpp
#pragma once

#include "domain/media_processor.hpp"

#include <expected>
#include <string>
#include <vector>

namespace merge_service {

// Runs the FFmpeg binary synchronously and captures both output streams.
// A binary name without '/' is looked up on PATH.
class SubprocessRunner : public MediaProcessor {
public:
  SubprocessRunner(std::string binary, std::string version_flag);

  std::expected<void, MergeError> checkAvailability() override;

  std::expected<CapturedOutput, MergeError> execute(
    const std::vector<std::string>& arguments
  ) override;

  const std::string& program() const override { return binary_; }

private:
  std::expected<CapturedOutput, MergeError> run(const std::vector<std::string>& arguments);

  std::string binary_;
  std::string version_flag_;
};

} // namespace merge_service
