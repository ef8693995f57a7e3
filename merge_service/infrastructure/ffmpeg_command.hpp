#pragma once
#include "domain/merge_request.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace merge_service {

// Argument vector for a concat-demuxer merge, program name excluded:
// -f concat -safe 0 -i <manifest> -c:v <v> -c:a <a> [-b:v <q>] -y <output>
std::vector<std::string> buildFFmpegCommand(
  const MergeRequest& request,
  const std::filesystem::path& manifest_path,
  const std::filesystem::path& output_path
);

// Shell-like rendering for verbose output only; never executed.
std::string renderCommandLine(const std::string& program,
                              const std::vector<std::string>& arguments);

} // namespace merge_service
