#include "ffmpeg_command.hpp"

namespace merge_service {

std::vector<std::string> buildFFmpegCommand(
  const MergeRequest& request,
  const std::filesystem::path& manifest_path,
  const std::filesystem::path& output_path
) {
  // -safe 0 because the manifest holds absolute paths
  std::vector<std::string> arguments = {
    "-f", "concat",
    "-safe", "0",
    "-i", manifest_path.string(),
    "-c:v", request.videoCodec(),
    "-c:a", request.audioCodec(),
  };

  if (request.video_quality) {
    arguments.push_back("-b:v");
    arguments.push_back(*request.video_quality);
  }

  arguments.push_back("-y");
  arguments.push_back(output_path.string());
  return arguments;
}

std::string renderCommandLine(const std::string& program,
                              const std::vector<std::string>& arguments) {
  auto quote = [](const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"'") == std::string::npos) {
      return arg;
    }
    std::string quoted = "\"";
    for (char c : arg) {
      if (c == '"' || c == '\\') {
        quoted += '\\';
      }
      quoted += c;
    }
    quoted += "\"";
    return quoted;
  };

  std::string command = quote(program);
  for (const auto& arg : arguments) {
    command += " " + quote(arg);
  }
  return command;
}

} // namespace merge_service
