#include "config.hpp"
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace config {

  Config::Config() {
    ffmpeg_ = {
      .binary = "ffmpeg",
      .version_flag = "-version"
    };

    // lets users point at a build outside PATH
    if (const char* binary = std::getenv("VMERGER_FFMPEG"); binary && *binary) {
      ffmpeg_.binary = binary;
    }

    std::error_code ec;
    auto temp_dir = std::filesystem::temp_directory_path(ec);

    manifest_ = {
      .prefix = "vmerger_concat_",
      .suffix = ".txt",
      .directory = ec ? std::string("/tmp") : temp_dir.string()
    };

    program_ = {
      .name = "vmerger",
      .version = "0.1.0"
    };
  }
}
