#pragma once

#include <string>

namespace config {

struct FfmpegConfig {
  std::string binary;
  std::string version_flag;
};

struct ManifestConfig {
  std::string prefix;
  std::string suffix;
  std::string directory;
};

struct ProgramConfig {
  std::string name;
  std::string version;
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Getters
const FfmpegConfig& getFfmpeg() const { return ffmpeg_; }
const ManifestConfig& getManifest() const { return manifest_; }
const ProgramConfig& getProgram() const { return program_; }
std::string getVersionString() const { return program_.name + " " + program_.version; }

private:
  Config();

  FfmpegConfig ffmpeg_;
  ManifestConfig manifest_;
  ProgramConfig program_;
};

} // namespace config
