#include "merge_service.hpp"
#include "application/input_validator.hpp"
#include "infrastructure/concat_manifest.hpp"
#include "infrastructure/ffmpeg_command.hpp"
#include <iomanip>
#include <iostream>
#include <system_error>
#include <utility>

namespace merge_service {
namespace fs = std::filesystem;

MergeService::MergeService(std::shared_ptr<MediaProcessor> processor,
                           const fs::path& manifest_dir,
                           const std::string& manifest_prefix,
                           const std::string& manifest_suffix)
  : processor_(std::move(processor)),
    manifest_dir_(manifest_dir),
    manifest_prefix_(manifest_prefix),
    manifest_suffix_(manifest_suffix) {}

std::expected<MergeReport, MergeError> MergeService::mergeVideos(const MergeRequest& request) {
  if (auto result = InputValidator::validate(request.input_files); !result) {
    return std::unexpected(result.error().withContext("Input validation failed"));
  }

  if (auto result = processor_->checkAvailability(); !result) {
    return std::unexpected(result.error().withContext("FFmpeg availability check failed"));
  }
  if (request.verbose) {
    std::cout << "FFmpeg is available" << std::endl;
  }

  auto output_path = request.resolvedOutputPath();
  if (!output_path) {
    return std::unexpected(output_path.error().withContext("Failed to generate output path"));
  }

  if (request.verbose) {
    std::cout << "Input files:";
    for (const auto& file : request.input_files) {
      std::cout << " " << file;
    }
    std::cout << std::endl;
    std::cout << "Output file: " << output_path->string() << std::endl;
    std::cout << "Video codec: " << request.videoCodec() << std::endl;
    std::cout << "Audio codec: " << request.audioCodec() << std::endl;
  }

  {
    auto manifest = ConcatManifest::create(request.input_files, manifest_dir_,
                                           manifest_prefix_, manifest_suffix_);
    if (!manifest) {
      return std::unexpected(manifest.error().withContext("Failed to create concat file"));
    }
    if (request.verbose) {
      std::cout << "Created temporary concat file: " << manifest->path().string() << std::endl;
    }

    auto arguments = buildFFmpegCommand(request, manifest->path(), *output_path);
    if (request.verbose) {
      std::cout << "FFmpeg command: " << renderCommandLine(processor_->program(), arguments) << std::endl;
      std::cout << "Starting video merge process..." << std::endl;
    }

    auto output = processor_->execute(arguments);
    if (!output) {
      return std::unexpected(output.error().withContext("FFmpeg execution failed"));
    }

    if (request.verbose) {
      if (!output->stdout_text.empty()) {
        std::cout << "FFmpeg stdout:\n" << output->stdout_text << std::endl;
      }
      if (!output->stderr_text.empty()) {
        std::cout << "FFmpeg stderr:\n" << output->stderr_text << std::endl;
      }
    }
  } // manifest removed here

  std::error_code ec;
  if (!fs::is_regular_file(*output_path, ec)) {
    return std::unexpected(MergeError(ErrorKind::OutputNotCreated,
      "Output file was not created: " + output_path->string(), *output_path));
  }

  MergeReport report;
  report.output_path = *output_path;

  std::cout << "Video merge completed successfully!" << std::endl;
  std::cout << "Output file: " << output_path->string() << std::endl;

  if (auto size = fs::file_size(*output_path, ec); !ec) {
    report.size_bytes = size;
    double size_mb = static_cast<double>(size) / 1024.0 / 1024.0;
    std::cout << "Output file size: " << std::fixed << std::setprecision(2)
              << size_mb << " MB" << std::endl;
  }

  return report;
}
}
