#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include "domain/media_processor.hpp"
#include "domain/merge_request.hpp"

namespace merge_service {
class MergeService {
public:
  MergeService(std::shared_ptr<MediaProcessor> processor,
               const std::filesystem::path& manifest_dir,
               const std::string& manifest_prefix,
               const std::string& manifest_suffix);

  // validate -> probe tool -> resolve output -> manifest -> run -> verify.
  // Stops at the first failing step; the manifest never outlives the call.
  std::expected<MergeReport, MergeError> mergeVideos(const MergeRequest& request);

private:
  std::shared_ptr<MediaProcessor> processor_;
  std::filesystem::path manifest_dir_;
  std::string manifest_prefix_;
  std::string manifest_suffix_;
};
}
