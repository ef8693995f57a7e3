#include "input_validator.hpp"
#include <system_error>

namespace merge_service {
namespace fs = std::filesystem;

std::expected<void, MergeError> InputValidator::validate(
  const std::vector<fs::path>& input_files
) {
  if (input_files.empty()) {
    return std::unexpected(MergeError(ErrorKind::NoInputFiles, "No input files provided"));
  }

  for (const auto& file : input_files) {
    std::error_code ec;
    auto status = fs::status(file, ec);
    if (!fs::exists(status)) {
      return std::unexpected(MergeError(ErrorKind::MissingInput,
        "Input file does not exist: " + file.string(), file));
    }
    if (!fs::is_regular_file(status)) {
      return std::unexpected(MergeError(ErrorKind::NotAFile,
        "Input path is not a file: " + file.string(), file));
    }
  }

  return {};
}
}
