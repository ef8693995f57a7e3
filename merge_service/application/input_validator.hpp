#pragma once
#include "common/types.hpp"
#include <expected>
#include <filesystem>
#include <vector>

namespace merge_service {
class InputValidator {
public:
  // Checks existence and type of every input at call time. The first
  // offending path is reported.
  static std::expected<void, MergeError> validate(
    const std::vector<std::filesystem::path>& input_files
  );
};
}
