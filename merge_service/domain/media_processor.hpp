#pragma once
#include "common/types.hpp"
#include <expected>
#include <string>
#include <vector>

namespace merge_service {
class MediaProcessor {
public:
  virtual ~MediaProcessor() = default;
  virtual std::expected<void, MergeError> checkAvailability() = 0;
  virtual std::expected<CapturedOutput, MergeError> execute(
    const std::vector<std::string>& arguments
  ) = 0;
  virtual const std::string& program() const = 0;
};
}
