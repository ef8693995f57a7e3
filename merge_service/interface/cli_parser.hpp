#pragma once
#include "domain/merge_request.hpp"
#include <expected>
#include <string>
#include <vector>

namespace merge_service {

struct CliCommand {
  enum class Action { Merge, Help, Version };

  Action action{Action::Merge};
  MergeRequest request;
  std::string usage;
};

class CliParser {
public:
  explicit CliParser(std::string program_name);

  // Usage errors come back as the parser's message.
  std::expected<CliCommand, std::string> parse(const std::vector<std::string>& args) const;
  std::expected<CliCommand, std::string> parse(int argc, const char* const argv[]) const;

  std::string usage() const;

private:
  std::string program_name_;
};

} // namespace merge_service
