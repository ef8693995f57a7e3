// subprocess_runner.cpp
#include "subprocess_runner.hpp"

#include <future>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/process.hpp>

namespace merge_service {
namespace bp = boost::process;

namespace {
constexpr const char* kToolNotFound =
  "FFmpeg not found. Please install FFmpeg and ensure it's in your PATH";
}

SubprocessRunner::SubprocessRunner(std::string binary, std::string version_flag)
    : binary_(std::move(binary)), version_flag_(std::move(version_flag)) {}

std::expected<CapturedOutput, MergeError> SubprocessRunner::run(
    const std::vector<std::string>& arguments) {
  boost::filesystem::path executable;
  if (binary_.find('/') != std::string::npos) {
    executable = binary_;
  } else {
    executable = bp::search_path(binary_);
  }

  if (executable.empty()) {
    return std::unexpected(MergeError(ErrorKind::ToolNotFound, kToolNotFound)
      .withCause("'" + binary_ + "' was not found in PATH"));
  }

  boost::asio::io_context ioc;
  std::future<std::string> stdout_data;
  std::future<std::string> stderr_data;

  try {
    bp::child child(executable, bp::args(arguments),
                    bp::std_in.close(),
                    bp::std_out > stdout_data,
                    bp::std_err > stderr_data,
                    ioc);
    ioc.run();
    child.wait();

    CapturedOutput output;
    output.exit_code = child.exit_code();
    output.stdout_text = stdout_data.get();
    output.stderr_text = stderr_data.get();
    return output;
  } catch (const bp::process_error& e) {
    return std::unexpected(MergeError(ErrorKind::ToolNotFound, kToolNotFound)
      .withCause("Failed to execute " + executable.string() + ": " + e.what()));
  }
}

std::expected<void, MergeError> SubprocessRunner::checkAvailability() {
  auto output = run({version_flag_});
  if (!output) {
    return std::unexpected(output.error());
  }

  if (output->exit_code != 0) {
    return std::unexpected(MergeError(ErrorKind::ToolNotFound, kToolNotFound)
      .withCause("'" + binary_ + " " + version_flag_ + "' exited with code " +
                 std::to_string(output->exit_code)));
  }

  return {};
}

std::expected<CapturedOutput, MergeError> SubprocessRunner::execute(
    const std::vector<std::string>& arguments) {
  auto output = run(arguments);
  if (!output) {
    return std::unexpected(output.error());
  }

  if (output->exit_code != 0) {
    return std::unexpected(MergeError::executionFailed(output->stderr_text));
  }

  return output;
}

} // namespace merge_service
