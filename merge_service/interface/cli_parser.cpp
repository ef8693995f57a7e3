#include "cli_parser.hpp"
#include <sstream>
#include <utility>
#include <boost/program_options.hpp>

namespace merge_service {
namespace po = boost::program_options;

namespace {

constexpr const char* kLongAbout =
  "vmerger merges multiple video files into a single file and provides format "
  "conversion options. It drives an external FFmpeg program to do the actual "
  "media work.";

po::options_description makeOptions() {
  po::options_description options("Options");
  options.add_options()
    ("help,h", "Print help")
    ("version,V", "Print version")
    ("format,F", po::value<std::string>()->value_name("FORMAT"),
      "Output format (e.g., mp4, avi, mov, mkv)")
    ("output,O", po::value<std::string>()->value_name("PATH"),
      "Output file path")
    ("verbose,v", po::bool_switch(), "Enable verbose output")
    ("video-codec", po::value<std::string>()->value_name("CODEC"),
      "Video codec to use (e.g., libx264, libx265, copy)")
    ("audio-codec", po::value<std::string>()->value_name("CODEC"),
      "Audio codec to use (e.g., aac, mp3, copy)")
    ("quality,q", po::value<std::string>()->value_name("BITRATE"),
      "Video quality/bitrate (e.g., 1M, 2000k)");
  return options;
}

po::options_description makeHidden() {
  po::options_description hidden;
  hidden.add_options()
    ("input-files", po::value<std::vector<std::string>>(), "Input video files to merge");
  return hidden;
}

template <typename T>
std::optional<T> optionalValue(const po::variables_map& vm, const char* name) {
  if (vm.count(name)) {
    return T(vm[name].as<std::string>());
  }
  return std::nullopt;
}

} // namespace

CliParser::CliParser(std::string program_name) : program_name_(std::move(program_name)) {}

std::string CliParser::usage() const {
  std::ostringstream out;
  out << kLongAbout << "\n\n"
      << "Usage: " << program_name_ << " [OPTIONS] <INPUT_FILES>...\n\n"
      << "Arguments:\n"
      << "  <INPUT_FILES>...  Input video files to merge\n\n"
      << makeOptions();
  return out.str();
}

std::expected<CliCommand, std::string> CliParser::parse(int argc, const char* const argv[]) const {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse(args);
}

std::expected<CliCommand, std::string> CliParser::parse(const std::vector<std::string>& args) const {
  po::options_description all;
  all.add(makeOptions()).add(makeHidden());

  po::positional_options_description positional;
  positional.add("input-files", -1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(args).options(all).positional(positional).run(), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    return std::unexpected(std::string(e.what()));
  }

  CliCommand command;
  if (vm.count("help")) {
    command.action = CliCommand::Action::Help;
    command.usage = usage();
    return command;
  }
  if (vm.count("version")) {
    command.action = CliCommand::Action::Version;
    return command;
  }

  if (!vm.count("input-files")) {
    return std::unexpected(std::string(
      "the following required arguments were not provided: <INPUT_FILES>..."));
  }

  auto& request = command.request;
  for (const auto& file : vm["input-files"].as<std::vector<std::string>>()) {
    request.input_files.emplace_back(file);
  }
  request.output_format = optionalValue<std::string>(vm, "format");
  request.output_path = optionalValue<std::filesystem::path>(vm, "output");
  request.video_codec = optionalValue<std::string>(vm, "video-codec");
  request.audio_codec = optionalValue<std::string>(vm, "audio-codec");
  request.video_quality = optionalValue<std::string>(vm, "quality");
  request.verbose = vm["verbose"].as<bool>();

  return command;
}

} // namespace merge_service
