#include "application/merge_service.hpp"
#include "infrastructure/subprocess_runner.hpp"
#include "interface/cli_parser.hpp"
#include "common/config/config.hpp"
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
  try {
    const auto& cfg = config::Config::getInstance();

    merge_service::CliParser parser(cfg.getProgram().name);
    auto command = parser.parse(argc, argv);
    if (!command) {
      std::cerr << "Error: " << command.error() << std::endl;
      std::cerr << "For more information, try '--help'." << std::endl;
      return 1;
    }

    switch (command->action) {
      case merge_service::CliCommand::Action::Help:
        std::cout << command->usage << std::endl;
        return 0;
      case merge_service::CliCommand::Action::Version:
        std::cout << cfg.getVersionString() << std::endl;
        return 0;
      case merge_service::CliCommand::Action::Merge:
        break;
    }

    const auto& ffmpeg_config = cfg.getFfmpeg();
    std::shared_ptr<merge_service::MediaProcessor> processor =
      std::make_shared<merge_service::SubprocessRunner>(
        ffmpeg_config.binary,
        ffmpeg_config.version_flag
      );

    const auto& manifest_config = cfg.getManifest();
    merge_service::MergeService service(
      processor,
      manifest_config.directory,
      manifest_config.prefix,
      manifest_config.suffix
    );

    const merge_service::MergeRequest& request = command->request;
    auto result = service.mergeVideos(request);
    if (!result) {
      const auto& chain = result.error().chain();
      std::cerr << "Error: " << chain.front() << std::endl;
      for (size_t i = 1; i < chain.size(); ++i) {
        std::cerr << "   Caused by: " << chain[i] << std::endl;
      }
      return 1;
    }

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
