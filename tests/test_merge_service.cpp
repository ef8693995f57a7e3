#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>

#include "application/merge_service.hpp"
#include "infrastructure/subprocess_runner.hpp"
#include "support/scratch_dir.hpp"

namespace merge_service {
namespace {

constexpr const char* kPrefix = "vmerger_concat_";
constexpr const char* kSuffix = ".txt";
constexpr const char* kVersionFlag = "-version";

// Records calls and answers with canned results. Optionally writes the
// output file the way a real ffmpeg run would.
class FakeProcessor : public MediaProcessor {
public:
  std::expected<void, MergeError> checkAvailability() override {
    ++availability_checks;
    if (!available) {
      return std::unexpected(MergeError(ErrorKind::ToolNotFound,
        "FFmpeg not found. Please install FFmpeg and ensure it's in your PATH"));
    }
    return {};
  }

  std::expected<CapturedOutput, MergeError> execute(
    const std::vector<std::string>& arguments
  ) override {
    ++executions;
    last_arguments = arguments;

    // manifest must be on disk while the tool runs
    const auto& manifest = arguments.at(5);
    manifest_existed = std::filesystem::exists(manifest);
    std::ifstream in(manifest);
    std::stringstream content;
    content << in.rdbuf();
    manifest_content = content.str();

    if (!stderr_on_failure.empty()) {
      return std::unexpected(MergeError::executionFailed(stderr_on_failure));
    }
    if (create_output) {
      std::ofstream out(arguments.back(), std::ios::binary);
      out << output_content;
    }
    return CapturedOutput{0, "", "frame=  10"};
  }

  const std::string& program() const override { return program_; }

  bool available{true};
  bool create_output{true};
  std::string output_content{"merged"};
  std::string stderr_on_failure;

  int availability_checks{0};
  int executions{0};
  std::vector<std::string> last_arguments;
  bool manifest_existed{false};
  std::string manifest_content;

private:
  std::string program_{"ffmpeg"};
};

class MergeServiceTest : public ::testing::Test {
protected:
  void SetUp() override {
    processor_ = std::make_shared<FakeProcessor>();
    service_ = std::make_unique<MergeService>(processor_, manifests_.path(), kPrefix, kSuffix);
  }

  MergeRequest requestFor(std::vector<std::filesystem::path> inputs) {
    MergeRequest request;
    request.input_files = std::move(inputs);
    request.output_path = outputs_.path() / "merged.mp4";
    return request;
  }

  test_support::ScratchDir inputs_;
  test_support::ScratchDir outputs_;
  test_support::ScratchDir manifests_;
  std::shared_ptr<FakeProcessor> processor_;
  std::unique_ptr<MergeService> service_;
};

TEST_F(MergeServiceTest, SuccessfulMergeReportsOutputAndSize) {
  auto a = inputs_.touch("a.mp4");
  auto b = inputs_.touch("b.mp4");
  processor_->output_content = std::string(2048, 'x');

  auto report = service_->mergeVideos(requestFor({a, b}));
  ASSERT_TRUE(report.has_value()) << report.error().message();
  EXPECT_EQ(report->output_path, outputs_.path() / "merged.mp4");
  ASSERT_TRUE(report->size_bytes.has_value());
  EXPECT_EQ(*report->size_bytes, 2048u);

  EXPECT_TRUE(processor_->manifest_existed);
  EXPECT_EQ(processor_->manifest_content,
            "file '" + std::filesystem::canonical(a).string() + "'\n" +
            "file '" + std::filesystem::canonical(b).string() + "'\n");
  EXPECT_EQ(manifests_.countEntries(kPrefix), 0u);
}

TEST_F(MergeServiceTest, PassesBuiltCommandToProcessor) {
  auto a = inputs_.touch("a.mp4");
  auto request = requestFor({a});
  request.output_format = "avi";
  request.video_quality = "1M";

  ASSERT_TRUE(service_->mergeVideos(request).has_value());
  const auto& args = processor_->last_arguments;
  ASSERT_EQ(args.size(), 14u);
  EXPECT_EQ(args[0], "-f");
  EXPECT_EQ(args[1], "concat");
  EXPECT_EQ(args[7], "libxvid");
  EXPECT_EQ(args[9], "mp3");
  EXPECT_EQ(args[10], "-b:v");
  EXPECT_EQ(args[11], "1M");
  EXPECT_EQ(args[13], (outputs_.path() / "merged.mp4").string());
}

TEST_F(MergeServiceTest, EmptyInputFailsBeforeAnySubprocess) {
  auto result = service_->mergeVideos(requestFor({}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), ErrorKind::NoInputFiles);
  EXPECT_EQ(result.error().message(), "Input validation failed");
  EXPECT_EQ(processor_->availability_checks, 0);
  EXPECT_EQ(processor_->executions, 0);
}

TEST_F(MergeServiceTest, MissingInputCreatesNoManifestOrSubprocess) {
  auto a = inputs_.touch("a.mp4");
  auto missing = inputs_.path() / "missing.mp4";

  auto result = service_->mergeVideos(requestFor({a, missing}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), ErrorKind::MissingInput);
  EXPECT_EQ(*result.error().path(), missing);
  ASSERT_EQ(result.error().chain().size(), 2u);
  EXPECT_NE(result.error().chain()[1].find("missing.mp4"), std::string::npos);
  EXPECT_EQ(processor_->availability_checks, 0);
  EXPECT_EQ(processor_->executions, 0);
  EXPECT_EQ(manifests_.countEntries(kPrefix), 0u);
}

TEST_F(MergeServiceTest, ToolUnavailableStopsBeforeManifest) {
  auto a = inputs_.touch("a.mp4");
  processor_->available = false;

  auto result = service_->mergeVideos(requestFor({a}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), ErrorKind::ToolNotFound);
  EXPECT_EQ(result.error().message(), "FFmpeg availability check failed");
  EXPECT_EQ(processor_->executions, 0);
  EXPECT_EQ(manifests_.countEntries(kPrefix), 0u);
}

TEST_F(MergeServiceTest, ExecutionFailureRemovesManifest) {
  auto a = inputs_.touch("a.mp4");
  processor_->stderr_on_failure = "a.mp4: Invalid data found when processing input\n";

  auto result = service_->mergeVideos(requestFor({a}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), ErrorKind::ExecutionFailed);
  EXPECT_EQ(result.error().stderrText(), "a.mp4: Invalid data found when processing input\n");
  EXPECT_EQ(result.error().message(), "FFmpeg execution failed");
  EXPECT_TRUE(processor_->manifest_existed);
  EXPECT_EQ(manifests_.countEntries(kPrefix), 0u);
}

TEST_F(MergeServiceTest, SilentNoOpToolIsOutputNotCreated) {
  auto a = inputs_.touch("a.mp4");
  processor_->create_output = false;

  auto result = service_->mergeVideos(requestFor({a}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), ErrorKind::OutputNotCreated);
  EXPECT_NE(result.error().message().find("Output file was not created"), std::string::npos);
  EXPECT_EQ(processor_->executions, 1);
  EXPECT_EQ(manifests_.countEntries(kPrefix), 0u);
}

TEST_F(MergeServiceTest, DefaultOutputNameUsesFirstInputStem) {
  auto first = inputs_.touch("holiday.mp4");
  auto second = inputs_.touch("part2.mp4");
  MergeRequest request;
  request.input_files = {first, second};
  request.output_format = "mkv";
  processor_->create_output = false;

  auto result = service_->mergeVideos(request);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(processor_->last_arguments.back(), "holiday_merged.mkv");
  EXPECT_EQ(processor_->last_arguments[7], "libx264");
  EXPECT_EQ(processor_->last_arguments[9], "aac");
}

// End-to-end through the real subprocess runner with stand-in scripts.
TEST_F(MergeServiceTest, MissingToolEndToEnd) {
  auto a = inputs_.touch("a.mp4");
  auto runner = std::make_shared<SubprocessRunner>((inputs_.path() / "no-ffmpeg").string(), kVersionFlag);
  MergeService service(runner, manifests_.path(), kPrefix, kSuffix);

  auto result = service.mergeVideos(requestFor({a}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), ErrorKind::ToolNotFound);
  ASSERT_GE(result.error().chain().size(), 2u);
  EXPECT_NE(result.error().chain()[1].find("not found"), std::string::npos);
  EXPECT_EQ(manifests_.countEntries(kPrefix), 0u);
}

TEST_F(MergeServiceTest, ToolReportingSuccessWithoutOutputEndToEnd) {
  auto a = inputs_.touch("a.mp4");
  auto tool = inputs_.script("ffmpeg", "exit 0");
  auto runner = std::make_shared<SubprocessRunner>(tool.string(), kVersionFlag);
  MergeService service(runner, manifests_.path(), kPrefix, kSuffix);

  auto result = service.mergeVideos(requestFor({a}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), ErrorKind::OutputNotCreated);
  EXPECT_EQ(manifests_.countEntries(kPrefix), 0u);
}

TEST_F(MergeServiceTest, ScriptedToolMergeEndToEnd) {
  auto a = inputs_.touch("a.mp4", "first");
  auto b = inputs_.touch("b.mp4", "second");
  // copies the manifest into the output so the test can inspect what ffmpeg saw
  auto tool = inputs_.script("ffmpeg",
    "[ \"$1\" = \"-version\" ] && exit 0\n"
    "for last; do :; done\n"
    "cat \"$6\" > \"$last\"");
  auto runner = std::make_shared<SubprocessRunner>(tool.string(), kVersionFlag);
  MergeService service(runner, manifests_.path(), kPrefix, kSuffix);

  auto request = requestFor({a, b});
  request.verbose = true;
  auto report = service.mergeVideos(request);
  ASSERT_TRUE(report.has_value()) << report.error().message();

  std::ifstream in(report->output_path);
  std::stringstream content;
  content << in.rdbuf();
  EXPECT_EQ(content.str(),
            "file '" + std::filesystem::canonical(a).string() + "'\n" +
            "file '" + std::filesystem::canonical(b).string() + "'\n");
  EXPECT_EQ(manifests_.countEntries(kPrefix), 0u);
}

} // namespace
} // namespace merge_service
