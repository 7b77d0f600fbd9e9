#include <gtest/gtest.h>

#include "browser_interface/services/browser_handler.hpp"
#include "test_helpers.hpp"

using browser_interface::core::BrowserError;
using browser_interface::core::LaunchMechanism;
using browser_interface::core::LauncherConfig;
using browser_interface::core::Platform;
using browser_interface::services::BrowserHandler;
using browser_interface::services::HandlerOptions;
using browser_interface::test::RecordingProcessRunner;
using browser_interface::test::RunnerRecord;
using browser_interface::test::ScopedLogCapture;
using browser_interface::utils::LogLevel;

struct BrowserHandlerTest : public testing::Test {
protected:
  std::shared_ptr<RunnerRecord> record_ = std::make_shared<RunnerRecord>();

  HandlerOptions options(Platform platform = Platform::Linux,
                         LaunchMechanism mechanism = LaunchMechanism::Automatic) {
    HandlerOptions opts;
    opts.platform = platform;
    opts.mechanism = mechanism;
    opts.runner = std::make_unique<RecordingProcessRunner>(record_);
    return opts;
  }

  std::string launched_url(size_t index = 0) const {
    if (index >= record_->requests.size() || record_->requests[index].arguments.empty()) {
      return {};
    }
    return record_->requests[index].arguments.front();
  }
};

TEST_F(BrowserHandlerTest, OpensPlainUrl) {
  BrowserHandler handler(options());

  auto result = handler.open_url("https://www.example.com");
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(*result);
  ASSERT_EQ(record_->requests.size(), 1u);
  EXPECT_EQ(record_->requests[0].program, "xdg-open");
  EXPECT_EQ(launched_url(), "https://www.example.com");
}

TEST_F(BrowserHandlerTest, OpensUrlWithQuery) {
  BrowserHandler handler(options());

  auto result = handler.open_url("https://www.example.com", {{"q", "hello world"}});
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(*result);
  EXPECT_EQ(launched_url(), "https://www.example.com?q=hello world");
}

TEST_F(BrowserHandlerTest, EmptyUrlIsMalformed) {
  BrowserHandler handler(options());

  auto result = handler.open_url("", {{"q", 1}});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), BrowserError::MalformedUrl);
  EXPECT_TRUE(record_->requests.empty());
}

TEST_F(BrowserHandlerTest, FtpUrlIsMalformed) {
  BrowserHandler handler(options());

  auto result = handler.open_url("ftp://www.example.com");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), BrowserError::MalformedUrl);
  EXPECT_TRUE(record_->requests.empty());
}

TEST_F(BrowserHandlerTest, RandomTextIsMalformed) {
  BrowserHandler handler(options());

  auto result = handler.open_url("KQZJWHXBNCMVLAP");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), BrowserError::MalformedUrl);
}

TEST_F(BrowserHandlerTest, CollidingKeysLaunchNothing) {
  BrowserHandler handler(options());

  auto result = handler.open_url("https://www.example.com", {{"a", 1}, {"a", "1"}});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), BrowserError::KeyCollision);
  EXPECT_TRUE(record_->requests.empty());
}

TEST_F(BrowserHandlerTest, DisposedHandlerFailsFast) {
  BrowserHandler handler(options());
  handler.dispose();

  EXPECT_TRUE(handler.is_disposed());
  EXPECT_TRUE(record_->destroyed);

  auto result = handler.open_url("http://www.example.com");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), BrowserError::Disposed);
  EXPECT_TRUE(record_->requests.empty());
}

TEST_F(BrowserHandlerTest, DisposedCheckComesFirst) {
  BrowserHandler handler(options(Platform::Unknown));
  handler.dispose();

  auto result = handler.open_url("");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), BrowserError::Disposed);
}

TEST_F(BrowserHandlerTest, DisposeIsIdempotent) {
  BrowserHandler handler(options());
  handler.dispose();
  handler.dispose();
  EXPECT_TRUE(handler.is_disposed());
}

TEST_F(BrowserHandlerTest, DestructorReleasesRunner) {
  {
    BrowserHandler handler(options());
    EXPECT_FALSE(record_->destroyed);
  }
  EXPECT_TRUE(record_->destroyed);
}

TEST_F(BrowserHandlerTest, UnknownPlatformIsUnsupported) {
  BrowserHandler handler(options(Platform::Unknown));

  auto result = handler.open_url("https://www.example.com");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), BrowserError::UnsupportedPlatform);
  EXPECT_TRUE(record_->requests.empty());
}

TEST_F(BrowserHandlerTest, MechanismUnavailableOnPlatformIsUnsupported) {
  BrowserHandler handler(options(Platform::Linux, LaunchMechanism::Native));

  auto result = handler.open_url("https://www.example.com");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), BrowserError::UnsupportedPlatform);
}

TEST_F(BrowserHandlerTest, NonZeroExitIsSoftFailureWithWarning) {
  ScopedLogCapture capture(LogLevel::Warning);
  record_->exit_code = 4;
  BrowserHandler handler(options());

  auto result = handler.open_url("https://www.example.com");
  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(*result);

  ASSERT_EQ(capture.count(LogLevel::Warning), 1u);
  const auto &message = capture.messages().back().m_message;
  EXPECT_NE(message.find("[https://www.example.com]"), std::string::npos);
  EXPECT_NE(message.find("[4]"), std::string::npos);
}

TEST_F(BrowserHandlerTest, WarningCanBeDisabled) {
  ScopedLogCapture capture(LogLevel::Warning);
  record_->exit_code = 1;
  auto opts = options();
  opts.warn_on_failure = false;
  BrowserHandler handler(std::move(opts));

  auto result = handler.open_url("https://www.example.com");
  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(*result);
  EXPECT_EQ(capture.count(LogLevel::Warning), 0u);
}

TEST_F(BrowserHandlerTest, SpawnFailureIsHardError) {
  record_->fail_to_spawn = true;
  BrowserHandler handler(options());

  auto result = handler.open_url("https://www.example.com");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), BrowserError::LaunchFailed);
}

TEST_F(BrowserHandlerTest, OpensSeveralUrlsInSequence) {
  BrowserHandler handler(options());

  for (int i = 0; i < 10; ++i) {
    auto url = "http://www.example.com/page" + std::to_string(i) + "/";
    auto result = handler.open_url(url);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(*result);
    EXPECT_EQ(launched_url(static_cast<size_t>(i)), url);
  }
  EXPECT_EQ(record_->requests.size(), 10u);
}

TEST_F(BrowserHandlerTest, ForbiddenCharactersNeverReachTheLauncher) {
  BrowserHandler handler(options());

  auto result = handler.open_url("https://www.example.com/a;b", {{"x", "1;rm -rf ~"}, {"y|", "`id`"}});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(launched_url(), "https://www.example.com/ab?x=1rm -rf ~&y=id");
}

TEST_F(BrowserHandlerTest, ShellMechanismUsesEscapedSeparator) {
  BrowserHandler handler(options(Platform::Linux, LaunchMechanism::Shell));

  auto result = handler.open_url("https://www.example.com", {{"a", 1}, {"b", 2}});
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(record_->requests.size(), 1u);
  EXPECT_EQ(record_->requests[0].program, "sh");
  EXPECT_EQ(record_->requests[0].standard_input, "xdg-open https://www.example.com\\?a=1\\&b=2\n");
}

TEST_F(BrowserHandlerTest, ShellMechanismKeepsSpacesInsideTheUrl) {
  BrowserHandler handler(options(Platform::Linux, LaunchMechanism::Shell));

  auto result = handler.open_url("https://www.example.com", {{"q", "hello world"}});
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(record_->requests.size(), 1u);
  EXPECT_EQ(record_->requests[0].standard_input, "xdg-open https://www.example.com\\?q=hello\\ world\n");
}

TEST_F(BrowserHandlerTest, MovedFromHandlerIsDisposed) {
  BrowserHandler first(options());
  BrowserHandler second(std::move(first));

  EXPECT_TRUE(first.is_disposed());
  EXPECT_FALSE(second.is_disposed());
  EXPECT_FALSE(record_->destroyed);

  auto result = first.open_url("https://www.example.com");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), BrowserError::Disposed);

  result = second.open_url("https://www.example.com");
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(*result);
}

TEST(HandlerOptionsTest, FromConfig) {
  LauncherConfig config;
  config.mechanism = LaunchMechanism::Shell;
  config.warn_on_failure = false;

  auto options = HandlerOptions::from_config(config);
  EXPECT_EQ(options.mechanism, LaunchMechanism::Shell);
  EXPECT_FALSE(options.warn_on_failure);
  EXPECT_TRUE(options.runner == nullptr);
}
