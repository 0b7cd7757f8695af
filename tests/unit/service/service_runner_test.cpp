#include <gtest/gtest.h>

#include "gk/foundation/config_manager.hpp"
#include "gk/foundation/error_code.hpp"
#include "gk/service/auth_config_loader.hpp"
#include "gk/service/auth_types.hpp"
#include "gk/service/service_runner.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace gk::service;
using gk::foundation::ConfigManager;
using gk::foundation::ErrorCode;

using ServiceResultOptions = gk::foundation::ServiceResult<RunnerOptions>;

// =============================================================================
// buildAuthConfig
// =============================================================================

TEST(AuthConfigLoaderTest, EmptyDocumentKeepsDefaults) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("{}").hasValue());

    auto cfg = buildAuthConfig(config);
    AuthConfig defaults;
    EXPECT_EQ(cfg.secretKeyBase, defaults.secretKeyBase);
    EXPECT_EQ(cfg.confirmationTokenExpiry, std::chrono::seconds(600));
    EXPECT_EQ(cfg.passwordResetTokenExpiry, std::chrono::seconds(600));
    EXPECT_EQ(cfg.rememberCookieExpiry, std::chrono::hours(24 * 7300));
    EXPECT_EQ(cfg.rememberCookieName, "remember_token");
    EXPECT_EQ(cfg.minPasswordLength, 6u);
    EXPECT_FALSE(cfg.requirePasswordComplexity);
    EXPECT_FALSE(cfg.uniformResetResponse);
    EXPECT_EQ(cfg.rootPath, "/");
}

TEST(AuthConfigLoaderTest, ReadsEveryKey) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString(R"(
auth:
  secret_key_base: "from-config-secret-0123456789abcdef"
  confirmation_token_expiry_seconds: 900
  password_reset_token_expiry_seconds: 300
  remember_cookie_expiry_days: 14
  remember_cookie_name: "keep_me"
  password_hash_iterations: 5000
  min_password_length: 10
  require_password_complexity: true
  uniform_reset_response: true
  mailer_from: "accounts@example.org"
  root_path: "/home"
)").hasValue());

    auto cfg = buildAuthConfig(config);
    EXPECT_EQ(cfg.secretKeyBase, "from-config-secret-0123456789abcdef");
    EXPECT_EQ(cfg.confirmationTokenExpiry, std::chrono::seconds(900));
    EXPECT_EQ(cfg.passwordResetTokenExpiry, std::chrono::seconds(300));
    EXPECT_EQ(cfg.rememberCookieExpiry, std::chrono::hours(24 * 14));
    EXPECT_EQ(cfg.rememberCookieName, "keep_me");
    EXPECT_EQ(cfg.passwordHashIterations, 5000u);
    EXPECT_EQ(cfg.minPasswordLength, 10u);
    EXPECT_TRUE(cfg.requirePasswordComplexity);
    EXPECT_TRUE(cfg.uniformResetResponse);
    EXPECT_EQ(cfg.mailerFrom, "accounts@example.org");
    EXPECT_EQ(cfg.rootPath, "/home");
}

TEST(AuthConfigLoaderTest, NonPositiveDurationsIgnored) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString(R"(
auth:
  confirmation_token_expiry_seconds: 0
  password_reset_token_expiry_seconds: -5
  remember_cookie_name: ""
)").hasValue());

    auto cfg = buildAuthConfig(config);
    EXPECT_EQ(cfg.confirmationTokenExpiry, std::chrono::seconds(600));
    EXPECT_EQ(cfg.passwordResetTokenExpiry, std::chrono::seconds(600));
    EXPECT_EQ(cfg.rememberCookieName, "remember_token");
}

TEST(AuthConfigLoaderTest, MistypedValueKeepsDefault) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString(R"(
auth:
  confirmation_token_expiry_seconds: "ten minutes"
)").hasValue());

    EXPECT_EQ(buildAuthConfig(config).confirmationTokenExpiry, std::chrono::seconds(600));
}

// =============================================================================
// parseRunnerOptions
// =============================================================================

namespace {

ServiceResultOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "gk_auth_service");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parseRunnerOptions(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST(RunnerOptionsTest, NoArgumentsMeansDefaults) {
    auto options = parse({});
    ASSERT_TRUE(options.hasValue());
    EXPECT_TRUE(options.value().configPath.empty());
    EXPECT_FALSE(options.value().showVersion);
    EXPECT_FALSE(options.value().showHelp);
}

TEST(RunnerOptionsTest, ConfigPathInEitherForm) {
    auto separate = parse({"--config", "/etc/gatekeeper/auth.yaml"});
    ASSERT_TRUE(separate.hasValue());
    EXPECT_EQ(separate.value().configPath, std::filesystem::path("/etc/gatekeeper/auth.yaml"));

    auto joined = parse({"--config=/srv/auth.yaml", "--version"});
    ASSERT_TRUE(joined.hasValue());
    EXPECT_EQ(joined.value().configPath, std::filesystem::path("/srv/auth.yaml"));
    EXPECT_TRUE(joined.value().showVersion);
}

TEST(RunnerOptionsTest, ConfigWithoutPathRejected) {
    for (auto args : {std::vector<std::string>{"--config"}, std::vector<std::string>{"--config="}}) {
        auto options = parse(args);
        ASSERT_TRUE(options.hasError());
        EXPECT_EQ(options.error().code(), ErrorCode::InvalidArgument);
    }
}

TEST(RunnerOptionsTest, UnknownArgumentNamed) {
    auto options = parse({"--port", "8080"});
    ASSERT_TRUE(options.hasError());
    EXPECT_EQ(options.error().code(), ErrorCode::InvalidArgument);
    EXPECT_NE(options.error().message().find("--port"), std::string_view::npos);
}

TEST(RunnerOptionsTest, UsageNamesProgram) {
    EXPECT_EQ(runnerUsage("gk_auth_service").rfind("usage: gk_auth_service", 0), 0u);
}

// =============================================================================
// ShutdownSignal
// =============================================================================

TEST(ShutdownSignalTest, CatchesTermAndRestoresPreviousHandler) {
    struct sigaction before {};
    ASSERT_EQ(::sigaction(SIGTERM, nullptr, &before), 0);
    {
        ShutdownSignal shutdown;
        EXPECT_FALSE(shutdown.received());
        ASSERT_EQ(std::raise(SIGTERM), 0);
        EXPECT_TRUE(shutdown.received());
        shutdown.wait(std::chrono::milliseconds(1));
    }
    struct sigaction after {};
    ASSERT_EQ(::sigaction(SIGTERM, nullptr, &after), 0);
    EXPECT_EQ(after.sa_handler, before.sa_handler);
}

TEST(ShutdownSignalTest, NewInstanceStartsClear) {
    {
        ShutdownSignal first;
        ASSERT_EQ(std::raise(SIGINT), 0);
        EXPECT_TRUE(first.received());
    }
    ShutdownSignal second;
    EXPECT_FALSE(second.received());
}

// =============================================================================
// Config file resolution
// =============================================================================

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = std::filesystem::temp_directory_path() /
                  (std::string("gk_runner_") + info->name());
        std::filesystem::create_directories(tmpDir_);
        ::unsetenv(kConfigPathEnv);
    }

    void TearDown() override {
        ::unsetenv(kConfigPathEnv);
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename, const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigFileTest, DefaultPathWhenNothingGiven) {
    EXPECT_EQ(resolveConfigPath({}), std::filesystem::path(kDefaultConfigPath));
}

TEST_F(ConfigFileTest, EnvironmentUsedWithoutFlag) {
    ::setenv(kConfigPathEnv, "/from/env.yaml", 1);
    EXPECT_EQ(resolveConfigPath({}), std::filesystem::path("/from/env.yaml"));
}

TEST_F(ConfigFileTest, FlagBeatsEnvironment) {
    ::setenv(kConfigPathEnv, "/from/env.yaml", 1);
    RunnerOptions options;
    options.configPath = "/from/flag.yaml";
    EXPECT_EQ(resolveConfigPath(options), std::filesystem::path("/from/flag.yaml"));
}

TEST_F(ConfigFileTest, LoadBuildsAuthConfig) {
    auto path = writeYaml("auth.yaml",
                          "auth:\n"
                          "  root_path: \"/accounts\"\n"
                          "  remember_cookie_name: \"keep_me\"\n");
    auto config = loadAuthConfig(path);
    ASSERT_TRUE(config.hasValue());
    EXPECT_EQ(config.value().rootPath, "/accounts");
    EXPECT_EQ(config.value().rememberCookieName, "keep_me");
}

TEST_F(ConfigFileTest, MissingFileFails) {
    auto result = loadAuthConfig(tmpDir_ / "absent.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}
