/// @file service_runner.cpp
/// @brief gk_auth_service process plumbing.

#include "gk/service/service_runner.hpp"

#include "gk/foundation/config_manager.hpp"
#include "gk/foundation/error_code.hpp"
#include "gk/foundation/service_error.hpp"
#include "gk/foundation/service_logger.hpp"
#include "gk/service/auth_config_loader.hpp"

#include <cstdlib>
#include <thread>

namespace gk::service {

using gk::foundation::ErrorCode;
using gk::foundation::LogCategory;
using gk::foundation::ServiceError;
using gk::foundation::ServiceResult;

namespace {

constexpr std::string_view kConfigFlag = "--config";
constexpr std::string_view kConfigFlagAssign = "--config=";

ServiceResult<RunnerOptions> badArgument(std::string message) {
    return ServiceResult<RunnerOptions>::err(
        ServiceError(ErrorCode::InvalidArgument, std::move(message)));
}

}  // namespace

// -- Command line -------------------------------------------------------------

ServiceResult<RunnerOptions> parseRunnerOptions(int argc, char* argv[]) {
    RunnerOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--version") {
            options.showVersion = true;
        } else if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else if (arg == kConfigFlag) {
            if (i + 1 >= argc) {
                return badArgument("--config requires a path");
            }
            options.configPath = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        } else if (arg.substr(0, kConfigFlagAssign.size()) == kConfigFlagAssign) {
            arg.remove_prefix(kConfigFlagAssign.size());
            if (arg.empty()) {
                return badArgument("--config requires a path");
            }
            options.configPath = std::string(arg);
        } else {
            return badArgument("unrecognised argument: " + std::string(arg));
        }
    }
    return ServiceResult<RunnerOptions>::ok(std::move(options));
}

std::string runnerUsage(std::string_view program) {
    return "usage: " + std::string(program) + " [--config <path>] [--version] [--help]";
}

// -- Configuration ------------------------------------------------------------

std::filesystem::path resolveConfigPath(const RunnerOptions& options) {
    if (!options.configPath.empty()) {
        return options.configPath;
    }
    const char* fromEnv = std::getenv(kConfigPathEnv);
    if (fromEnv != nullptr && *fromEnv != '\0') {
        return fromEnv;
    }
    return std::filesystem::path(kDefaultConfigPath);
}

ServiceResult<AuthConfig> loadAuthConfig(const std::filesystem::path& path) {
    gk::foundation::ConfigManager config;
    GK_LOG_INFO(LogCategory::Config, "loading config from " + path.string());
    if (auto loaded = config.load(path); !loaded) {
        return ServiceResult<AuthConfig>::err(loaded.error());
    }
    return ServiceResult<AuthConfig>::ok(buildAuthConfig(config));
}

// -- ShutdownSignal -----------------------------------------------------------

volatile std::sig_atomic_t ShutdownSignal::pending_ = 0;

void ShutdownSignal::onSignal(int /*signal*/) {
    pending_ = 1;
}

ShutdownSignal::ShutdownSignal() {
    pending_ = 0;
    struct sigaction action {};
    action.sa_handler = &ShutdownSignal::onSignal;
    sigemptyset(&action.sa_mask);
    ::sigaction(SIGINT, &action, &previousInt_);
    ::sigaction(SIGTERM, &action, &previousTerm_);
}

ShutdownSignal::~ShutdownSignal() {
    ::sigaction(SIGINT, &previousInt_, nullptr);
    ::sigaction(SIGTERM, &previousTerm_, nullptr);
}

bool ShutdownSignal::received() const noexcept {
    return pending_ != 0;
}

void ShutdownSignal::wait(std::chrono::milliseconds poll) const {
    while (!received()) {
        std::this_thread::sleep_for(poll);
    }
    GK_LOG_INFO(LogCategory::Core, "shutdown signal received");
}

}  // namespace gk::service
