#pragma once

/// @file service_runner.hpp
/// @brief Process plumbing for gk_auth_service: command line, config file
///        resolution and shutdown on SIGINT/SIGTERM.

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

#include <csignal>
#include <signal.h>

#include "gk/foundation/service_result.hpp"
#include "gk/service/auth_types.hpp"

namespace gk::service {

/// Used when neither --config nor GK_CONFIG_PATH names a file.
inline constexpr std::string_view kDefaultConfigPath = "/etc/gatekeeper/config.yaml";

/// Environment variable consulted when --config is absent.
inline constexpr const char* kConfigPathEnv = "GK_CONFIG_PATH";

/// What the command line asked gk_auth_service to do.
struct RunnerOptions {
    std::filesystem::path configPath;  ///< From --config; empty if not given.
    bool showVersion = false;
    bool showHelp = false;
};

/// Parse `--config <path>`, `--config=<path>`, `--version` and `--help`.
///
/// Any other argument, or --config without a path, is an InvalidArgument
/// error naming the offending argument.
[[nodiscard]] gk::foundation::ServiceResult<RunnerOptions>
parseRunnerOptions(int argc, char* argv[]);

/// One-line usage text for @p program.
[[nodiscard]] std::string runnerUsage(std::string_view program);

/// --config wins, then GK_CONFIG_PATH, then kDefaultConfigPath.
[[nodiscard]] std::filesystem::path resolveConfigPath(const RunnerOptions& options);

/// Read the YAML file at @p path and build the auth settings from it.
[[nodiscard]] gk::foundation::ServiceResult<AuthConfig>
loadAuthConfig(const std::filesystem::path& path);

/// Traps SIGINT and SIGTERM for its lifetime and reports whether either
/// arrived. The handlers in place before construction come back on
/// destruction. Keep at most one alive.
class ShutdownSignal {
public:
    ShutdownSignal();
    ~ShutdownSignal();

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    [[nodiscard]] bool received() const noexcept;

    /// Sleep in @p poll steps until received().
    void wait(std::chrono::milliseconds poll = std::chrono::milliseconds(100)) const;

private:
    static void onSignal(int signal);
    static volatile std::sig_atomic_t pending_;

    struct sigaction previousInt_ {};
    struct sigaction previousTerm_ {};
};

}  // namespace gk::service
