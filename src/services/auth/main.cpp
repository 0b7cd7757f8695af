/// @file main.cpp
/// @brief Auth service entry point.
///
/// Standalone executable for the authentication service. Wires an
/// AuthServer with in-memory storage and a logging mailer, suitable for
/// development and testing.

#include "gk/foundation/service_logger.hpp"
#include "gk/service/auth_server.hpp"
#include "gk/service/mailer.hpp"
#include "gk/service/service_runner.hpp"
#include "gk/service/session_repository.hpp"
#include "gk/service/user_repository.hpp"
#include "gk/version.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
    auto options = gk::service::parseRunnerOptions(argc, argv);
    if (!options) {
        std::cerr << options.error().message() << "\n"
                  << gk::service::runnerUsage(argv[0]) << "\n";
        return EXIT_FAILURE;
    }
    if (options.value().showHelp) {
        std::cout << gk::service::runnerUsage(argv[0]) << "\n";
        return EXIT_SUCCESS;
    }
    if (options.value().showVersion) {
        std::cout << "gatekeeper " << gk::Version::string << "\n";
        return EXIT_SUCCESS;
    }

    gk::service::ShutdownSignal shutdown;

    auto configPath = gk::service::resolveConfigPath(options.value());
    auto authConfig = gk::service::loadAuthConfig(configPath);
    if (!authConfig) {
        std::cerr << "Failed to load config: " << authConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    // In-memory backends for standalone development mode.
    auto userRepo = std::make_shared<gk::service::InMemoryUserRepository>();
    auto sessionRepo = std::make_shared<gk::service::InMemorySessionRepository>();
    auto mailer = std::make_shared<gk::service::LoggingMailer>();

    gk::service::AuthServer server(authConfig.value(), userRepo, sessionRepo, mailer);

    GK_LOG_INFO(gk::foundation::LogCategory::Core,
                std::string("gatekeeper ") + gk::Version::string + " ready");
    std::cout << "Auth service started (config: " << configPath.string() << ")\n";

    shutdown.wait();

    if (auto flushed = gk::foundation::ServiceLogger::instance().flush(); !flushed) {
        std::cerr << "Failed to flush logs: " << flushed.error().message() << "\n";
    }
    std::cout << "Auth service stopped\n";
    return EXIT_SUCCESS;
}
