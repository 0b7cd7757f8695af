/// @file auth_config_loader.cpp
/// @brief buildAuthConfig implementation.

#include "gk/service/auth_config_loader.hpp"

#include "gk/foundation/service_logger.hpp"

#include <string>

namespace gk::service {

using gk::foundation::LogCategory;

AuthConfig buildAuthConfig(const gk::foundation::ConfigManager& config) {
    AuthConfig cfg;

    auto secret = config.get<std::string>("auth.secret_key_base");
    if (secret) {
        cfg.secretKeyBase = std::move(secret).value();
    } else {
        GK_LOG_WARN(LogCategory::Config,
                    "auth.secret_key_base not set; using the built-in development secret");
    }

    auto confirmationExpiry = config.get<int>("auth.confirmation_token_expiry_seconds");
    if (confirmationExpiry && confirmationExpiry.value() > 0) {
        cfg.confirmationTokenExpiry = std::chrono::seconds(confirmationExpiry.value());
    }

    auto resetExpiry = config.get<int>("auth.password_reset_token_expiry_seconds");
    if (resetExpiry && resetExpiry.value() > 0) {
        cfg.passwordResetTokenExpiry = std::chrono::seconds(resetExpiry.value());
    }

    auto rememberDays = config.get<int>("auth.remember_cookie_expiry_days");
    if (rememberDays && rememberDays.value() > 0) {
        cfg.rememberCookieExpiry = std::chrono::hours(24 * rememberDays.value());
    }

    auto cookieName = config.get<std::string>("auth.remember_cookie_name");
    if (cookieName && !cookieName.value().empty()) {
        cfg.rememberCookieName = std::move(cookieName).value();
    }

    auto iterations = config.get<unsigned int>("auth.password_hash_iterations");
    if (iterations && iterations.value() > 0) {
        cfg.passwordHashIterations = iterations.value();
    }

    auto minPwLen = config.get<unsigned int>("auth.min_password_length");
    if (minPwLen) {
        cfg.minPasswordLength = minPwLen.value();
    }

    cfg.requirePasswordComplexity =
        config.getOr<bool>("auth.require_password_complexity", cfg.requirePasswordComplexity);
    cfg.uniformResetResponse =
        config.getOr<bool>("auth.uniform_reset_response", cfg.uniformResetResponse);

    auto from = config.get<std::string>("auth.mailer_from");
    if (from) {
        cfg.mailerFrom = std::move(from).value();
    }

    auto rootPath = config.get<std::string>("auth.root_path");
    if (rootPath) {
        cfg.rootPath = std::move(rootPath).value();
    }

    return cfg;
}

}  // namespace gk::service
