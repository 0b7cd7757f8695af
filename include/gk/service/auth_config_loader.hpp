#pragma once

/// @file auth_config_loader.hpp
/// @brief Maps the `auth.*` configuration keys onto AuthConfig.

#include "gk/foundation/config_manager.hpp"
#include "gk/service/auth_types.hpp"

namespace gk::service {

/// Build an AuthConfig from @p config. Absent or mistyped keys keep their
/// defaults.
///
/// | Key                                        | Field                     |
/// |--------------------------------------------|---------------------------|
/// | auth.secret_key_base                       | secretKeyBase             |
/// | auth.confirmation_token_expiry_seconds     | confirmationTokenExpiry   |
/// | auth.password_reset_token_expiry_seconds   | passwordResetTokenExpiry  |
/// | auth.remember_cookie_expiry_days           | rememberCookieExpiry      |
/// | auth.remember_cookie_name                  | rememberCookieName        |
/// | auth.password_hash_iterations              | passwordHashIterations    |
/// | auth.min_password_length                   | minPasswordLength         |
/// | auth.require_password_complexity           | requirePasswordComplexity |
/// | auth.uniform_reset_response                | uniformResetResponse      |
/// | auth.mailer_from                           | mailerFrom                |
/// | auth.root_path                             | rootPath                  |
[[nodiscard]] AuthConfig buildAuthConfig(const gk::foundation::ConfigManager& config);

}  // namespace gk::service
