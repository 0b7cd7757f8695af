#pragma once

/// @file password_reset_service.hpp
/// @brief Password reset: issue reset_password tokens and apply them.

#include "gk/foundation/service_result.hpp"
#include "gk/service/auth_types.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace gk::service {

class IMailer;
class IUserRepository;
class PasswordHasher;
class TokenProvider;

/// Password reset flow.
///
/// A reset token stays usable until its own expiry, including after a
/// successful reset. A successful reset does not log the user in.
class PasswordResetService {
public:
    PasswordResetService(const AuthConfig& config,
                         std::shared_ptr<IUserRepository> userRepo,
                         std::shared_ptr<const TokenProvider> tokens,
                         std::shared_ptr<const PasswordHasher> hasher,
                         std::shared_ptr<IMailer> mailer);

    /// Start a reset for @p email.
    ///
    /// Unknown emails succeed without sending anything. An unconfirmed
    /// account fails with AccountUnconfirmed, or succeeds silently when
    /// uniform responses are configured; no mail is sent either way. A
    /// confirmed account gets a reset_password token by mail.
    [[nodiscard]] gk::foundation::ServiceResult<void> requestReset(std::string_view email);

    /// Check a reset link before showing the new-password form.
    /// Fails with InvalidOrExpiredToken or AccountUnconfirmed.
    [[nodiscard]] gk::foundation::ServiceResult<UserRecord> verifyResetToken(
        std::string_view token) const;

    /// Apply a reset_password token with a new password.
    ///
    /// Fails closed with InvalidOrExpiredToken on any token problem, with
    /// AccountUnconfirmed if the user is unconfirmed, and with
    /// ValidationFailed (field details attached) when the new password is
    /// rejected; nothing is written on failure.
    [[nodiscard]] gk::foundation::ServiceResult<UserRecord> consumeReset(
        std::string_view token, std::string_view newPassword,
        std::string_view newPasswordConfirmation);

private:
    uint32_t minPasswordLength_;
    bool requirePasswordComplexity_;
    bool uniformResetResponse_;
    std::string mailerFrom_;
    std::shared_ptr<IUserRepository> userRepo_;
    std::shared_ptr<const TokenProvider> tokens_;
    std::shared_ptr<const PasswordHasher> hasher_;
    std::shared_ptr<IMailer> mailer_;
};

}  // namespace gk::service
