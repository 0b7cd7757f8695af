#pragma once

/// @file confirmation_service.hpp
/// @brief Email confirmation and reconfirmation state machine.
///
/// States are derived from UserRecord (confirmedAt, unconfirmedEmail):
///   Unconfirmed  -> Confirmed     first confirmation after sign-up
///   Reconfirming -> Confirmed     pending email moved into email
///   Confirmed    -> Reconfirming  account edit requests a new email
///
/// Unconfirmed and Reconfirming are the states in which a confirm_email
/// token may be consumed.

#include "gk/foundation/service_result.hpp"
#include "gk/foundation/types.hpp"
#include "gk/service/auth_types.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace gk::service {

class IMailer;
class IUserRepository;
class TokenProvider;

/// Issues confirmation mails and applies confirm_email tokens.
class ConfirmationService {
public:
    ConfirmationService(const AuthConfig& config,
                        std::shared_ptr<IUserRepository> userRepo,
                        std::shared_ptr<const TokenProvider> tokens,
                        std::shared_ptr<IMailer> mailer,
                        gk::foundation::Clock clock = gk::foundation::systemClock());

    /// Resend a confirmation for @p email.
    ///
    /// Always succeeds, whether or not the email is registered or already
    /// confirmed; mail goes out only for a user in an actionable state.
    [[nodiscard]] gk::foundation::ServiceResult<void> requestConfirmation(std::string_view email);

    /// Issue a confirm_email token for @p user and mail it to the user's
    /// confirmable email (the pending address when reconfirming).
    void sendConfirmation(const UserRecord& user);

    /// Apply a confirm_email token.
    ///
    /// Fails with InvalidOrExpiredToken for any token problem or when the
    /// user is not in an actionable state, and with EmailNoLongerAvailable
    /// when the pending email was taken by another account in the meantime
    /// (the user record is then left unchanged). Returns the confirmed user.
    [[nodiscard]] gk::foundation::ServiceResult<UserRecord> confirm(std::string_view token);

private:
    std::string mailerFrom_;
    std::shared_ptr<IUserRepository> userRepo_;
    std::shared_ptr<const TokenProvider> tokens_;
    std::shared_ptr<IMailer> mailer_;
    gk::foundation::Clock clock_;
};

}  // namespace gk::service
