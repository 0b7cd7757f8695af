#pragma once

/// @file auth_server.hpp
/// @brief Authentication service facade used by request handlers.
///
/// Orchestrates the credential store, session lifecycle, confirmation and
/// password reset flows behind one explicit interface. Every call takes the
/// RequestContext of the request being served; nothing is kept in globals.

#include "gk/foundation/service_result.hpp"
#include "gk/foundation/types.hpp"
#include "gk/service/auth_types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace gk::service {

class AccountService;
class Authenticator;
class ConfirmationService;
class CookieVault;
class IMailer;
class ISessionRepository;
class IUserRepository;
class PasswordHasher;
class PasswordResetService;
class RequestContext;
class SessionManager;
class TokenProvider;

/// Authentication server implementing sign-up, login/logout, remember-me,
/// email confirmation, password reset, account edits and per-device
/// session management.
///
/// Operations that only make sense for visitors (sign-up, login,
/// confirmation resend, password reset) fail with AlreadyAuthenticated on
/// an authenticated request; account operations fail with NotAuthenticated
/// on an anonymous one.
///
/// Example:
/// @code
///   auto users = std::make_shared<InMemoryUserRepository>();
///   auto sessions = std::make_shared<InMemorySessionRepository>();
///   AuthServer server(AuthConfig{}, users, sessions, std::make_shared<LoggingMailer>());
///
///   RequestContext ctx(metadata);
///   server.restoreSession(ctx);
///   auto outcome = server.login(ctx, "alice@example.com", "secret123", true);
///   (void)server.commitSession(ctx);
/// @endcode
class AuthServer {
public:
    /// Name of the signed cookie carrying the request session.
    static constexpr std::string_view kSessionCookieName = "_gatekeeper_session";

    AuthServer(AuthConfig config,
               std::shared_ptr<IUserRepository> userRepo,
               std::shared_ptr<ISessionRepository> sessionRepo,
               std::shared_ptr<IMailer> mailer,
               gk::foundation::Clock clock = gk::foundation::systemClock());

    ~AuthServer();

    AuthServer(const AuthServer&) = delete;
    AuthServer& operator=(const AuthServer&) = delete;
    AuthServer(AuthServer&&) noexcept;
    AuthServer& operator=(AuthServer&&) noexcept;

    // -- Request plumbing -----------------------------------------------------

    /// Load the session from the request's signed session cookie.
    /// A missing or tampered cookie leaves an empty session.
    void restoreSession(RequestContext& ctx) const;

    /// Sign the session back into the response's session cookie.
    [[nodiscard]] gk::foundation::ServiceResult<void> commitSession(RequestContext& ctx) const;

    // -- Visitors -------------------------------------------------------------

    /// Create an account and mail a confirmation link.
    [[nodiscard]] gk::foundation::ServiceResult<UserRecord> signUp(RequestContext& ctx,
                                                                   const SignUpParams& params);

    /// Log in with email and password.
    ///
    /// Fails with IncorrectCredentials for an unknown email or a wrong
    /// password alike, and with AccountUnconfirmed (only once the password
    /// matched) for an unconfirmed account. With @p rememberMe the device
    /// gets the remember-me cookie; without it any stale one is deleted.
    /// The outcome carries the remembered URL or the root path.
    [[nodiscard]] gk::foundation::ServiceResult<LoginOutcome> login(RequestContext& ctx,
                                                                    std::string_view email,
                                                                    std::string_view password,
                                                                    bool rememberMe);

    /// Resend a confirmation link. Succeeds for every email.
    [[nodiscard]] gk::foundation::ServiceResult<void> requestConfirmation(RequestContext& ctx,
                                                                          std::string_view email);

    /// Apply a confirmation link.
    ///
    /// A visitor (or a different user) is logged in as the confirmed user
    /// on a new ActiveSession; a user confirming their own pending email
    /// change keeps the current session.
    [[nodiscard]] gk::foundation::ServiceResult<UserRecord> confirm(RequestContext& ctx,
                                                                    std::string_view token);

    /// Start a password reset.
    [[nodiscard]] gk::foundation::ServiceResult<void> requestPasswordReset(
        RequestContext& ctx, std::string_view email);

    /// Check a reset link before the new-password form is shown.
    [[nodiscard]] gk::foundation::ServiceResult<UserRecord> verifyPasswordResetToken(
        RequestContext& ctx, std::string_view token);

    /// Apply a reset link with a new password. Does not log in.
    [[nodiscard]] gk::foundation::ServiceResult<void> resetPassword(
        RequestContext& ctx, std::string_view token, std::string_view newPassword,
        std::string_view newPasswordConfirmation);

    // -- Authenticated users --------------------------------------------------

    [[nodiscard]] std::optional<UserRecord> currentUser(RequestContext& ctx);

    [[nodiscard]] gk::foundation::ServiceResult<UserRecord> requireAuthenticated(
        RequestContext& ctx);

    /// Log out this device.
    [[nodiscard]] gk::foundation::ServiceResult<void> logout(RequestContext& ctx);

    [[nodiscard]] gk::foundation::ServiceResult<UserRecord> updateAccount(
        RequestContext& ctx, const AccountUpdate& update);

    /// Delete the current account with all its sessions, and log out.
    [[nodiscard]] gk::foundation::ServiceResult<void> deleteAccount(RequestContext& ctx);

    [[nodiscard]] gk::foundation::ServiceResult<std::vector<ActiveSessionRecord>> listSessions(
        RequestContext& ctx);

    [[nodiscard]] gk::foundation::ServiceResult<void> revokeSession(RequestContext& ctx,
                                                                    ActiveSessionId id);

    /// Sign out everywhere, this device included.
    [[nodiscard]] gk::foundation::ServiceResult<std::size_t> revokeAllSessions(
        RequestContext& ctx);

private:
    AuthConfig config_;
    std::shared_ptr<IUserRepository> userRepo_;
    std::shared_ptr<ISessionRepository> sessionRepo_;
    std::shared_ptr<IMailer> mailer_;
    std::shared_ptr<const PasswordHasher> hasher_;
    std::shared_ptr<const TokenProvider> tokens_;
    std::shared_ptr<const CookieVault> vault_;
    std::shared_ptr<const Authenticator> authenticator_;
    std::unique_ptr<SessionManager> sessions_;
    std::shared_ptr<ConfirmationService> confirmations_;
    std::unique_ptr<PasswordResetService> passwordResets_;
    std::unique_ptr<AccountService> accounts_;
};

}  // namespace gk::service
