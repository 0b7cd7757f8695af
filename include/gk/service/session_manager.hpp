#pragma once

/// @file session_manager.hpp
/// @brief Per-device session lifecycle: login, logout, remember-me and
///        current-user resolution.
///
/// Maps request-scoped identifiers (the active-session id kept in the
/// signed session, and the encrypted remember-me cookie) to the
/// authenticated user, and owns the anti-fixation and revocation rules.

#include "gk/foundation/service_result.hpp"
#include "gk/foundation/types.hpp"
#include "gk/service/auth_types.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gk::service {

class CookieVault;
class ISessionRepository;
class IUserRepository;
class RequestContext;

/// Session lifecycle manager.
///
/// Per request: Anonymous -> Authenticated (login) -> Anonymous (logout,
/// or the backing ActiveSession was destroyed elsewhere).
///
/// Example:
/// @code
///   RequestContext ctx(metadata);
///   auto session = sessions.login(ctx, user);
///   if (session && rememberMe) {
///       (void)sessions.remember(ctx, session.value());
///   }
///   auto current = sessions.resolveCurrentUser(ctx);
/// @endcode
class SessionManager {
public:
    /// Session key holding the current ActiveSession id.
    static constexpr std::string_view kActiveSessionKey = "current_active_session_id";

    /// Session key holding the friendly-forwarding URL.
    static constexpr std::string_view kForwardingUrlKey = "user_return_to";

    /// Length of generated remember tokens (base58 characters).
    static constexpr std::size_t kRememberTokenLength = 24;

    SessionManager(const AuthConfig& config,
                   std::shared_ptr<ISessionRepository> sessionRepo,
                   std::shared_ptr<IUserRepository> userRepo,
                   std::shared_ptr<const CookieVault> vault);

    /// Log @p user in on this request.
    ///
    /// Resets all request-scoped session state first (deleting any
    /// remember-me cookie) and assigns a fresh session id, then creates a new ActiveSession capturing the request's
    /// user agent and IP address and binds its id into the session.
    [[nodiscard]] gk::foundation::ServiceResult<ActiveSessionRecord> login(RequestContext& ctx,
                                                                           const UserRecord& user);

    /// Log out the current device.
    ///
    /// The active session is resolved before the request state (session and
    /// remember-me cookie) is cleared, then its row is destroyed. The state
    /// is cleared either way; fails with NotAuthenticated when no
    /// ActiveSession was backing the request.
    [[nodiscard]] gk::foundation::ServiceResult<void> logout(RequestContext& ctx);

    /// Store @p session's remember token in the encrypted remember-me cookie.
    [[nodiscard]] gk::foundation::ServiceResult<void> remember(RequestContext& ctx,
                                                               const ActiveSessionRecord& session);

    /// Delete the remember-me cookie. No ActiveSession row is touched.
    void forgetActiveSession(RequestContext& ctx);

    /// The authenticated user for this request, or nullopt.
    ///
    /// Looks up the session's ActiveSession id when present, otherwise the
    /// remember-me cookie's token. A row destroyed by another device
    /// resolves to nullopt. Memoized on @p ctx.
    [[nodiscard]] std::optional<UserRecord> resolveCurrentUser(RequestContext& ctx);

    /// The ActiveSession backing this request, or nullopt. Uses the
    /// session's id when present (with no fallback), else the remember-me
    /// cookie. Not memoized.
    [[nodiscard]] std::optional<ActiveSessionRecord> currentActiveSession(
        const RequestContext& ctx) const;

    /// The current user, or NotAuthenticated. On GET requests the URL is
    /// kept so a later login can return to it.
    [[nodiscard]] gk::foundation::ServiceResult<UserRecord> requireAuthenticated(
        RequestContext& ctx);

    /// Succeeds only for anonymous requests; AlreadyAuthenticated otherwise.
    [[nodiscard]] gk::foundation::ServiceResult<void> requireAnonymous(RequestContext& ctx);

    /// Take the friendly-forwarding URL out of the session, if any.
    [[nodiscard]] std::optional<std::string> takeForwardingUrl(RequestContext& ctx);

    /// Devices the user is logged in on, newest first.
    [[nodiscard]] std::vector<ActiveSessionRecord> listSessions(const UserRecord& user) const;

    /// Destroy one of the current user's ActiveSessions.
    ///
    /// Fails with SessionNotFound if @p id is not owned by the current user.
    /// If the destroyed row was backing this request, the request becomes
    /// anonymous immediately: the remember-me cookie is forgotten and the
    /// session is reset.
    [[nodiscard]] gk::foundation::ServiceResult<void> revokeSession(RequestContext& ctx,
                                                                    ActiveSessionId id);

    /// Destroy every ActiveSession of the current user and clear this
    /// request's own state. Returns the number of sessions destroyed.
    [[nodiscard]] gk::foundation::ServiceResult<std::size_t> revokeAllSessions(
        RequestContext& ctx);

    /// Forget cookie, reset session and drop the current-user memo.
    void clearRequestState(RequestContext& ctx);

private:
    [[nodiscard]] bool rotateSessionId(RequestContext& ctx) const;

    std::string rememberCookieName_;
    std::chrono::seconds rememberCookieMaxAge_;
    std::shared_ptr<ISessionRepository> sessionRepo_;
    std::shared_ptr<IUserRepository> userRepo_;
    std::shared_ptr<const CookieVault> vault_;
};

}  // namespace gk::service
