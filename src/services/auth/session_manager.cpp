/// @file session_manager.cpp
/// @brief SessionManager implementation.

#include "gk/service/session_manager.hpp"

#include "gk/foundation/service_logger.hpp"
#include "gk/service/cookie_vault.hpp"
#include "gk/service/request_context.hpp"
#include "gk/service/session_repository.hpp"
#include "gk/service/user_repository.hpp"

#include "crypto_utils.hpp"

#include <charconv>

namespace gk::service {

using gk::foundation::ErrorCode;
using gk::foundation::LogCategory;
using gk::foundation::LogContext;
using gk::foundation::LogLevel;
using gk::foundation::ServiceError;
using gk::foundation::ServiceResult;

namespace {

constexpr std::size_t kSessionIdBytes = 16;

std::optional<ActiveSessionId> parseSessionId(std::string_view text) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
        return std::nullopt;
    }
    return ActiveSessionId(value);
}

LogContext sessionLogContext(const RequestContext& ctx, const ActiveSessionRecord& session) {
    LogContext log;
    log.userId = session.userId;
    log.activeSessionId = session.id;
    log.extra["ip"] = ctx.metadata().ipAddress;
    return log;
}

}  // anonymous namespace

SessionManager::SessionManager(const AuthConfig& config,
                               std::shared_ptr<ISessionRepository> sessionRepo,
                               std::shared_ptr<IUserRepository> userRepo,
                               std::shared_ptr<const CookieVault> vault)
    : rememberCookieName_(config.rememberCookieName),
      rememberCookieMaxAge_(
          std::chrono::duration_cast<std::chrono::seconds>(config.rememberCookieExpiry)),
      sessionRepo_(std::move(sessionRepo)),
      userRepo_(std::move(userRepo)),
      vault_(std::move(vault)) {}

// -- Login / logout -----------------------------------------------------------

ServiceResult<ActiveSessionRecord> SessionManager::login(RequestContext& ctx,
                                                         const UserRecord& user) {
    // Nothing the client held before survives a privilege change, including
    // a remember-me cookie that may point at another user's session.
    ctx.session().reset();
    forgetActiveSession(ctx);
    ctx.invalidateCurrentUser();
    if (!rotateSessionId(ctx)) {
        return ServiceResult<ActiveSessionRecord>::err(
            ServiceError(ErrorCode::CryptoError, "failed to generate session id"));
    }

    auto rememberToken = detail::secureRandomBase58(kRememberTokenLength);
    if (!rememberToken) {
        return ServiceResult<ActiveSessionRecord>::err(
            ServiceError(ErrorCode::CryptoError, "failed to generate remember token"));
    }

    ActiveSessionRecord record;
    record.userId = user.id;
    record.rememberToken = std::move(*rememberToken);
    record.userAgent = ctx.metadata().userAgent;
    record.ipAddress = ctx.metadata().ipAddress;
    auto stored = sessionRepo_->create(std::move(record));

    ctx.session().set(std::string(kActiveSessionKey), std::to_string(stored.id.value()));
    ctx.cacheCurrentUser(user);

    GK_LOG_CTX(LogLevel::Info, LogCategory::Session, "login", sessionLogContext(ctx, stored));
    return ServiceResult<ActiveSessionRecord>::ok(std::move(stored));
}

ServiceResult<void> SessionManager::logout(RequestContext& ctx) {
    auto session = currentActiveSession(ctx);
    clearRequestState(ctx);
    if (!session) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::NotAuthenticated, "no active session to log out"));
    }
    (void)sessionRepo_->remove(session->id);
    GK_LOG_CTX(LogLevel::Info, LogCategory::Session, "logout", sessionLogContext(ctx, *session));
    return ServiceResult<void>::ok();
}

// -- Remember-me cookie -------------------------------------------------------

ServiceResult<void> SessionManager::remember(RequestContext& ctx,
                                             const ActiveSessionRecord& session) {
    auto sealed = vault_->encrypt(rememberCookieName_, session.rememberToken);
    if (!sealed) {
        return ServiceResult<void>::err(sealed.error());
    }
    CookieOptions options;
    options.maxAge = rememberCookieMaxAge_;
    ctx.cookies().set(rememberCookieName_, std::move(sealed).value(), options);
    return ServiceResult<void>::ok();
}

void SessionManager::forgetActiveSession(RequestContext& ctx) {
    ctx.cookies().erase(rememberCookieName_);
}

// -- Resolution ---------------------------------------------------------------

std::optional<UserRecord> SessionManager::resolveCurrentUser(RequestContext& ctx) {
    if (ctx.currentUserResolved()) {
        return ctx.cachedCurrentUser();
    }

    std::optional<UserRecord> user;
    if (auto session = currentActiveSession(ctx)) {
        user = userRepo_->findById(session->userId);
    }
    ctx.cacheCurrentUser(user);
    return user;
}

std::optional<ActiveSessionRecord> SessionManager::currentActiveSession(
    const RequestContext& ctx) const {
    if (auto idText = ctx.session().get(kActiveSessionKey)) {
        auto id = parseSessionId(*idText);
        if (!id) {
            return std::nullopt;
        }
        return sessionRepo_->findById(*id);
    }

    auto cookie = ctx.cookies().get(rememberCookieName_);
    if (!cookie) {
        return std::nullopt;
    }
    auto token = vault_->decrypt(rememberCookieName_, *cookie);
    if (!token) {
        return std::nullopt;
    }
    return sessionRepo_->findByRememberToken(*token);
}

ServiceResult<UserRecord> SessionManager::requireAuthenticated(RequestContext& ctx) {
    if (auto user = resolveCurrentUser(ctx)) {
        return ServiceResult<UserRecord>::ok(std::move(*user));
    }
    const auto& metadata = ctx.metadata();
    if (metadata.method == "GET" && !metadata.url.empty()) {
        ctx.session().set(std::string(kForwardingUrlKey), metadata.url);
    }
    return ServiceResult<UserRecord>::err(
        ServiceError(ErrorCode::NotAuthenticated, "You need to login to access that page."));
}

ServiceResult<void> SessionManager::requireAnonymous(RequestContext& ctx) {
    if (resolveCurrentUser(ctx)) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::AlreadyAuthenticated, "You are already logged in."));
    }
    return ServiceResult<void>::ok();
}

std::optional<std::string> SessionManager::takeForwardingUrl(RequestContext& ctx) {
    auto url = ctx.session().get(kForwardingUrlKey);
    if (url) {
        ctx.session().erase(kForwardingUrlKey);
    }
    return url;
}

// -- Devices ------------------------------------------------------------------

std::vector<ActiveSessionRecord> SessionManager::listSessions(const UserRecord& user) const {
    return sessionRepo_->listForUser(user.id);
}

ServiceResult<void> SessionManager::revokeSession(RequestContext& ctx, ActiveSessionId id) {
    auto user = resolveCurrentUser(ctx);
    if (!user) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::NotAuthenticated, "You need to login to access that page."));
    }

    auto target = sessionRepo_->findById(id);
    if (!target || target->userId != user->id) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::SessionNotFound, "session not found"));
    }

    // A concurrent revocation may already have removed it.
    (void)sessionRepo_->remove(id);
    GK_LOG_CTX(LogLevel::Info, LogCategory::Session, "session revoked",
               sessionLogContext(ctx, *target));

    ctx.invalidateCurrentUser();
    if (!resolveCurrentUser(ctx)) {
        clearRequestState(ctx);
    }
    return ServiceResult<void>::ok();
}

ServiceResult<std::size_t> SessionManager::revokeAllSessions(RequestContext& ctx) {
    auto user = resolveCurrentUser(ctx);
    if (!user) {
        return ServiceResult<std::size_t>::err(
            ServiceError(ErrorCode::NotAuthenticated, "You need to login to access that page."));
    }

    auto removed = sessionRepo_->removeAllForUser(user->id);
    clearRequestState(ctx);

    LogContext log;
    log.userId = user->id;
    log.extra["count"] = std::to_string(removed);
    GK_LOG_CTX(LogLevel::Info, LogCategory::Session, "all sessions revoked", log);
    return ServiceResult<std::size_t>::ok(removed);
}

void SessionManager::clearRequestState(RequestContext& ctx) {
    forgetActiveSession(ctx);
    ctx.session().reset();
    ctx.cacheCurrentUser(std::nullopt);
}

bool SessionManager::rotateSessionId(RequestContext& ctx) const {
    auto id = detail::secureRandomHex(kSessionIdBytes);
    if (!id) {
        return false;
    }
    ctx.session().assignId(std::move(*id));
    return true;
}

}  // namespace gk::service
