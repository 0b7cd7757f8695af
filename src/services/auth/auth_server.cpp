/// @file auth_server.cpp
/// @brief AuthServer implementation orchestrating the full auth workflow.

#include "gk/service/auth_server.hpp"

#include "gk/foundation/service_logger.hpp"
#include "gk/service/account_service.hpp"
#include "gk/service/authenticator.hpp"
#include "gk/service/confirmation_service.hpp"
#include "gk/service/cookie_vault.hpp"
#include "gk/service/mailer.hpp"
#include "gk/service/password_hasher.hpp"
#include "gk/service/password_reset_service.hpp"
#include "gk/service/request_context.hpp"
#include "gk/service/session_manager.hpp"
#include "gk/service/session_repository.hpp"
#include "gk/service/token_provider.hpp"
#include "gk/service/user_repository.hpp"

#include <string>

namespace gk::service {

using gk::foundation::ErrorCode;
using gk::foundation::LogCategory;
using gk::foundation::LogContext;
using gk::foundation::LogLevel;
using gk::foundation::ServiceError;
using gk::foundation::ServiceResult;

// -- Construction / destruction -----------------------------------------------

AuthServer::AuthServer(AuthConfig config,
                       std::shared_ptr<IUserRepository> userRepo,
                       std::shared_ptr<ISessionRepository> sessionRepo,
                       std::shared_ptr<IMailer> mailer,
                       gk::foundation::Clock clock)
    : config_(std::move(config)),
      userRepo_(std::move(userRepo)),
      sessionRepo_(std::move(sessionRepo)),
      mailer_(std::move(mailer)),
      hasher_(std::make_shared<PasswordHasher>(config_.passwordHashIterations)),
      tokens_(std::make_shared<TokenProvider>(config_, clock)),
      vault_(std::make_shared<CookieVault>(config_.secretKeyBase)),
      authenticator_(std::make_shared<Authenticator>(userRepo_, hasher_)),
      sessions_(std::make_unique<SessionManager>(config_, sessionRepo_, userRepo_, vault_)),
      confirmations_(std::make_shared<ConfirmationService>(config_, userRepo_, tokens_,
                                                           mailer_, clock)),
      passwordResets_(std::make_unique<PasswordResetService>(config_, userRepo_, tokens_,
                                                             hasher_, mailer_)),
      accounts_(std::make_unique<AccountService>(config_, userRepo_, sessionRepo_, hasher_,
                                                 authenticator_, confirmations_)) {}

AuthServer::~AuthServer() = default;
AuthServer::AuthServer(AuthServer&&) noexcept = default;
AuthServer& AuthServer::operator=(AuthServer&&) noexcept = default;

// -- Request plumbing ---------------------------------------------------------

void AuthServer::restoreSession(RequestContext& ctx) const {
    auto cookie = ctx.cookies().get(kSessionCookieName);
    if (!cookie) {
        return;
    }
    auto text = vault_->verify(kSessionCookieName, *cookie);
    if (!text) {
        GK_LOG_DEBUG(LogCategory::Session, "ignoring tampered session cookie");
        return;
    }
    auto data = SessionData::parse(*text);
    if (!data) {
        GK_LOG_DEBUG(LogCategory::Session, "ignoring malformed session cookie");
        return;
    }
    ctx.session() = std::move(*data);
}

ServiceResult<void> AuthServer::commitSession(RequestContext& ctx) const {
    auto sealed = vault_->sign(kSessionCookieName, ctx.session().serialize());
    if (!sealed) {
        return ServiceResult<void>::err(sealed.error());
    }
    ctx.cookies().set(std::string(kSessionCookieName), std::move(sealed).value());
    return ServiceResult<void>::ok();
}

// -- Visitors -----------------------------------------------------------------

ServiceResult<UserRecord> AuthServer::signUp(RequestContext& ctx, const SignUpParams& params) {
    if (auto anonymous = sessions_->requireAnonymous(ctx); !anonymous) {
        return ServiceResult<UserRecord>::err(anonymous.error());
    }
    return accounts_->signUp(params);
}

ServiceResult<LoginOutcome> AuthServer::login(RequestContext& ctx,
                                              std::string_view email,
                                              std::string_view password,
                                              bool rememberMe) {
    if (auto anonymous = sessions_->requireAnonymous(ctx); !anonymous) {
        return ServiceResult<LoginOutcome>::err(anonymous.error());
    }

    auto user = authenticator_->authenticate(email, password);
    if (!user) {
        LogContext log;
        log.extra["ip"] = ctx.metadata().ipAddress;
        GK_LOG_CTX(LogLevel::Info, LogCategory::Auth, "login failed", log);
        return ServiceResult<LoginOutcome>::err(
            ServiceError(ErrorCode::IncorrectCredentials, "Incorrect email or password."));
    }
    if (user->unconfirmed()) {
        return ServiceResult<LoginOutcome>::err(
            ServiceError(ErrorCode::AccountUnconfirmed, "Please confirm your email first."));
    }

    // Read before login() resets the session.
    auto returnTo = sessions_->takeForwardingUrl(ctx);

    auto session = sessions_->login(ctx, *user);
    if (!session) {
        return ServiceResult<LoginOutcome>::err(session.error());
    }

    // login() already dropped any stale remember-me cookie.
    if (rememberMe) {
        if (auto remembered = sessions_->remember(ctx, session.value()); !remembered) {
            GK_LOG_ERROR(LogCategory::Session, "failed to set remember-me cookie: " +
                                                   std::string(remembered.error().message()));
        }
    }

    LoginOutcome outcome;
    outcome.session = std::move(session).value();
    outcome.redirectTo = returnTo.value_or(config_.rootPath);
    return ServiceResult<LoginOutcome>::ok(std::move(outcome));
}

ServiceResult<void> AuthServer::requestConfirmation(RequestContext& ctx, std::string_view email) {
    if (auto anonymous = sessions_->requireAnonymous(ctx); !anonymous) {
        return anonymous;
    }
    return confirmations_->requestConfirmation(email);
}

ServiceResult<UserRecord> AuthServer::confirm(RequestContext& ctx, std::string_view token) {
    auto current = sessions_->resolveCurrentUser(ctx);

    auto confirmed = confirmations_->confirm(token);
    if (!confirmed) {
        return confirmed;
    }

    if (current && current->id == confirmed.value().id) {
        ctx.cacheCurrentUser(confirmed.value());
        return confirmed;
    }

    auto session = sessions_->login(ctx, confirmed.value());
    if (!session) {
        return ServiceResult<UserRecord>::err(session.error());
    }
    return confirmed;
}

ServiceResult<void> AuthServer::requestPasswordReset(RequestContext& ctx,
                                                     std::string_view email) {
    if (auto anonymous = sessions_->requireAnonymous(ctx); !anonymous) {
        return anonymous;
    }
    return passwordResets_->requestReset(email);
}

ServiceResult<UserRecord> AuthServer::verifyPasswordResetToken(RequestContext& ctx,
                                                               std::string_view token) {
    if (auto anonymous = sessions_->requireAnonymous(ctx); !anonymous) {
        return ServiceResult<UserRecord>::err(anonymous.error());
    }
    return passwordResets_->verifyResetToken(token);
}

ServiceResult<void> AuthServer::resetPassword(RequestContext& ctx,
                                              std::string_view token,
                                              std::string_view newPassword,
                                              std::string_view newPasswordConfirmation) {
    if (auto anonymous = sessions_->requireAnonymous(ctx); !anonymous) {
        return anonymous;
    }
    auto result = passwordResets_->consumeReset(token, newPassword, newPasswordConfirmation);
    if (!result) {
        return ServiceResult<void>::err(result.error());
    }
    return ServiceResult<void>::ok();
}

// -- Authenticated users ------------------------------------------------------

std::optional<UserRecord> AuthServer::currentUser(RequestContext& ctx) {
    return sessions_->resolveCurrentUser(ctx);
}

ServiceResult<UserRecord> AuthServer::requireAuthenticated(RequestContext& ctx) {
    return sessions_->requireAuthenticated(ctx);
}

ServiceResult<void> AuthServer::logout(RequestContext& ctx) {
    if (auto user = sessions_->requireAuthenticated(ctx); !user) {
        return ServiceResult<void>::err(user.error());
    }
    return sessions_->logout(ctx);
}

ServiceResult<UserRecord> AuthServer::updateAccount(RequestContext& ctx,
                                                    const AccountUpdate& update) {
    auto user = sessions_->requireAuthenticated(ctx);
    if (!user) {
        return user;
    }
    auto updated = accounts_->updateAccount(user.value(), update);
    if (updated) {
        ctx.cacheCurrentUser(updated.value());
    }
    return updated;
}

ServiceResult<void> AuthServer::deleteAccount(RequestContext& ctx) {
    auto user = sessions_->requireAuthenticated(ctx);
    if (!user) {
        return ServiceResult<void>::err(user.error());
    }
    auto deleted = accounts_->deleteAccount(user.value());
    sessions_->clearRequestState(ctx);
    return deleted;
}

ServiceResult<std::vector<ActiveSessionRecord>> AuthServer::listSessions(RequestContext& ctx) {
    auto user = sessions_->requireAuthenticated(ctx);
    if (!user) {
        return ServiceResult<std::vector<ActiveSessionRecord>>::err(user.error());
    }
    return ServiceResult<std::vector<ActiveSessionRecord>>::ok(
        sessions_->listSessions(user.value()));
}

ServiceResult<void> AuthServer::revokeSession(RequestContext& ctx, ActiveSessionId id) {
    return sessions_->revokeSession(ctx, id);
}

ServiceResult<std::size_t> AuthServer::revokeAllSessions(RequestContext& ctx) {
    return sessions_->revokeAllSessions(ctx);
}

}  // namespace gk::service
