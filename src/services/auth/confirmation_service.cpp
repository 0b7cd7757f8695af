/// @file confirmation_service.cpp
/// @brief ConfirmationService implementation.

#include "gk/service/confirmation_service.hpp"

#include "gk/foundation/service_logger.hpp"
#include "gk/service/input_validator.hpp"
#include "gk/service/mailer.hpp"
#include "gk/service/token_provider.hpp"
#include "gk/service/user_repository.hpp"

namespace gk::service {

using gk::foundation::ErrorCode;
using gk::foundation::LogCategory;
using gk::foundation::LogContext;
using gk::foundation::LogLevel;
using gk::foundation::ServiceError;
using gk::foundation::ServiceResult;

namespace {

ServiceResult<UserRecord> invalidToken() {
    return ServiceResult<UserRecord>::err(
        ServiceError(ErrorCode::InvalidOrExpiredToken, "Invalid or expired token."));
}

}  // anonymous namespace

ConfirmationService::ConfirmationService(const AuthConfig& config,
                                         std::shared_ptr<IUserRepository> userRepo,
                                         std::shared_ptr<const TokenProvider> tokens,
                                         std::shared_ptr<IMailer> mailer,
                                         gk::foundation::Clock clock)
    : mailerFrom_(config.mailerFrom),
      userRepo_(std::move(userRepo)),
      tokens_(std::move(tokens)),
      mailer_(std::move(mailer)),
      clock_(std::move(clock)) {}

ServiceResult<void> ConfirmationService::requestConfirmation(std::string_view email) {
    auto user = userRepo_->findByEmail(InputValidator::normalizeEmail(email));
    if (user && user->unconfirmedOrReconfirming()) {
        sendConfirmation(*user);
    } else {
        GK_LOG_DEBUG(LogCategory::Account, "confirmation request ignored");
    }
    return ServiceResult<void>::ok();
}

void ConfirmationService::sendConfirmation(const UserRecord& user) {
    MailRequest mail;
    mail.user = user;
    mail.recipient = user.confirmableEmail();
    mail.token = tokens_->issue(user.id, TokenPurpose::ConfirmEmail);
    mail.purpose = TokenPurpose::ConfirmEmail;
    mail.from = mailerFrom_;
    dispatchMail(*mailer_, mail);
}

ServiceResult<UserRecord> ConfirmationService::confirm(std::string_view token) {
    auto subject = tokens_->verify(token, TokenPurpose::ConfirmEmail);
    if (!subject) {
        GK_LOG_DEBUG(LogCategory::Account,
                     "confirmation token rejected: " + std::string(subject.error().message()));
        return invalidToken();
    }

    auto now = clock_();
    // State check, email move, uniqueness re-check and confirmedAt are one write.
    auto stored = userRepo_->update(subject.value(), [now](UserRecord& user) {
        if (!user.unconfirmedOrReconfirming()) {
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::InvalidOrExpiredToken, "already confirmed"));
        }
        if (user.reconfirming()) {
            user.email = *user.unconfirmedEmail;
        }
        user.unconfirmedEmail.reset();
        user.confirmedAt = now;
        return ServiceResult<void>::ok();
    });
    if (!stored) {
        switch (stored.error().code()) {
            case ErrorCode::UniqueConstraintViolation: {
                LogContext log;
                log.userId = subject.value();
                GK_LOG_CTX(LogLevel::Info, LogCategory::Account,
                           "reconfirmation lost: email taken", log);
                return ServiceResult<UserRecord>::err(
                    ServiceError(ErrorCode::EmailNoLongerAvailable,
                                 "That email address is no longer available."));
            }
            case ErrorCode::RecordNotFound:
            case ErrorCode::InvalidOrExpiredToken:
                return invalidToken();
            default:
                return ServiceResult<UserRecord>::err(stored.error());
        }
    }

    LogContext log;
    log.userId = stored.value().id;
    GK_LOG_CTX(LogLevel::Info, LogCategory::Account, "email confirmed", log);
    return stored;
}

}  // namespace gk::service
