/// @file password_reset_service.cpp
/// @brief PasswordResetService implementation.

#include "gk/service/password_reset_service.hpp"

#include "gk/foundation/service_logger.hpp"
#include "gk/service/input_validator.hpp"
#include "gk/service/mailer.hpp"
#include "gk/service/password_hasher.hpp"
#include "gk/service/token_provider.hpp"
#include "gk/service/user_repository.hpp"

namespace gk::service {

using gk::foundation::ErrorCode;
using gk::foundation::LogCategory;
using gk::foundation::LogContext;
using gk::foundation::LogLevel;
using gk::foundation::ServiceError;
using gk::foundation::ServiceResult;
using gk::foundation::ValidationErrors;

namespace {

ServiceError unconfirmedError() {
    return ServiceError(ErrorCode::AccountUnconfirmed,
                        "Please confirm your email first.");
}

}  // anonymous namespace

PasswordResetService::PasswordResetService(const AuthConfig& config,
                                           std::shared_ptr<IUserRepository> userRepo,
                                           std::shared_ptr<const TokenProvider> tokens,
                                           std::shared_ptr<const PasswordHasher> hasher,
                                           std::shared_ptr<IMailer> mailer)
    : minPasswordLength_(config.minPasswordLength),
      requirePasswordComplexity_(config.requirePasswordComplexity),
      uniformResetResponse_(config.uniformResetResponse),
      mailerFrom_(config.mailerFrom),
      userRepo_(std::move(userRepo)),
      tokens_(std::move(tokens)),
      hasher_(std::move(hasher)),
      mailer_(std::move(mailer)) {}

ServiceResult<void> PasswordResetService::requestReset(std::string_view email) {
    auto user = userRepo_->findByEmail(InputValidator::normalizeEmail(email));
    if (!user) {
        GK_LOG_DEBUG(LogCategory::Account, "reset requested for unknown email");
        return ServiceResult<void>::ok();
    }

    if (user->unconfirmed()) {
        LogContext log;
        log.userId = user->id;
        GK_LOG_CTX(LogLevel::Info, LogCategory::Account, "reset declined: unconfirmed", log);
        if (uniformResetResponse_) {
            return ServiceResult<void>::ok();
        }
        return ServiceResult<void>::err(unconfirmedError());
    }

    MailRequest mail;
    mail.user = *user;
    mail.recipient = user->email;
    mail.token = tokens_->issue(user->id, TokenPurpose::ResetPassword);
    mail.purpose = TokenPurpose::ResetPassword;
    mail.from = mailerFrom_;
    dispatchMail(*mailer_, mail);
    return ServiceResult<void>::ok();
}

ServiceResult<UserRecord> PasswordResetService::verifyResetToken(std::string_view token) const {
    auto subject = tokens_->verify(token, TokenPurpose::ResetPassword);
    if (!subject) {
        GK_LOG_DEBUG(LogCategory::Account,
                     "reset token rejected: " + std::string(subject.error().message()));
        return ServiceResult<UserRecord>::err(
            ServiceError(ErrorCode::InvalidOrExpiredToken, "Invalid or expired token."));
    }

    auto user = userRepo_->findById(subject.value());
    if (!user) {
        return ServiceResult<UserRecord>::err(
            ServiceError(ErrorCode::InvalidOrExpiredToken, "Invalid or expired token."));
    }
    if (user->unconfirmed()) {
        return ServiceResult<UserRecord>::err(unconfirmedError());
    }
    return ServiceResult<UserRecord>::ok(std::move(*user));
}

ServiceResult<UserRecord> PasswordResetService::consumeReset(
    std::string_view token, std::string_view newPassword,
    std::string_view newPasswordConfirmation) {
    auto user = verifyResetToken(token);
    if (!user) {
        return user;
    }

    ValidationErrors errors;
    auto passwordCheck = InputValidator::validatePassword(newPassword, minPasswordLength_,
                                                          requirePasswordComplexity_);
    if (!passwordCheck) {
        errors.add("password", passwordCheck.message);
    }
    auto confirmationCheck =
        InputValidator::validateConfirmation(newPassword, newPasswordConfirmation);
    if (!confirmationCheck) {
        errors.add("password_confirmation", confirmationCheck.message);
    }
    if (!errors.empty()) {
        return ServiceResult<UserRecord>::err(ServiceError::validation(std::move(errors)));
    }

    auto hashed = hasher_->hash(newPassword);
    if (!hashed) {
        return ServiceResult<UserRecord>::err(hashed.error());
    }

    auto stored = userRepo_->update(
        user.value().id, [hash = std::move(hashed).value()](UserRecord& record) {
            if (record.unconfirmed()) {
                return ServiceResult<void>::err(unconfirmedError());
            }
            record.passwordHash = hash;
            return ServiceResult<void>::ok();
        });
    if (!stored) {
        if (stored.error().code() == ErrorCode::RecordNotFound) {
            return ServiceResult<UserRecord>::err(
                ServiceError(ErrorCode::InvalidOrExpiredToken, "Invalid or expired token."));
        }
        return stored;
    }

    LogContext log;
    log.userId = stored.value().id;
    GK_LOG_CTX(LogLevel::Info, LogCategory::Account, "password reset", log);
    return stored;
}

}  // namespace gk::service
