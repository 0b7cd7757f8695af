/// @file account_service.cpp
/// @brief AccountService implementation.

#include "gk/service/account_service.hpp"

#include "gk/foundation/service_logger.hpp"
#include "gk/service/authenticator.hpp"
#include "gk/service/confirmation_service.hpp"
#include "gk/service/input_validator.hpp"
#include "gk/service/password_hasher.hpp"
#include "gk/service/session_repository.hpp"
#include "gk/service/user_repository.hpp"

#include <optional>
#include <string>

namespace gk::service {

using gk::foundation::ErrorCode;
using gk::foundation::LogCategory;
using gk::foundation::LogContext;
using gk::foundation::LogLevel;
using gk::foundation::ServiceError;
using gk::foundation::ServiceResult;
using gk::foundation::ValidationErrors;

namespace {

constexpr std::string_view kTakenMessage = "has already been taken";

void checkNewPassword(ValidationErrors& errors, std::string_view password,
                      std::string_view confirmation, uint32_t minLength, bool complexity) {
    auto passwordCheck = InputValidator::validatePassword(password, minLength, complexity);
    if (!passwordCheck) {
        errors.add("password", passwordCheck.message);
    }
    auto confirmationCheck = InputValidator::validateConfirmation(password, confirmation);
    if (!confirmationCheck) {
        errors.add("password_confirmation", confirmationCheck.message);
    }
}

}  // anonymous namespace

AccountService::AccountService(const AuthConfig& config,
                               std::shared_ptr<IUserRepository> userRepo,
                               std::shared_ptr<ISessionRepository> sessionRepo,
                               std::shared_ptr<const PasswordHasher> hasher,
                               std::shared_ptr<const Authenticator> authenticator,
                               std::shared_ptr<ConfirmationService> confirmations)
    : minPasswordLength_(config.minPasswordLength),
      requirePasswordComplexity_(config.requirePasswordComplexity),
      userRepo_(std::move(userRepo)),
      sessionRepo_(std::move(sessionRepo)),
      hasher_(std::move(hasher)),
      authenticator_(std::move(authenticator)),
      confirmations_(std::move(confirmations)) {}

// -- Sign up ------------------------------------------------------------------

ServiceResult<UserRecord> AccountService::signUp(const SignUpParams& params) {
    auto email = InputValidator::normalizeEmail(params.email);

    ValidationErrors errors;
    auto emailCheck = InputValidator::validateEmail(email);
    if (!emailCheck) {
        errors.add("email", emailCheck.message);
    } else if (userRepo_->findByEmail(email)) {
        errors.add("email", std::string(kTakenMessage));
    }
    checkNewPassword(errors, params.password, params.passwordConfirmation, minPasswordLength_,
                     requirePasswordComplexity_);
    if (!errors.empty()) {
        return ServiceResult<UserRecord>::err(ServiceError::validation(std::move(errors)));
    }

    auto hashed = hasher_->hash(params.password);
    if (!hashed) {
        return ServiceResult<UserRecord>::err(hashed.error());
    }

    UserRecord record;
    record.email = std::move(email);
    record.passwordHash = std::move(hashed).value();

    auto created = userRepo_->create(std::move(record));
    if (!created) {
        // Lost a race with a concurrent sign-up for the same email.
        if (created.error().code() == ErrorCode::UniqueConstraintViolation) {
            ValidationErrors taken;
            taken.add("email", std::string(kTakenMessage));
            return ServiceResult<UserRecord>::err(ServiceError::validation(std::move(taken)));
        }
        return created;
    }

    LogContext log;
    log.userId = created.value().id;
    GK_LOG_CTX(LogLevel::Info, LogCategory::Account, "user signed up", log);

    confirmations_->sendConfirmation(created.value());
    return created;
}

// -- Edit ---------------------------------------------------------------------

ServiceResult<UserRecord> AccountService::updateAccount(const UserRecord& user,
                                                        const AccountUpdate& update) {
    auto current = userRepo_->findById(user.id);
    if (!current) {
        return ServiceResult<UserRecord>::err(
            ServiceError(ErrorCode::RecordNotFound, "user not found"));
    }
    if (!authenticator_->verifyPassword(*current, update.currentPassword)) {
        return ServiceResult<UserRecord>::err(
            ServiceError(ErrorCode::IncorrectCredentials, "Incorrect password."));
    }

    std::optional<std::string> newEmail;
    ValidationErrors errors;

    if (update.newEmail) {
        auto email = InputValidator::normalizeEmail(*update.newEmail);
        if (email != current->email) {
            if (auto emailCheck = InputValidator::validateEmail(email); !emailCheck) {
                errors.add("unconfirmed_email", emailCheck.message);
            }
        }
        newEmail = std::move(email);
    }

    if (update.newPassword) {
        checkNewPassword(errors, *update.newPassword,
                         update.newPasswordConfirmation.value_or(std::string{}),
                         minPasswordLength_, requirePasswordComplexity_);
    }
    if (!errors.empty()) {
        return ServiceResult<UserRecord>::err(ServiceError::validation(std::move(errors)));
    }

    std::optional<std::string> newHash;
    if (update.newPassword) {
        auto hashed = hasher_->hash(*update.newPassword);
        if (!hashed) {
            return ServiceResult<UserRecord>::err(hashed.error());
        }
        newHash = std::move(hashed).value();
    }

    // Only the edited fields are written, against the record as stored now.
    bool emailChanged = false;
    auto stored = userRepo_->update(user.id, [&](UserRecord& record) {
        if (newEmail) {
            if (*newEmail == record.email) {
                record.unconfirmedEmail.reset();
            } else {
                emailChanged = record.unconfirmedEmail != newEmail;
                record.unconfirmedEmail = newEmail;
            }
        }
        if (newHash) {
            record.passwordHash = *newHash;
        }
        return ServiceResult<void>::ok();
    });
    if (!stored) {
        return stored;
    }

    LogContext log;
    log.userId = stored.value().id;
    GK_LOG_CTX(LogLevel::Info, LogCategory::Account, "account updated", log);

    if (emailChanged) {
        confirmations_->sendConfirmation(stored.value());
    }
    return stored;
}

// -- Delete -------------------------------------------------------------------

ServiceResult<void> AccountService::deleteAccount(const UserRecord& user) {
    auto removedSessions = sessionRepo_->removeAllForUser(user.id);
    if (!userRepo_->remove(user.id)) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::RecordNotFound, "user not found"));
    }

    LogContext log;
    log.userId = user.id;
    log.extra["sessions"] = std::to_string(removedSessions);
    GK_LOG_CTX(LogLevel::Info, LogCategory::Account, "account deleted", log);
    return ServiceResult<void>::ok();
}

}  // namespace gk::service
