#pragma once

/// @file account_service.hpp
/// @brief Sign-up, account edits and account deletion.
///
/// Normalization and validation of user input happen here, at the write
/// boundary of a UserRecord, before anything reaches the repository.

#include "gk/foundation/service_result.hpp"
#include "gk/service/auth_types.hpp"

#include <memory>

namespace gk::service {

class Authenticator;
class ConfirmationService;
class ISessionRepository;
class IUserRepository;
class PasswordHasher;

/// Account lifecycle operations.
class AccountService {
public:
    AccountService(const AuthConfig& config,
                   std::shared_ptr<IUserRepository> userRepo,
                   std::shared_ptr<ISessionRepository> sessionRepo,
                   std::shared_ptr<const PasswordHasher> hasher,
                   std::shared_ptr<const Authenticator> authenticator,
                   std::shared_ptr<ConfirmationService> confirmations);

    /// Create an unconfirmed account and mail it a confirmation token.
    ///
    /// Fails with ValidationFailed (field details attached) for a blank,
    /// malformed or taken email, or a rejected password; nothing is
    /// created in that case.
    [[nodiscard]] gk::foundation::ServiceResult<UserRecord> signUp(const SignUpParams& params);

    /// Apply an account edit for @p user.
    ///
    /// Requires the current password (IncorrectCredentials otherwise). A new
    /// email becomes the pending unconfirmed email and a confirmation is
    /// mailed to it; submitting the current email again cancels any pending
    /// change. A new password is validated like at sign-up.
    [[nodiscard]] gk::foundation::ServiceResult<UserRecord> updateAccount(
        const UserRecord& user, const AccountUpdate& update);

    /// Destroy every ActiveSession of @p user, then the user.
    [[nodiscard]] gk::foundation::ServiceResult<void> deleteAccount(const UserRecord& user);

private:
    uint32_t minPasswordLength_;
    bool requirePasswordComplexity_;
    std::shared_ptr<IUserRepository> userRepo_;
    std::shared_ptr<ISessionRepository> sessionRepo_;
    std::shared_ptr<const PasswordHasher> hasher_;
    std::shared_ptr<const Authenticator> authenticator_;
    std::shared_ptr<ConfirmationService> confirmations_;
};

}  // namespace gk::service
