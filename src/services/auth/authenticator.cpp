/// @file authenticator.cpp
/// @brief Authenticator implementation.

#include "gk/service/authenticator.hpp"

#include "gk/foundation/service_logger.hpp"
#include "gk/service/input_validator.hpp"
#include "gk/service/password_hasher.hpp"
#include "gk/service/user_repository.hpp"

namespace gk::service {

using gk::foundation::LogCategory;

Authenticator::Authenticator(std::shared_ptr<IUserRepository> userRepo,
                             std::shared_ptr<const PasswordHasher> hasher)
    : userRepo_(std::move(userRepo)),
      hasher_(std::move(hasher)),
      placeholderHash_(hasher_->placeholderHash()) {}

std::optional<UserRecord> Authenticator::authenticate(std::string_view email,
                                                      std::string_view password) const {
    auto user = userRepo_->findByEmail(InputValidator::normalizeEmail(email));
    if (!user) {
        // Same cost as a real comparison; the result is discarded.
        (void)hasher_->verify(password, placeholderHash_);
        GK_LOG_DEBUG(LogCategory::Auth, "authentication failed");
        return std::nullopt;
    }
    if (!hasher_->verify(password, user->passwordHash)) {
        GK_LOG_DEBUG(LogCategory::Auth, "authentication failed");
        return std::nullopt;
    }
    return user;
}

bool Authenticator::verifyPassword(const UserRecord& user, std::string_view password) const {
    return hasher_->verify(password, user.passwordHash);
}

}  // namespace gk::service
