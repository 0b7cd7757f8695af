#pragma once

/// @file authenticator.hpp
/// @brief Timing-safe email + password verification.

#include "gk/service/auth_types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace gk::service {

class IUserRepository;
class PasswordHasher;

/// Verifies credentials without revealing, through the result or through
/// response time, whether the email belongs to an account.
///
/// When no user matches, the submitted password is still run through a
/// full-cost hash verification against a placeholder digest, so the found
/// and not-found paths do the same work.
class Authenticator {
public:
    Authenticator(std::shared_ptr<IUserRepository> userRepo,
                  std::shared_ptr<const PasswordHasher> hasher);

    /// The user owning @p email if @p password matches, else nullopt.
    [[nodiscard]] std::optional<UserRecord> authenticate(std::string_view email,
                                                         std::string_view password) const;

    /// Check @p password against an already-loaded user.
    [[nodiscard]] bool verifyPassword(const UserRecord& user, std::string_view password) const;

private:
    std::shared_ptr<IUserRepository> userRepo_;
    std::shared_ptr<const PasswordHasher> hasher_;
    std::string placeholderHash_;
};

}  // namespace gk::service
