#pragma once

/// @file token_provider.hpp
/// @brief Signed, purpose-bound, expiring tokens for email confirmation
///        and password reset.
///
/// A token carries the subject user id, its purpose and its issue/expiry
/// times, signed with HMAC-SHA256. Nothing is persisted: a token becomes
/// invalid only by reaching its expiry, and issuing a new token does not
/// revoke an outstanding one.

#include "gk/foundation/service_result.hpp"
#include "gk/foundation/types.hpp"
#include "gk/service/auth_types.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace gk::service {

/// Issues and verifies signed tokens.
///
/// Token format:
///   base64url(payload) . base64url(HMAC-SHA256(key, base64url(payload)))
///
/// Payload: {"sub":"<user id>","pur":"<purpose>","iat":<ms>,"exp":<ms>}
///
/// Verification failures are distinct here (InvalidToken,
/// TokenPurposeMismatch, TokenExpired); the account flows fold them into
/// a single InvalidOrExpiredToken before anything reaches a user.
///
/// Example:
/// @code
///   TokenProvider tokens(config);
///   auto token = tokens.issue(user.id, TokenPurpose::ConfirmEmail);
///   auto subject = tokens.verify(token, TokenPurpose::ConfirmEmail);
/// @endcode
class TokenProvider {
public:
    explicit TokenProvider(const AuthConfig& config,
                           gk::foundation::Clock clock = gk::foundation::systemClock());

    /// Issue a token for @p subject that expires @p ttl from now.
    [[nodiscard]] std::string issue(UserId subject, TokenPurpose purpose,
                                    std::chrono::seconds ttl) const;

    /// Issue a token with the configured lifetime for @p purpose.
    [[nodiscard]] std::string issue(UserId subject, TokenPurpose purpose) const;

    /// Verify a token and return its full claims.
    ///
    /// Checks, in order: structure and signature (InvalidToken), purpose
    /// (TokenPurposeMismatch), expiry (TokenExpired, when now >= exp).
    [[nodiscard]] gk::foundation::ServiceResult<SignedTokenClaims> decode(
        std::string_view token, TokenPurpose expectedPurpose) const;

    /// Verify a token and return only its subject.
    [[nodiscard]] gk::foundation::ServiceResult<UserId> verify(
        std::string_view token, TokenPurpose expectedPurpose) const;

    /// Configured lifetime for tokens of @p purpose.
    [[nodiscard]] std::chrono::seconds ttlFor(TokenPurpose purpose) const noexcept;

private:
    std::array<uint8_t, 32> signingKey_;
    std::chrono::seconds confirmationTtl_;
    std::chrono::seconds resetTtl_;
    gk::foundation::Clock clock_;
};

}  // namespace gk::service
