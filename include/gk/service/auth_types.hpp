#pragma once

/// @file auth_types.hpp
/// @brief Core type definitions for the authentication service.
///
/// Defines the user and active-session records, signed-token claims,
/// request metadata and configuration used throughout the service layer.

#include "gk/foundation/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gk::service {

using gk::foundation::ActiveSessionId;
using gk::foundation::TimePoint;
using gk::foundation::UserId;

// -- Token purposes -----------------------------------------------------------

/// Action a signed token is bound to. A token minted for one purpose is
/// rejected when verified for another.
enum class TokenPurpose : uint8_t { ConfirmEmail, ResetPassword };

/// Wire name of a purpose ("confirm_email", "reset_password").
constexpr std::string_view tokenPurposeName(TokenPurpose purpose) {
    switch (purpose) {
        case TokenPurpose::ConfirmEmail: return "confirm_email";
        case TokenPurpose::ResetPassword: return "reset_password";
    }
    return "unknown";
}

/// Parse a wire name back into a purpose.
constexpr std::optional<TokenPurpose> parseTokenPurpose(std::string_view name) {
    if (name == "confirm_email") {
        return TokenPurpose::ConfirmEmail;
    }
    if (name == "reset_password") {
        return TokenPurpose::ResetPassword;
    }
    return std::nullopt;
}

// -- User model ---------------------------------------------------------------

/// Confirmation status of a user, always derived from confirmedAt and
/// unconfirmedEmail (never stored).
enum class ConfirmationState : uint8_t {
    Unconfirmed,   ///< confirmedAt unset
    Confirmed,     ///< confirmedAt set, no pending email
    Reconfirming   ///< confirmedAt set, unconfirmedEmail pending
};

/// Stored user record.
///
/// The password is never stored in plaintext; passwordHash is the opaque
/// encoding produced by PasswordHasher. Both email fields are normalized
/// (trimmed, lowercase) before they reach a repository.
struct UserRecord {
    UserId id;
    std::string email;
    std::optional<std::string> unconfirmedEmail;
    std::string passwordHash;
    std::optional<TimePoint> confirmedAt;
    TimePoint createdAt{};
    TimePoint updatedAt{};

    [[nodiscard]] bool confirmed() const noexcept { return confirmedAt.has_value(); }
    [[nodiscard]] bool unconfirmed() const noexcept { return !confirmed(); }

    [[nodiscard]] bool reconfirming() const noexcept {
        return unconfirmedEmail.has_value() && !unconfirmedEmail->empty();
    }

    /// States in which a confirm_email token may be consumed.
    [[nodiscard]] bool unconfirmedOrReconfirming() const noexcept {
        return unconfirmed() || reconfirming();
    }

    [[nodiscard]] ConfirmationState confirmationState() const noexcept {
        if (unconfirmed()) {
            return ConfirmationState::Unconfirmed;
        }
        return reconfirming() ? ConfirmationState::Reconfirming : ConfirmationState::Confirmed;
    }

    /// Address a confirmation mail is sent to: the pending email if any.
    [[nodiscard]] const std::string& confirmableEmail() const noexcept {
        return reconfirming() ? *unconfirmedEmail : email;
    }
};

// -- Active sessions ----------------------------------------------------------

/// One logged-in device. Created on every successful login and destroyed
/// on logout or revocation; there is no time-based expiry.
struct ActiveSessionRecord {
    ActiveSessionId id;
    UserId userId;
    std::string rememberToken;  ///< Unique secret matched by the remember-me cookie.
    std::string userAgent;
    std::string ipAddress;
    TimePoint createdAt{};
};

// -- Signed tokens ------------------------------------------------------------

/// Decoded payload of a signed, purpose-bound token.
struct SignedTokenClaims {
    UserId subject;
    TokenPurpose purpose = TokenPurpose::ConfirmEmail;
    TimePoint issuedAt{};
    TimePoint expiresAt{};
};

// -- Request data -------------------------------------------------------------

/// Descriptive metadata of the HTTP request being served.
struct RequestMetadata {
    std::string userAgent;
    std::string ipAddress;
    std::string method = "GET";
    std::string url;
};

// -- Configuration ------------------------------------------------------------

/// Configuration for the authentication service.
struct AuthConfig {
    /// Root secret for token signing and cookie keys (min 32 bytes recommended).
    std::string secretKeyBase = "change-me-in-production";

    /// Lifetime of confirm_email tokens.
    std::chrono::seconds confirmationTokenExpiry{600};  // 10 minutes

    /// Lifetime of reset_password tokens.
    std::chrono::seconds passwordResetTokenExpiry{600};  // 10 minutes

    /// Lifetime of the remember-me cookie.
    std::chrono::hours rememberCookieExpiry{24 * 365 * 20};  // 20 years

    /// Name of the remember-me cookie.
    std::string rememberCookieName = "remember_token";

    /// PBKDF2 iteration count for new password hashes.
    uint32_t passwordHashIterations = 210000;

    /// Minimum password length.
    uint32_t minPasswordLength = 6;

    /// Require upper, lower, digit and special characters in passwords.
    bool requirePasswordComplexity = false;

    /// Answer a reset request for an unconfirmed account exactly like one
    /// for an unknown email instead of signalling AccountUnconfirmed.
    bool uniformResetResponse = false;

    /// Sender address handed to the mail collaborator.
    std::string mailerFrom = "no-reply@example.com";

    /// Redirect target after login when no location was remembered.
    std::string rootPath = "/";
};

// -- Operation input ----------------------------------------------------------

/// Sign-up form input.
struct SignUpParams {
    std::string email;
    std::string password;
    std::string passwordConfirmation;
};

/// Account edit form input. Unset optionals leave the field unchanged.
struct AccountUpdate {
    std::string currentPassword;
    std::optional<std::string> newEmail;
    std::optional<std::string> newPassword;
    std::optional<std::string> newPasswordConfirmation;
};

/// Result of a successful login.
struct LoginOutcome {
    ActiveSessionRecord session;
    std::string redirectTo;
};

}  // namespace gk::service
