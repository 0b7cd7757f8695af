#pragma once

/// @file cookie_vault.hpp
/// @brief Signed and encrypted cookie values.
///
/// Signed cookies are readable by the client but tamper-evident
/// (HMAC-SHA256). Encrypted cookies are also confidential (AES-256-GCM).
/// The cookie name is bound into both, so a value lifted from one cookie
/// is rejected under another name.

#include "gk/foundation/service_result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gk::service {

/// Seals and opens cookie values with keys derived from the application
/// secret (PBKDF2-HMAC-SHA256, one fixed salt per cookie kind).
///
/// Example:
/// @code
///   CookieVault vault(config.secretKeyBase);
///   auto sealed = vault.encrypt("remember_token", session.rememberToken);
///   auto opened = vault.decrypt("remember_token", sealed.value());
/// @endcode
class CookieVault {
public:
    explicit CookieVault(std::string_view secretKeyBase);

    /// Encrypt @p value for the cookie @p name.
    /// Format: base64url(iv).base64url(ciphertext).base64url(tag)
    [[nodiscard]] gk::foundation::ServiceResult<std::string> encrypt(
        std::string_view name, std::string_view value) const;

    /// Decrypt a value produced by encrypt() for the same cookie name.
    /// Returns nullopt for anything tampered, truncated or foreign.
    [[nodiscard]] std::optional<std::string> decrypt(std::string_view name,
                                                     std::string_view cookie) const;

    /// Sign @p value for the cookie @p name.
    /// Format: base64url(value).base64url(mac)
    [[nodiscard]] gk::foundation::ServiceResult<std::string> sign(
        std::string_view name, std::string_view value) const;

    /// Verify a value produced by sign() and return the original text.
    [[nodiscard]] std::optional<std::string> verify(std::string_view name,
                                                    std::string_view cookie) const;

private:
    std::vector<uint8_t> encryptionKey_;
    std::vector<uint8_t> signingKey_;
};

}  // namespace gk::service
