/// @file cookie_vault.cpp
/// @brief CookieVault implementation over AES-256-GCM and HMAC-SHA256.

#include "gk/service/cookie_vault.hpp"

#include "gk/foundation/service_logger.hpp"

#include "crypto_utils.hpp"

namespace gk::service {

using gk::foundation::ErrorCode;
using gk::foundation::LogCategory;
using gk::foundation::ServiceError;
using gk::foundation::ServiceResult;

namespace {

constexpr std::string_view kSeparator = ".";
constexpr std::string_view kEncryptedCookieSalt = "authenticated encrypted cookie";
constexpr std::string_view kSignedCookieSalt = "signed cookie";
constexpr uint32_t kKeyIterations = 1000;
constexpr std::size_t kKeyLength = 32;

std::vector<uint8_t> deriveKey(std::string_view secret, std::string_view salt) {
    auto key = detail::pbkdf2Sha256(secret, salt, kKeyIterations, kKeyLength);
    if (!key) {
        GK_LOG_ERROR(LogCategory::Core, "cookie key derivation failed");
        return {};
    }
    return std::move(*key);
}

std::vector<std::string_view> splitOn(std::string_view s, std::string_view sep) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + sep.size();
    }
}

std::string_view keyView(const std::vector<uint8_t>& key) {
    return {reinterpret_cast<const char*>(key.data()), key.size()};
}

/// MAC input binds the cookie name to the encoded value.
std::string macInput(std::string_view name, std::string_view encodedValue) {
    std::string input(name);
    input += '=';
    input += encodedValue;
    return input;
}

}  // anonymous namespace

CookieVault::CookieVault(std::string_view secretKeyBase)
    : encryptionKey_(deriveKey(secretKeyBase, kEncryptedCookieSalt)),
      signingKey_(deriveKey(secretKeyBase, kSignedCookieSalt)) {}

ServiceResult<std::string> CookieVault::encrypt(std::string_view name,
                                                std::string_view value) const {
    auto sealed = detail::aes256GcmSeal(encryptionKey_, value, name);
    if (!sealed) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::CryptoError, "failed to encrypt cookie"));
    }
    std::string out = detail::base64urlEncode(sealed->iv.data(), sealed->iv.size());
    out += kSeparator;
    out += detail::base64urlEncode(sealed->ciphertext.data(), sealed->ciphertext.size());
    out += kSeparator;
    out += detail::base64urlEncode(sealed->tag.data(), sealed->tag.size());
    return ServiceResult<std::string>::ok(std::move(out));
}

std::optional<std::string> CookieVault::decrypt(std::string_view name,
                                                std::string_view cookie) const {
    auto parts = splitOn(cookie, kSeparator);
    if (parts.size() != 3) {
        return std::nullopt;
    }
    auto iv = detail::base64urlDecode(parts[0]);
    auto ciphertext = detail::base64urlDecode(parts[1]);
    auto tag = detail::base64urlDecode(parts[2]);
    if (!iv || !ciphertext || !tag) {
        return std::nullopt;
    }

    detail::GcmSealed sealed{std::move(*iv), std::move(*ciphertext), std::move(*tag)};
    auto plaintext = detail::aes256GcmOpen(encryptionKey_, sealed, name);
    if (!plaintext) {
        GK_LOG_DEBUG(LogCategory::Session,
                     "rejected encrypted cookie " + std::string(name));
    }
    return plaintext;
}

ServiceResult<std::string> CookieVault::sign(std::string_view name,
                                             std::string_view value) const {
    if (signingKey_.size() != kKeyLength) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::CryptoError, "cookie signing key unavailable"));
    }
    auto encoded = detail::base64urlEncode(value);
    auto mac = detail::hmacSha256(keyView(signingKey_), macInput(name, encoded));
    encoded += kSeparator;
    encoded += detail::base64urlEncode(mac.data(), mac.size());
    return ServiceResult<std::string>::ok(std::move(encoded));
}

std::optional<std::string> CookieVault::verify(std::string_view name,
                                               std::string_view cookie) const {
    if (signingKey_.size() != kKeyLength) {
        return std::nullopt;
    }
    auto parts = splitOn(cookie, kSeparator);
    if (parts.size() != 2) {
        return std::nullopt;
    }
    auto mac = detail::hmacSha256(keyView(signingKey_), macInput(name, parts[0]));
    auto expected = detail::base64urlEncode(mac.data(), mac.size());
    if (!detail::constantTimeEqual(expected, parts[1])) {
        return std::nullopt;
    }
    return detail::base64urlDecodeString(parts[0]);
}

}  // namespace gk::service
