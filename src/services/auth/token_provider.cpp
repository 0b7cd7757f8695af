/// @file token_provider.cpp
/// @brief TokenProvider implementation with HMAC-SHA256 signing.
///
/// Token format:
///   base64url(payload) . base64url(mac)
///
/// Payload: {"sub":"42","pur":"confirm_email","iat":N,"exp":N}
/// with iat/exp in milliseconds since the Unix epoch.

#include "gk/service/token_provider.hpp"

#include "gk/foundation/service_logger.hpp"

#include "crypto_utils.hpp"

#include <charconv>
#include <optional>
#include <sstream>
#include <string>

namespace gk::service {

using gk::foundation::ErrorCode;
using gk::foundation::LogCategory;
using gk::foundation::ServiceError;
using gk::foundation::ServiceResult;

// ---------------------------------------------------------------------------
// Minimal JSON helpers (flat objects only)
// ---------------------------------------------------------------------------
namespace {

constexpr std::string_view kKeyDerivationLabel = "gatekeeper signed token v1";

int64_t toEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromEpochMillis(int64_t epoch) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds(epoch)));
}

/// Extract a JSON string value by key. Values never contain quotes or
/// escapes (ids are decimal, purposes are fixed identifiers).
std::optional<std::string> extractJsonString(std::string_view json, std::string_view key) {
    std::string needle = "\"" + std::string(key) + "\":\"";
    auto pos = json.find(needle);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    pos += needle.size();
    auto end = json.find('"', pos);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(json.substr(pos, end - pos));
}

/// Extract a JSON integer value by key.
std::optional<int64_t> extractJsonInt(std::string_view json, std::string_view key) {
    std::string needle = "\"" + std::string(key) + "\":";
    auto pos = json.find(needle);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    pos += needle.size();
    int64_t result = 0;
    auto [ptr, ec] = std::from_chars(json.data() + pos, json.data() + json.size(), result);
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    return result;
}

std::optional<uint64_t> parseUnsigned(std::string_view text) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

ServiceResult<SignedTokenClaims> malformed(std::string message) {
    return ServiceResult<SignedTokenClaims>::err(
        ServiceError(ErrorCode::InvalidToken, std::move(message)));
}

}  // anonymous namespace

// ---------------------------------------------------------------------------
// TokenProvider
// ---------------------------------------------------------------------------

TokenProvider::TokenProvider(const AuthConfig& config, gk::foundation::Clock clock)
    : signingKey_(detail::hmacSha256(config.secretKeyBase, kKeyDerivationLabel)),
      confirmationTtl_(config.confirmationTokenExpiry),
      resetTtl_(config.passwordResetTokenExpiry),
      clock_(std::move(clock)) {}

std::string TokenProvider::issue(UserId subject, TokenPurpose purpose,
                                 std::chrono::seconds ttl) const {
    auto now = clock_();

    std::ostringstream payload;
    payload << "{\"sub\":\"" << subject.value() << "\",\"pur\":\"" << tokenPurposeName(purpose)
            << "\",\"iat\":" << toEpochMillis(now) << ",\"exp\":" << toEpochMillis(now + ttl)
            << "}";

    auto encodedPayload = detail::base64urlEncode(payload.str());
    std::string_view key(reinterpret_cast<const char*>(signingKey_.data()), signingKey_.size());
    auto mac = detail::hmacSha256(key, encodedPayload);

    GK_LOG_DEBUG(LogCategory::Token, "issued " + std::string(tokenPurposeName(purpose)) +
                                         " token for user " + std::to_string(subject.value()));

    return encodedPayload + "." + detail::base64urlEncode(mac.data(), mac.size());
}

std::string TokenProvider::issue(UserId subject, TokenPurpose purpose) const {
    return issue(subject, purpose, ttlFor(purpose));
}

ServiceResult<SignedTokenClaims> TokenProvider::decode(std::string_view token,
                                                       TokenPurpose expectedPurpose) const {
    auto dot = token.find('.');
    if (dot == std::string_view::npos || token.find('.', dot + 1) != std::string_view::npos) {
        return malformed("malformed token: expected 2 parts");
    }
    auto encodedPayload = token.substr(0, dot);
    auto encodedMac = token.substr(dot + 1);

    // Compare in encoded form so that any altered character fails.
    std::string_view key(reinterpret_cast<const char*>(signingKey_.data()), signingKey_.size());
    auto expectedMac = detail::hmacSha256(key, encodedPayload);
    auto expected = detail::base64urlEncode(expectedMac.data(), expectedMac.size());
    if (!detail::constantTimeEqual(expected, encodedMac)) {
        GK_LOG_WARN(LogCategory::Token, "token signature mismatch");
        return malformed("invalid token signature");
    }

    auto payloadJson = detail::base64urlDecodeString(encodedPayload);
    if (!payloadJson) {
        return malformed("failed to decode token payload");
    }

    auto sub = extractJsonString(*payloadJson, "sub");
    auto pur = extractJsonString(*payloadJson, "pur");
    auto iat = extractJsonInt(*payloadJson, "iat");
    auto exp = extractJsonInt(*payloadJson, "exp");
    if (!sub || !pur || !iat || !exp) {
        return malformed("token payload is missing claims");
    }
    auto subjectId = parseUnsigned(*sub);
    auto purpose = parseTokenPurpose(*pur);
    if (!subjectId || *subjectId == 0 || !purpose) {
        return malformed("token payload has invalid claims");
    }

    SignedTokenClaims claims;
    claims.subject = UserId(*subjectId);
    claims.purpose = *purpose;
    claims.issuedAt = fromEpochMillis(*iat);
    claims.expiresAt = fromEpochMillis(*exp);

    if (claims.purpose != expectedPurpose) {
        GK_LOG_WARN(LogCategory::Token, "token purpose mismatch: got " + *pur + ", expected " +
                                            std::string(tokenPurposeName(expectedPurpose)));
        return ServiceResult<SignedTokenClaims>::err(
            ServiceError(ErrorCode::TokenPurposeMismatch, "token purpose mismatch"));
    }

    if (clock_() >= claims.expiresAt) {
        return ServiceResult<SignedTokenClaims>::err(
            ServiceError(ErrorCode::TokenExpired, "token has expired"));
    }

    return ServiceResult<SignedTokenClaims>::ok(std::move(claims));
}

ServiceResult<UserId> TokenProvider::verify(std::string_view token,
                                            TokenPurpose expectedPurpose) const {
    auto claims = decode(token, expectedPurpose);
    if (!claims) {
        return ServiceResult<UserId>::err(claims.error());
    }
    return ServiceResult<UserId>::ok(claims.value().subject);
}

std::chrono::seconds TokenProvider::ttlFor(TokenPurpose purpose) const noexcept {
    return purpose == TokenPurpose::ResetPassword ? resetTtl_ : confirmationTtl_;
}

}  // namespace gk::service
