/// @file password_hasher.cpp
/// @brief PasswordHasher implementation using PBKDF2-HMAC-SHA256.

#include "gk/service/password_hasher.hpp"

#include "crypto_utils.hpp"

#include <charconv>
#include <vector>

namespace gk::service {

using gk::foundation::ErrorCode;
using gk::foundation::ServiceError;
using gk::foundation::ServiceResult;

namespace {

constexpr std::size_t kSaltBytes = 16;
constexpr std::size_t kDigestBytes = 32;

struct ParsedHash {
    uint32_t iterations = 0;
    std::string_view salt;
    std::string_view digest;
};

/// Split "algo$iter$salt$digest". Returns false on any structural problem.
bool parseEncoded(std::string_view encoded, ParsedHash& out) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = encoded.find('$', start);
        if (pos == std::string_view::npos) {
            parts.push_back(encoded.substr(start));
            break;
        }
        parts.push_back(encoded.substr(start, pos - start));
        start = pos + 1;
    }
    if (parts.size() != 4 || parts[0] != PasswordHasher::kAlgorithm) {
        return false;
    }

    auto [ptr, ec] =
        std::from_chars(parts[1].data(), parts[1].data() + parts[1].size(), out.iterations);
    if (ec != std::errc{} || ptr != parts[1].data() + parts[1].size() || out.iterations == 0) {
        return false;
    }
    if (parts[2].empty() || parts[3].size() != kDigestBytes * 2) {
        return false;
    }
    out.salt = parts[2];
    out.digest = parts[3];
    return true;
}

std::string encode(uint32_t iterations, std::string_view salt, std::string_view digest) {
    std::string out(PasswordHasher::kAlgorithm);
    out += '$';
    out += std::to_string(iterations);
    out += '$';
    out += salt;
    out += '$';
    out += digest;
    return out;
}

}  // anonymous namespace

PasswordHasher::PasswordHasher(uint32_t iterations)
    : iterations_(iterations == 0 ? kDefaultIterations : iterations) {}

ServiceResult<std::string> PasswordHasher::hash(std::string_view password) const {
    auto salt = detail::secureRandomHex(kSaltBytes);
    if (!salt) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::CryptoError, "failed to generate password salt"));
    }
    auto digest = detail::pbkdf2Sha256(password, *salt, iterations_, kDigestBytes);
    if (!digest) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::CryptoError, "password key derivation failed"));
    }
    return ServiceResult<std::string>::ok(encode(iterations_, *salt, detail::toHex(*digest)));
}

bool PasswordHasher::verify(std::string_view password, std::string_view encoded) const {
    ParsedHash parsed;
    if (!parseEncoded(encoded, parsed)) {
        return false;
    }
    auto digest = detail::pbkdf2Sha256(password, parsed.salt, parsed.iterations, kDigestBytes);
    if (!digest) {
        return false;
    }
    return detail::constantTimeEqual(detail::toHex(*digest), parsed.digest);
}

std::string PasswordHasher::placeholderHash() const {
    // All-zero salt and digest.
    return encode(iterations_, std::string(kSaltBytes * 2, '0'), std::string(kDigestBytes * 2, '0'));
}

}  // namespace gk::service
