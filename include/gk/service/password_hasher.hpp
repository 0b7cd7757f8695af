#pragma once

/// @file password_hasher.hpp
/// @brief Password hashing and verification using PBKDF2-HMAC-SHA256.
///
/// Each hash gets a fresh random salt. The stored form is self-describing
/// so the iteration count can be raised without invalidating old hashes:
///
///   pbkdf2_sha256$<iterations>$<salt-hex>$<digest-hex>

#include "gk/foundation/service_result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace gk::service {

/// Password hashing utility using PBKDF2-HMAC-SHA256 + random salt.
///
/// Example:
/// @code
///   PasswordHasher hasher(210000);
///   auto encoded = hasher.hash("my_password");
///   bool ok = encoded && hasher.verify("my_password", encoded.value());
/// @endcode
class PasswordHasher {
public:
    static constexpr std::string_view kAlgorithm = "pbkdf2_sha256";
    static constexpr uint32_t kDefaultIterations = 210000;

    explicit PasswordHasher(uint32_t iterations = kDefaultIterations);

    /// Hash a plaintext password with a newly generated random salt.
    /// Fails with CryptoError only if the system CSPRNG or KDF fails.
    [[nodiscard]] gk::foundation::ServiceResult<std::string> hash(
        std::string_view password) const;

    /// Verify a plaintext password against an encoded hash.
    /// The digest comparison is constant-time. Malformed input never matches.
    [[nodiscard]] bool verify(std::string_view password, std::string_view encoded) const;

    /// A well-formed encoded hash that no password matches, costing the same
    /// to verify as a real one with the current iteration count.
    [[nodiscard]] std::string placeholderHash() const;

    [[nodiscard]] uint32_t iterations() const noexcept { return iterations_; }

private:
    uint32_t iterations_;
};

}  // namespace gk::service
