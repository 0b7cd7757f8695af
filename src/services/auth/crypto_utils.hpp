#pragma once

/// @file crypto_utils.hpp
/// @brief Internal cryptographic primitives backed by OpenSSL libcrypto:
///        HMAC-SHA256, PBKDF2, AES-256-GCM, secure randomness, Base64URL.
///
/// Used internally by PasswordHasher, TokenProvider and CookieVault.
/// Every fallible primitive reports failure through an empty optional or a
/// false return; none of them throw.

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gk::service::detail {

using Bytes = std::vector<uint8_t>;

inline const uint8_t* bytesOf(std::string_view s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

// =============================================================================
// Digests and MACs
// =============================================================================

/// SHA-256 digest of @p input.
[[nodiscard]] inline std::array<uint8_t, 32> sha256(std::string_view input) {
    std::array<uint8_t, 32> digest{};
    unsigned int len = 0;
    if (EVP_Digest(input.data(), input.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1) {
        digest.fill(0);
    }
    return digest;
}

/// HMAC-SHA256(key, message). Returns the 32-byte raw MAC.
[[nodiscard]] inline std::array<uint8_t, 32> hmacSha256(std::string_view key,
                                                        std::string_view message) {
    std::array<uint8_t, 32> mac{};
    unsigned int len = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), bytesOf(message),
             message.size(), mac.data(), &len) == nullptr) {
        mac.fill(0);
    }
    return mac;
}

/// PBKDF2-HMAC-SHA256 key derivation.
[[nodiscard]] inline std::optional<Bytes> pbkdf2Sha256(std::string_view password,
                                                       std::string_view salt,
                                                       uint32_t iterations,
                                                       std::size_t length) {
    Bytes out(length);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), bytesOf(salt),
                          static_cast<int>(salt.size()), static_cast<int>(iterations),
                          EVP_sha256(), static_cast<int>(length), out.data()) != 1) {
        return std::nullopt;
    }
    return out;
}

// =============================================================================
// Base64URL encoding/decoding (RFC 4648 §5, unpadded)
// =============================================================================

[[nodiscard]] inline std::string base64urlEncode(const uint8_t* data, std::size_t length) {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string result;
    result.reserve((length * 4 + 2) / 3);

    for (std::size_t i = 0; i < length; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < length) {
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        if (i + 2 < length) {
            n |= static_cast<uint32_t>(data[i + 2]);
        }

        result.push_back(table[(n >> 18) & 0x3F]);
        result.push_back(table[(n >> 12) & 0x3F]);
        if (i + 1 < length) {
            result.push_back(table[(n >> 6) & 0x3F]);
        }
        if (i + 2 < length) {
            result.push_back(table[n & 0x3F]);
        }
    }
    return result;
}

[[nodiscard]] inline std::string base64urlEncode(std::string_view input) {
    return base64urlEncode(bytesOf(input), input.size());
}

/// Decode unpadded base64url. Rejects foreign characters, impossible
/// lengths and non-zero trailing bits, so every byte string has exactly
/// one accepted encoding.
[[nodiscard]] inline std::optional<Bytes> base64urlDecode(std::string_view input) {
    auto decodeChar = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '-') return 62;
        if (c == '_') return 63;
        return -1;
    };

    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    Bytes result;
    result.reserve((input.size() * 3) / 4);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : input) {
        int val = decodeChar(c);
        if (val < 0) {
            return std::nullopt;
        }
        buf = (buf << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((buf >> bits) & 0xFF));
        }
    }
    if (bits > 0 && (buf & ((1u << bits) - 1)) != 0) {
        return std::nullopt;
    }
    return result;
}

[[nodiscard]] inline std::optional<std::string> base64urlDecodeString(std::string_view input) {
    auto bytes = base64urlDecode(input);
    if (!bytes) {
        return std::nullopt;
    }
    return std::string(bytes->begin(), bytes->end());
}

// =============================================================================
// Hex encoding
// =============================================================================

[[nodiscard]] inline std::string toHex(const uint8_t* data, std::size_t length) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(hexChars[(data[i] >> 4) & 0x0F]);
        result.push_back(hexChars[data[i] & 0x0F]);
    }
    return result;
}

[[nodiscard]] inline std::string toHex(const Bytes& data) {
    return toHex(data.data(), data.size());
}

// =============================================================================
// Secure random generation
// =============================================================================

/// @p numBytes bytes from the OpenSSL CSPRNG, or nullopt if it failed.
[[nodiscard]] inline std::optional<Bytes> secureRandomBytes(std::size_t numBytes) {
    Bytes buf(numBytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        return std::nullopt;
    }
    return buf;
}

[[nodiscard]] inline std::optional<std::string> secureRandomHex(std::size_t numBytes) {
    auto bytes = secureRandomBytes(numBytes);
    if (!bytes) {
        return std::nullopt;
    }
    return toHex(*bytes);
}

/// Random base58 string of @p length characters (no 0, O, I, l).
[[nodiscard]] inline std::optional<std::string> secureRandomBase58(std::size_t length) {
    static constexpr char alphabet[] =
        "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
    constexpr uint8_t kAlphabetSize = 58;
    // Largest multiple of 58 that fits in a byte; higher values are redrawn
    // so every character is equally likely.
    constexpr uint8_t kAcceptBelow = kAlphabetSize * 4;

    std::string out;
    out.reserve(length);
    while (out.size() < length) {
        auto chunk = secureRandomBytes(length * 2);
        if (!chunk) {
            return std::nullopt;
        }
        for (uint8_t b : *chunk) {
            if (b < kAcceptBelow && out.size() < length) {
                out.push_back(alphabet[b % kAlphabetSize]);
            }
        }
    }
    return out;
}

// =============================================================================
// Constant-time comparison
// =============================================================================

/// Compare two strings without data-dependent early exit.
[[nodiscard]] inline bool constantTimeEqual(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// =============================================================================
// AES-256-GCM
// =============================================================================

inline constexpr std::size_t kGcmIvLength = 12;
inline constexpr std::size_t kGcmTagLength = 16;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

/// Sealed AES-256-GCM message parts.
struct GcmSealed {
    Bytes iv;
    Bytes ciphertext;
    Bytes tag;
};

/// Encrypt and authenticate @p plaintext under a 32-byte key, binding
/// @p aad into the tag. Returns nullopt on any OpenSSL failure.
[[nodiscard]] inline std::optional<GcmSealed> aes256GcmSeal(const Bytes& key,
                                                            std::string_view plaintext,
                                                            std::string_view aad) {
    if (key.size() != 32) {
        return std::nullopt;
    }
    auto iv = secureRandomBytes(kGcmIvLength);
    if (!iv) {
        return std::nullopt;
    }
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::nullopt;
    }

    GcmSealed sealed;
    sealed.iv = std::move(*iv);
    sealed.ciphertext.resize(plaintext.size() + kGcmTagLength);
    sealed.tag.resize(kGcmTagLength);

    int len = 0;
    int total = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(kGcmIvLength), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), sealed.iv.data()) != 1) {
        return std::nullopt;
    }
    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, bytesOf(aad), static_cast<int>(aad.size())) != 1) {
        return std::nullopt;
    }
    if (EVP_EncryptUpdate(ctx.get(), sealed.ciphertext.data(), &len, bytesOf(plaintext),
                          static_cast<int>(plaintext.size())) != 1) {
        return std::nullopt;
    }
    total = len;
    if (EVP_EncryptFinal_ex(ctx.get(), sealed.ciphertext.data() + total, &len) != 1) {
        return std::nullopt;
    }
    total += len;
    sealed.ciphertext.resize(static_cast<std::size_t>(total));
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kGcmTagLength),
                            sealed.tag.data()) != 1) {
        return std::nullopt;
    }
    return sealed;
}

/// Verify and decrypt an AES-256-GCM message. Returns nullopt when the
/// tag does not authenticate (tampered ciphertext, IV, tag or AAD).
[[nodiscard]] inline std::optional<std::string> aes256GcmOpen(const Bytes& key,
                                                              const GcmSealed& sealed,
                                                              std::string_view aad) {
    if (key.size() != 32 || sealed.iv.size() != kGcmIvLength ||
        sealed.tag.size() != kGcmTagLength) {
        return std::nullopt;
    }
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::nullopt;
    }

    std::string plaintext(sealed.ciphertext.size() + kGcmTagLength, '\0');
    auto* out = reinterpret_cast<unsigned char*>(plaintext.data());
    int len = 0;
    int total = 0;
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(kGcmIvLength), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), sealed.iv.data()) != 1) {
        return std::nullopt;
    }
    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, bytesOf(aad), static_cast<int>(aad.size())) != 1) {
        return std::nullopt;
    }
    if (EVP_DecryptUpdate(ctx.get(), out, &len, sealed.ciphertext.data(),
                          static_cast<int>(sealed.ciphertext.size())) != 1) {
        return std::nullopt;
    }
    total = len;
    // The tag is an input here; OpenSSL does not modify it.
    auto tag = sealed.tag;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kGcmTagLength),
                            tag.data()) != 1) {
        return std::nullopt;
    }
    if (EVP_DecryptFinal_ex(ctx.get(), out + total, &len) <= 0) {
        return std::nullopt;
    }
    total += len;
    plaintext.resize(static_cast<std::size_t>(total));
    return plaintext;
}

}  // namespace gk::service::detail
