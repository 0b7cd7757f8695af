#pragma once

/// @file input_validator.hpp
/// @brief Email normalization and credential validation for account input.
///
/// Provides RFC 5322 subset email validation, the normalization applied
/// at every write boundary of a UserRecord, and password rules.

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace gk::service {

/// Result of a validation check.
struct ValidationResult {
    bool valid;
    std::string message;

    explicit operator bool() const noexcept { return valid; }

    static ValidationResult ok() { return {true, {}}; }
    static ValidationResult fail(std::string msg) {
        return {false, std::move(msg)};
    }
};

/// Stateless input validation utilities.
///
/// All functions are static and thread-safe. Input length limits are enforced
/// to keep hashing cost bounded.
class InputValidator {
public:
    // -- Limits ---------------------------------------------------------------

    static constexpr std::size_t kMaxEmailLength = 254;     // RFC 5321
    static constexpr std::size_t kMaxLocalPartLength = 64;  // RFC 5321
    static constexpr std::size_t kMaxDomainLength = 253;    // RFC 5321
    static constexpr std::size_t kMaxDomainLabelLength = 63;

    static constexpr std::size_t kMaxPasswordLength = 72;

    // -- Normalization --------------------------------------------------------

    /// Trim surrounding whitespace and lowercase an email address.
    [[nodiscard]] static inline std::string normalizeEmail(std::string_view email) {
        auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
        while (!email.empty() && isSpace(email.front())) {
            email.remove_prefix(1);
        }
        while (!email.empty() && isSpace(email.back())) {
            email.remove_suffix(1);
        }
        std::string lower(email.size(), '\0');
        std::transform(email.begin(), email.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower;
    }

    // -- Email ----------------------------------------------------------------

    /// Validate email against RFC 5322 subset.
    ///
    /// Checks: length limits, single '@', local part characters and dot rules,
    /// domain label structure and character rules.
    [[nodiscard]] static inline ValidationResult validateEmail(
        std::string_view email) {
        if (email.empty()) {
            return ValidationResult::fail("can't be blank");
        }
        if (email.size() > kMaxEmailLength) {
            return ValidationResult::fail("is too long");
        }

        auto atPos = email.find('@');
        if (atPos == std::string_view::npos || atPos == 0) {
            return ValidationResult::fail("is invalid");
        }
        if (email.find('@', atPos + 1) != std::string_view::npos) {
            return ValidationResult::fail("is invalid");
        }

        auto local = email.substr(0, atPos);
        auto domain = email.substr(atPos + 1);

        if (local.size() > kMaxLocalPartLength) {
            return ValidationResult::fail("is invalid");
        }
        if (local.front() == '.' || local.back() == '.' ||
            local.find("..") != std::string_view::npos) {
            return ValidationResult::fail("is invalid");
        }
        // RFC 5322 atext: alphanumeric + !#$%&'*+/=?^_`{|}~-.
        for (char c : local) {
            if (std::isalnum(static_cast<unsigned char>(c))) continue;
            if (isLocalSpecialChar(c)) continue;
            return ValidationResult::fail("is invalid");
        }

        if (domain.empty() || domain.size() > kMaxDomainLength) {
            return ValidationResult::fail("is invalid");
        }
        if (domain.front() == '.' || domain.back() == '.' ||
            domain.find("..") != std::string_view::npos) {
            return ValidationResult::fail("is invalid");
        }
        if (domain.find('.') == std::string_view::npos) {
            return ValidationResult::fail("is invalid");
        }

        std::size_t labelStart = 0;
        while (labelStart < domain.size()) {
            auto dotPos = domain.find('.', labelStart);
            auto labelEnd =
                (dotPos == std::string_view::npos) ? domain.size() : dotPos;
            auto label = domain.substr(labelStart, labelEnd - labelStart);

            if (label.empty() || label.size() > kMaxDomainLabelLength) {
                return ValidationResult::fail("is invalid");
            }
            if (label.front() == '-' || label.back() == '-') {
                return ValidationResult::fail("is invalid");
            }
            for (char c : label) {
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
                    return ValidationResult::fail("is invalid");
                }
            }

            labelStart = labelEnd + 1;
        }

        return ValidationResult::ok();
    }

    // -- Password -------------------------------------------------------------

    /// Validate a new password.
    ///
    /// Requires presence, @p minLength characters and at most
    /// kMaxPasswordLength bytes. With @p requireComplexity, also at least one
    /// each of uppercase, lowercase, digit, and special character.
    [[nodiscard]] static inline ValidationResult validatePassword(
        std::string_view password, uint32_t minLength, bool requireComplexity) {
        if (password.empty()) {
            return ValidationResult::fail("can't be blank");
        }
        if (password.size() < static_cast<std::size_t>(minLength)) {
            return ValidationResult::fail(
                "is too short (minimum is " + std::to_string(minLength) + " characters)");
        }
        if (password.size() > kMaxPasswordLength) {
            return ValidationResult::fail(
                "is too long (maximum is " + std::to_string(kMaxPasswordLength) +
                " characters)");
        }
        if (!requireComplexity) {
            return ValidationResult::ok();
        }

        bool hasUpper = false;
        bool hasLower = false;
        bool hasDigit = false;
        bool hasSpecial = false;

        for (char c : password) {
            auto uc = static_cast<unsigned char>(c);
            if (std::isupper(uc)) hasUpper = true;
            else if (std::islower(uc)) hasLower = true;
            else if (std::isdigit(uc)) hasDigit = true;
            else hasSpecial = true;
        }

        if (!hasUpper) {
            return ValidationResult::fail("must contain at least one uppercase letter");
        }
        if (!hasLower) {
            return ValidationResult::fail("must contain at least one lowercase letter");
        }
        if (!hasDigit) {
            return ValidationResult::fail("must contain at least one digit");
        }
        if (!hasSpecial) {
            return ValidationResult::fail("must contain at least one special character");
        }

        return ValidationResult::ok();
    }

    /// Check that a confirmation field repeats the password.
    [[nodiscard]] static inline ValidationResult validateConfirmation(
        std::string_view password, std::string_view confirmation) {
        if (password != confirmation) {
            return ValidationResult::fail("doesn't match Password");
        }
        return ValidationResult::ok();
    }

private:
    /// Characters allowed in the email local part (RFC 5322 atext specials).
    static constexpr bool isLocalSpecialChar(char c) noexcept {
        switch (c) {
            case '.': case '!': case '#': case '$': case '%': case '&':
            case '\'': case '*': case '+': case '/': case '=': case '?':
            case '^': case '_': case '`': case '{': case '|': case '}':
            case '~': case '-':
                return true;
            default:
                return false;
        }
    }
};

} // namespace gk::service
