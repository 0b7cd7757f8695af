#pragma once

/// @file service_error.hpp
/// @brief Service error type used with Result<T, ServiceError>.

#include <any>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gk/foundation/error_code.hpp"

namespace gk::foundation {

/// Field-level validation messages, keyed by field name ("email",
/// "password", "password_confirmation", ...).
///
/// Attached as context to ValidationFailed errors so that the calling
/// layer can render messages next to the offending form fields.
struct ValidationErrors {
    std::map<std::string, std::vector<std::string>> fields;

    void add(std::string field, std::string message) {
        fields[std::move(field)].push_back(std::move(message));
    }

    [[nodiscard]] bool empty() const noexcept { return fields.empty(); }

    [[nodiscard]] bool has(std::string_view field) const {
        return fields.find(std::string(field)) != fields.end();
    }

    /// All messages joined as one sentence ("email is invalid, password is too short").
    [[nodiscard]] std::string toSentence() const {
        std::string out;
        for (const auto& [field, messages] : fields) {
            for (const auto& msg : messages) {
                if (!out.empty()) {
                    out += ", ";
                }
                out += field;
                out += ' ';
                out += msg;
            }
        }
        return out;
    }
};

/// Rich error type carrying an error code, human-readable message,
/// and optional type-erased context data.
class ServiceError {
public:
    ServiceError() = default;

    explicit ServiceError(ErrorCode code)
        : code_(code) {}

    ServiceError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ServiceError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    /// Build a ValidationFailed error carrying the field details.
    static ServiceError validation(ValidationErrors errors) {
        auto message = errors.toSentence();
        return ServiceError(ErrorCode::ValidationFailed, std::move(message), std::move(errors));
    }

    /// The categorized error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable error description.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// Field details of a ValidationFailed error, or nullptr.
    [[nodiscard]] const ValidationErrors* validationErrors() const noexcept {
        return context<ValidationErrors>();
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace gk::foundation
