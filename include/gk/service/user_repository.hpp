#pragma once

/// @file user_repository.hpp
/// @brief User persistence interface and in-memory implementation.
///
/// Abstracts user storage so the authentication flows can work with any
/// backend. Emails reaching a repository are already normalized.

#include "gk/foundation/service_result.hpp"
#include "gk/service/auth_types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace gk::service {

/// In-place edit of a stored user, run while the repository holds its lock.
/// Returning an error aborts the write. A mutation must not call back into
/// the repository.
using UserMutation = std::function<gk::foundation::ServiceResult<void>(UserRecord&)>;

/// Abstract interface for user persistence.
///
/// Implementations must be thread-safe when shared across threads, and
/// each call must behave as a single atomic transaction.
class IUserRepository {
public:
    virtual ~IUserRepository() = default;

    /// Find a user by their unique ID.
    [[nodiscard]] virtual std::optional<UserRecord> findById(UserId id) const = 0;

    /// Find a user by (normalized) email.
    [[nodiscard]] virtual std::optional<UserRecord> findByEmail(std::string_view email) const = 0;

    /// Create a new user, returning the stored record with its assigned ID
    /// and timestamps. Fails with UniqueConstraintViolation on a duplicate email.
    [[nodiscard]] virtual gk::foundation::ServiceResult<UserRecord> create(UserRecord record) = 0;

    /// Apply @p mutate to the current stored record of @p id in one atomic
    /// step and return the result.
    ///
    /// The mutation sees every write committed before it, so concurrent
    /// edits to different fields are never lost. Email uniqueness is
    /// re-checked against every other user inside the same step. Fails with
    /// RecordNotFound if the user is gone, UniqueConstraintViolation on a
    /// collision, or the mutation's own error; the stored record is
    /// unchanged on failure.
    [[nodiscard]] virtual gk::foundation::ServiceResult<UserRecord> update(
        UserId id, const UserMutation& mutate) = 0;

    /// Delete a user. Returns false if not found.
    virtual bool remove(UserId id) = 0;

    [[nodiscard]] virtual std::size_t count() const = 0;
};

/// Thread-safe in-memory user repository for testing and development.
class InMemoryUserRepository : public IUserRepository {
public:
    explicit InMemoryUserRepository(gk::foundation::Clock clock = gk::foundation::systemClock());

    [[nodiscard]] std::optional<UserRecord> findById(UserId id) const override;

    [[nodiscard]] std::optional<UserRecord> findByEmail(std::string_view email) const override;

    [[nodiscard]] gk::foundation::ServiceResult<UserRecord> create(UserRecord record) override;

    [[nodiscard]] gk::foundation::ServiceResult<UserRecord> update(
        UserId id, const UserMutation& mutate) override;

    bool remove(UserId id) override;

    [[nodiscard]] std::size_t count() const override;

private:
    [[nodiscard]] bool emailTakenLocked(std::string_view email, UserId except) const;

    gk::foundation::Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<UserId, UserRecord> users_;
    uint64_t nextId_ = 1;
};

}  // namespace gk::service
