#pragma once

/// @file session_repository.hpp
/// @brief ActiveSession persistence interface and in-memory implementation.
///
/// One row per logged-in device. Rows are never updated, only created and
/// destroyed, and have no time-based expiry.

#include "gk/service/auth_types.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gk::service {

/// Abstract interface for active-session persistence.
///
/// Implementations must be thread-safe when shared across threads. Lookups
/// of a row another request has just destroyed return nullopt; they never
/// fail loudly.
class ISessionRepository {
public:
    virtual ~ISessionRepository() = default;

    /// Store a new session, assigning its id and createdAt.
    virtual ActiveSessionRecord create(ActiveSessionRecord record) = 0;

    [[nodiscard]] virtual std::optional<ActiveSessionRecord> findById(ActiveSessionId id) const = 0;

    [[nodiscard]] virtual std::optional<ActiveSessionRecord> findByRememberToken(
        std::string_view rememberToken) const = 0;

    /// All sessions owned by @p userId, newest first.
    [[nodiscard]] virtual std::vector<ActiveSessionRecord> listForUser(UserId userId) const = 0;

    /// Destroy one session. Returns false if not found.
    virtual bool remove(ActiveSessionId id) = 0;

    /// Destroy every session owned by @p userId. Returns the number removed.
    virtual std::size_t removeAllForUser(UserId userId) = 0;

    [[nodiscard]] virtual std::size_t countForUser(UserId userId) const = 0;
};

/// Thread-safe in-memory session store for testing and development.
class InMemorySessionRepository : public ISessionRepository {
public:
    explicit InMemorySessionRepository(
        gk::foundation::Clock clock = gk::foundation::systemClock());

    ActiveSessionRecord create(ActiveSessionRecord record) override;

    [[nodiscard]] std::optional<ActiveSessionRecord> findById(ActiveSessionId id) const override;

    [[nodiscard]] std::optional<ActiveSessionRecord> findByRememberToken(
        std::string_view rememberToken) const override;

    [[nodiscard]] std::vector<ActiveSessionRecord> listForUser(UserId userId) const override;

    bool remove(ActiveSessionId id) override;

    std::size_t removeAllForUser(UserId userId) override;

    [[nodiscard]] std::size_t countForUser(UserId userId) const override;

private:
    gk::foundation::Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<ActiveSessionId, ActiveSessionRecord> sessions_;
    std::unordered_map<std::string, ActiveSessionId> byRememberToken_;
    uint64_t nextId_ = 1;
};

}  // namespace gk::service
