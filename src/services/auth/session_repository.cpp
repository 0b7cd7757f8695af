/// @file session_repository.cpp
/// @brief InMemorySessionRepository implementation.

#include "gk/service/session_repository.hpp"

#include <algorithm>

namespace gk::service {

InMemorySessionRepository::InMemorySessionRepository(gk::foundation::Clock clock)
    : clock_(std::move(clock)) {}

ActiveSessionRecord InMemorySessionRepository::create(ActiveSessionRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    record.id = ActiveSessionId(nextId_++);
    record.createdAt = clock_();
    byRememberToken_.insert_or_assign(record.rememberToken, record.id);
    sessions_.emplace(record.id, record);
    return record;
}

std::optional<ActiveSessionRecord> InMemorySessionRepository::findById(ActiveSessionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ActiveSessionRecord> InMemorySessionRepository::findByRememberToken(
    std::string_view rememberToken) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto idIt = byRememberToken_.find(std::string(rememberToken));
    if (idIt == byRememberToken_.end()) {
        return std::nullopt;
    }
    auto it = sessions_.find(idIt->second);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ActiveSessionRecord> InMemorySessionRepository::listForUser(UserId userId) const {
    std::vector<ActiveSessionRecord> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            if (session.userId == userId) {
                result.push_back(session);
            }
        }
    }
    // Newest first; ids break ties between rows created in the same instant.
    std::sort(result.begin(), result.end(),
              [](const ActiveSessionRecord& a, const ActiveSessionRecord& b) {
                  if (a.createdAt != b.createdAt) {
                      return a.createdAt > b.createdAt;
                  }
                  return a.id > b.id;
              });
    return result;
}

bool InMemorySessionRepository::remove(ActiveSessionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return false;
    }
    byRememberToken_.erase(it->second.rememberToken);
    sessions_.erase(it);
    return true;
}

std::size_t InMemorySessionRepository::removeAllForUser(UserId userId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.userId == userId) {
            byRememberToken_.erase(it->second.rememberToken);
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t InMemorySessionRepository::countForUser(UserId userId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(sessions_.begin(), sessions_.end(),
                      [userId](const auto& entry) { return entry.second.userId == userId; }));
}

}  // namespace gk::service
