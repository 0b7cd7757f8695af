/// @file user_repository.cpp
/// @brief InMemoryUserRepository implementation.

#include "gk/service/user_repository.hpp"

#include "gk/foundation/service_logger.hpp"

namespace gk::service {

using gk::foundation::ErrorCode;
using gk::foundation::LogCategory;
using gk::foundation::ServiceError;
using gk::foundation::ServiceResult;

InMemoryUserRepository::InMemoryUserRepository(gk::foundation::Clock clock)
    : clock_(std::move(clock)) {}

std::optional<UserRecord> InMemoryUserRepository::findById(UserId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(id);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<UserRecord> InMemoryUserRepository::findByEmail(std::string_view email) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, user] : users_) {
        if (user.email == email) {
            return user;
        }
    }
    return std::nullopt;
}

ServiceResult<UserRecord> InMemoryUserRepository::create(UserRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (emailTakenLocked(record.email, UserId{})) {
        GK_LOG_DEBUG(LogCategory::Storage, "user insert rejected: duplicate email");
        return ServiceResult<UserRecord>::err(
            ServiceError(ErrorCode::UniqueConstraintViolation, "email has already been taken"));
    }
    record.id = UserId(nextId_++);
    auto now = clock_();
    record.createdAt = now;
    record.updatedAt = now;
    users_.emplace(record.id, record);
    return ServiceResult<UserRecord>::ok(std::move(record));
}

ServiceResult<UserRecord> InMemoryUserRepository::update(UserId id,
                                                         const UserMutation& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(id);
    if (it == users_.end()) {
        return ServiceResult<UserRecord>::err(
            ServiceError(ErrorCode::RecordNotFound, "user not found"));
    }

    UserRecord edited = it->second;
    if (auto applied = mutate(edited); !applied) {
        return ServiceResult<UserRecord>::err(applied.error());
    }
    if (emailTakenLocked(edited.email, id)) {
        GK_LOG_DEBUG(LogCategory::Storage, "user update rejected: duplicate email");
        return ServiceResult<UserRecord>::err(
            ServiceError(ErrorCode::UniqueConstraintViolation, "email has already been taken"));
    }

    edited.id = id;
    edited.createdAt = it->second.createdAt;
    edited.updatedAt = clock_();
    it->second = std::move(edited);
    return ServiceResult<UserRecord>::ok(it->second);
}

bool InMemoryUserRepository::remove(UserId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return users_.erase(id) > 0;
}

std::size_t InMemoryUserRepository::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return users_.size();
}

bool InMemoryUserRepository::emailTakenLocked(std::string_view email, UserId except) const {
    for (const auto& [id, user] : users_) {
        if (id != except && user.email == email) {
            return true;
        }
    }
    return false;
}

}  // namespace gk::service
