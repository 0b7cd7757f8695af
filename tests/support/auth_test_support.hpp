#pragma once

/// @file auth_test_support.hpp
/// @brief Controllable clock, recording mailer and a cookie-carrying
///        browser used across the authentication tests.

#include "gk/foundation/error_code.hpp"
#include "gk/foundation/service_error.hpp"
#include "gk/foundation/types.hpp"
#include "gk/service/auth_server.hpp"
#include "gk/service/auth_types.hpp"
#include "gk/service/mailer.hpp"
#include "gk/service/request_context.hpp"
#include "gk/service/user_repository.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gk::test {

using namespace std::chrono_literals;

/// Clock whose time only moves when a test advances it.
class ManualClock {
public:
    ManualClock()
        : now_(std::make_shared<gk::foundation::TimePoint>(std::chrono::seconds(1'700'000'000))) {}

    [[nodiscard]] gk::foundation::Clock clock() const {
        auto now = now_;
        return [now] { return *now; };
    }

    [[nodiscard]] gk::foundation::TimePoint now() const { return *now_; }

    void advance(std::chrono::milliseconds delta) { *now_ += delta; }

private:
    std::shared_ptr<gk::foundation::TimePoint> now_;
};

/// Mailer that keeps every delivery for inspection.
class RecordingMailer : public gk::service::IMailer {
public:
    gk::foundation::ServiceResult<void> deliver(const gk::service::MailRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failDeliveries_) {
            return gk::foundation::ServiceResult<void>::err(gk::foundation::ServiceError(
                gk::foundation::ErrorCode::MailDeliveryFailed, "smtp unavailable"));
        }
        deliveries_.push_back(request);
        return gk::foundation::ServiceResult<void>::ok();
    }

    [[nodiscard]] std::vector<gk::service::MailRequest> deliveries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return deliveries_;
    }

    [[nodiscard]] std::size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return deliveries_.size();
    }

    /// Token of the most recent mail of @p purpose sent to @p recipient.
    [[nodiscard]] std::optional<std::string> lastToken(std::string_view recipient,
                                                       gk::service::TokenPurpose purpose) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = deliveries_.rbegin(); it != deliveries_.rend(); ++it) {
            if (it->recipient == recipient && it->purpose == purpose) {
                return it->token;
            }
        }
        return std::nullopt;
    }

    void setFailDeliveries(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        failDeliveries_ = fail;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        deliveries_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<gk::service::MailRequest> deliveries_;
    bool failDeliveries_ = false;
};

/// Replace the stored fields of @p record.id with those of @p record.
inline gk::service::UserRecord overwriteUser(gk::service::IUserRepository& repo,
                                             const gk::service::UserRecord& record) {
    auto stored = repo.update(record.id, [&record](gk::service::UserRecord& current) {
        current = record;
        return gk::foundation::ServiceResult<void>::ok();
    });
    return stored.value();
}

/// Repository that lets a test commit another write right before the next
/// update() is applied, as a concurrent request would.
class InterleavingUserRepository : public gk::service::IUserRepository {
public:
    explicit InterleavingUserRepository(std::shared_ptr<gk::service::IUserRepository> inner)
        : inner_(std::move(inner)) {}

    /// Run @p write against the underlying store once, before the next update.
    void beforeNextUpdate(std::function<void(gk::service::IUserRepository&)> write) {
        pending_ = std::move(write);
    }

    std::optional<gk::service::UserRecord> findById(gk::service::UserId id) const override {
        return inner_->findById(id);
    }

    std::optional<gk::service::UserRecord> findByEmail(std::string_view email) const override {
        return inner_->findByEmail(email);
    }

    gk::foundation::ServiceResult<gk::service::UserRecord> create(
        gk::service::UserRecord record) override {
        return inner_->create(std::move(record));
    }

    gk::foundation::ServiceResult<gk::service::UserRecord> update(
        gk::service::UserId id, const gk::service::UserMutation& mutate) override {
        if (pending_) {
            auto write = std::move(pending_);
            pending_ = nullptr;
            write(*inner_);
        }
        return inner_->update(id, mutate);
    }

    bool remove(gk::service::UserId id) override { return inner_->remove(id); }

    std::size_t count() const override { return inner_->count(); }

private:
    std::shared_ptr<gk::service::IUserRepository> inner_;
    std::function<void(gk::service::IUserRepository&)> pending_;
};

/// Configuration with cheap hashing so tests stay fast.
inline gk::service::AuthConfig testAuthConfig() {
    gk::service::AuthConfig config;
    config.secretKeyBase = "test-secret-key-base-that-is-long-enough-0123456789";
    config.passwordHashIterations = 1000;
    return config;
}

/// A client that carries cookies from one request to the next.
class Browser {
public:
    Browser(gk::service::AuthServer& server, std::string userAgent, std::string ipAddress)
        : server_(server), userAgent_(std::move(userAgent)), ipAddress_(std::move(ipAddress)) {}

    /// Start a request with the cookies this browser holds.
    [[nodiscard]] gk::service::RequestContext open(std::string method = "GET",
                                                   std::string url = "/") const {
        gk::service::RequestMetadata metadata;
        metadata.userAgent = userAgent_;
        metadata.ipAddress = ipAddress_;
        metadata.method = std::move(method);
        metadata.url = std::move(url);

        gk::service::RequestContext ctx(std::move(metadata));
        for (const auto& [name, value] : cookies_) {
            ctx.cookies().load(name, value);
        }
        server_.restoreSession(ctx);
        return ctx;
    }

    /// Finish a request: persist the session and apply cookie writes.
    void close(gk::service::RequestContext& ctx) {
        auto committed = server_.commitSession(ctx);
        if (!committed) {
            return;
        }
        for (const auto& [name, change] : ctx.cookies().changes()) {
            if (change.value) {
                cookies_[name] = *change.value;
            } else {
                cookies_.erase(name);
            }
        }
    }

    /// Drop browser-session cookies, keeping persistent ones (a restart).
    void restart() { cookies_.erase(std::string(gk::service::AuthServer::kSessionCookieName)); }

    [[nodiscard]] bool hasCookie(const std::string& name) const {
        return cookies_.count(name) > 0;
    }

    [[nodiscard]] std::map<std::string, std::string>& cookies() { return cookies_; }

private:
    gk::service::AuthServer& server_;
    std::string userAgent_;
    std::string ipAddress_;
    std::map<std::string, std::string> cookies_;
};

}  // namespace gk::test
