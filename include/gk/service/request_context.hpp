#pragma once

/// @file request_context.hpp
/// @brief Request-scoped state: session data, cookies and the memoized
///        current user.
///
/// One RequestContext exists per request being served and is threaded
/// explicitly through every authentication call. Nothing here is shared
/// between requests.

#include "gk/service/auth_types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace gk::service {

// -- Session ------------------------------------------------------------------

/// Server-verifiable key/value session carried in a signed cookie.
///
/// The session id identifies the session container itself and is replaced
/// on every reset(), so a privilege change never keeps an identifier the
/// client held before it.
class SessionData {
public:
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;
    void set(std::string key, std::string value);
    void erase(std::string_view key);

    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

    /// Drop every value and the current id. The caller assigns a new id.
    void reset();

    /// True once reset() has been called during this request.
    [[nodiscard]] bool wasReset() const noexcept { return wasReset_; }

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    void assignId(std::string id) { id_ = std::move(id); }

    /// Compact text form suitable for signing into a cookie.
    [[nodiscard]] std::string serialize() const;

    /// Inverse of serialize(). Returns nullopt for malformed input.
    [[nodiscard]] static std::optional<SessionData> parse(std::string_view text);

private:
    std::string id_;
    std::map<std::string, std::string, std::less<>> values_;
    bool wasReset_ = false;
};

// -- Cookies ------------------------------------------------------------------

/// Attributes of an outgoing cookie.
struct CookieOptions {
    /// Unset means a browser-session cookie.
    std::optional<std::chrono::seconds> maxAge;
    bool httpOnly = true;
};

/// An outgoing cookie write. An unset value deletes the cookie.
struct CookieChange {
    std::optional<std::string> value;
    CookieOptions options;
};

/// Incoming cookies plus the writes made while serving the request.
class CookieJar {
public:
    /// Record a cookie sent by the client.
    void load(std::string name, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view name) const;
    [[nodiscard]] bool has(std::string_view name) const { return get(name).has_value(); }

    void set(std::string name, std::string value, CookieOptions options = {});
    void erase(std::string_view name);

    /// Writes to send back to the client, by cookie name.
    [[nodiscard]] const std::map<std::string, CookieChange, std::less<>>& changes() const noexcept {
        return changes_;
    }

private:
    std::map<std::string, std::string, std::less<>> values_;
    std::map<std::string, CookieChange, std::less<>> changes_;
};

// -- Request context ----------------------------------------------------------

/// Everything the authentication layer knows about the request in flight.
class RequestContext {
public:
    explicit RequestContext(RequestMetadata metadata = {})
        : metadata_(std::move(metadata)) {}

    [[nodiscard]] const RequestMetadata& metadata() const noexcept { return metadata_; }

    [[nodiscard]] SessionData& session() noexcept { return session_; }
    [[nodiscard]] const SessionData& session() const noexcept { return session_; }

    [[nodiscard]] CookieJar& cookies() noexcept { return cookies_; }
    [[nodiscard]] const CookieJar& cookies() const noexcept { return cookies_; }

    // Current-user memo. Resolved at most once per request unless
    // invalidated by a login, logout or revocation.

    [[nodiscard]] bool currentUserResolved() const noexcept { return userResolved_; }

    [[nodiscard]] const std::optional<UserRecord>& cachedCurrentUser() const noexcept {
        return currentUser_;
    }

    void cacheCurrentUser(std::optional<UserRecord> user) {
        currentUser_ = std::move(user);
        userResolved_ = true;
    }

    void invalidateCurrentUser() noexcept {
        currentUser_.reset();
        userResolved_ = false;
    }

private:
    RequestMetadata metadata_;
    SessionData session_;
    CookieJar cookies_;
    std::optional<UserRecord> currentUser_;
    bool userResolved_ = false;
};

}  // namespace gk::service
