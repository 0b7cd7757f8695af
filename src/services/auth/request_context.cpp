/// @file request_context.cpp
/// @brief SessionData serialization and CookieJar bookkeeping.
///
/// Serialized session layout, every field base64url-encoded:
///   id(.key:value)*

#include "gk/service/request_context.hpp"

#include "crypto_utils.hpp"

namespace gk::service {

// -- SessionData --------------------------------------------------------------

std::optional<std::string> SessionData::get(std::string_view key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SessionData::set(std::string key, std::string value) {
    values_.insert_or_assign(std::move(key), std::move(value));
}

void SessionData::erase(std::string_view key) {
    auto it = values_.find(key);
    if (it != values_.end()) {
        values_.erase(it);
    }
}

bool SessionData::contains(std::string_view key) const {
    return values_.find(key) != values_.end();
}

void SessionData::reset() {
    values_.clear();
    id_.clear();
    wasReset_ = true;
}

std::string SessionData::serialize() const {
    std::string out = detail::base64urlEncode(id_);
    for (const auto& [key, value] : values_) {
        out += '.';
        out += detail::base64urlEncode(key);
        out += ':';
        out += detail::base64urlEncode(value);
    }
    return out;
}

std::optional<SessionData> SessionData::parse(std::string_view text) {
    SessionData data;

    auto dot = text.find('.');
    auto id = detail::base64urlDecodeString(text.substr(0, dot));
    if (!id) {
        return std::nullopt;
    }
    data.id_ = std::move(*id);

    while (dot != std::string_view::npos) {
        auto start = dot + 1;
        dot = text.find('.', start);
        auto entry = text.substr(start, dot == std::string_view::npos ? dot : dot - start);

        auto colon = entry.find(':');
        if (colon == std::string_view::npos) {
            return std::nullopt;
        }
        auto key = detail::base64urlDecodeString(entry.substr(0, colon));
        auto value = detail::base64urlDecodeString(entry.substr(colon + 1));
        if (!key || !value || key->empty()) {
            return std::nullopt;
        }
        data.values_.insert_or_assign(std::move(*key), std::move(*value));
    }
    return data;
}

// -- CookieJar ----------------------------------------------------------------

void CookieJar::load(std::string name, std::string value) {
    values_.insert_or_assign(std::move(name), std::move(value));
}

std::optional<std::string> CookieJar::get(std::string_view name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void CookieJar::set(std::string name, std::string value, CookieOptions options) {
    values_.insert_or_assign(name, value);
    changes_.insert_or_assign(std::move(name), CookieChange{std::move(value), options});
}

void CookieJar::erase(std::string_view name) {
    auto it = values_.find(name);
    if (it != values_.end()) {
        values_.erase(it);
    }
    changes_.insert_or_assign(std::string(name), CookieChange{std::nullopt, CookieOptions{}});
}

}  // namespace gk::service
