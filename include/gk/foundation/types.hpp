#pragma once

/// @file types.hpp
/// @brief Strong ID types and clock aliases shared across the service.

#include <chrono>
#include <cstdint>
#include <functional>

namespace gk::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Prevents accidental mixing of different ID types (e.g., UserId and
/// ActiveSessionId) at compile time while keeping the same underlying
/// representation.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct UserIdTag {};
struct ActiveSessionIdTag {};

/// Unique identifier for user accounts.
using UserId = StrongId<UserIdTag>;

/// Unique identifier for one logged-in device.
using ActiveSessionId = StrongId<ActiveSessionIdTag>;

/// Wall-clock time point used for every timestamp in the service.
using TimePoint = std::chrono::system_clock::time_point;

/// Injectable time source.
using Clock = std::function<TimePoint()>;

/// The default clock, reading std::chrono::system_clock.
inline Clock systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

} // namespace gk::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<gk::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const gk::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
