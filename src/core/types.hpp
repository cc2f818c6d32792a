#pragma once

#include <chrono>
#include <cstdint>
#include <compare>
#include <string>

namespace tabsync {

/**
 * Guid - Sync record identifier, as handed to us by the sync server.
 *
 * Opaque: never parsed or generated locally.
 */
using Guid = std::string;

/**
 * Timestamp - Milliseconds since the Unix epoch.
 *
 * Sync timestamps are unsigned 64-bit values. SQLite stores INTEGER as a
 * signed 64-bit value, so to_sql()/from_sql() reinterpret the bits; every
 * timestamp survives the round trip exactly. SQL ordering does not: values
 * above INT64_MAX are stored negative and sort below all others.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(uint64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        const auto since_epoch = std::chrono::duration_cast<Duration>(
            Clock::now().time_since_epoch());
        return Timestamp(static_cast<uint64_t>(since_epoch.count()));
    }

    [[nodiscard]] static constexpr Timestamp from_sql(int64_t stored) noexcept {
        return Timestamp(static_cast<uint64_t>(stored));
    }

    [[nodiscard]] constexpr uint64_t millis() const noexcept { return millis_; }

    [[nodiscard]] constexpr int64_t to_sql() const noexcept {
        return static_cast<int64_t>(millis_);
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

private:
    uint64_t millis_;
};

} // namespace tabsync
