#pragma once

#include <compare>
#include <cstdint>
#include <cstddef>
#include <functional>

namespace staffsim::core {

/// @brief Time interval represented as an integer nanosecond count.
///
/// Duration wraps an `int64_t` nanosecond value with a private constructor.
/// All construction goes through named factories or bridge functions, so
/// conversions between seconds (double) and nanoseconds (int64_t) are always
/// explicit. Integer storage keeps tick accumulation exact: adding a 100 ms
/// tick eighty times yields exactly 8 s.
///
/// @see duration_from_seconds, duration_from_milliseconds, duration_to_seconds
/// @see TimePoint
/// @ingroup core_types
class Duration {
    int64_t ns_;

    explicit constexpr Duration(int64_t ns) noexcept : ns_(ns) {}

    // Round double seconds to nearest nanosecond
    static constexpr int64_t secs_to_ns(double s) noexcept {
        return static_cast<int64_t>(s * 1e9 + (s >= 0.0 ? 0.5 : -0.5));
    }

    friend constexpr Duration duration_from_seconds(double s) noexcept;
    friend constexpr Duration duration_from_milliseconds(int64_t ms) noexcept;
    friend constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept;
    friend constexpr double duration_to_seconds(Duration d) noexcept;
    friend constexpr Duration scale_duration(Duration d, double factor) noexcept;

public:
    /// @brief Default constructor: zero duration.
    constexpr Duration() noexcept : ns_(0) {}

    /// @brief Named factory returning a zero-length duration.
    static constexpr Duration zero() noexcept { return Duration{0}; }

    /// @brief Convert to seconds (double).
    [[nodiscard]] constexpr double seconds() const noexcept {
        return static_cast<double>(ns_) * 1e-9;
    }

    /// @brief Return the raw nanosecond count.
    [[nodiscard]] constexpr int64_t nanoseconds() const noexcept {
        return ns_;
    }

    constexpr Duration operator+(Duration rhs) const noexcept {
        return Duration{ns_ + rhs.ns_};
    }

    constexpr Duration operator-(Duration rhs) const noexcept {
        return Duration{ns_ - rhs.ns_};
    }

    constexpr Duration& operator+=(Duration rhs) noexcept {
        ns_ += rhs.ns_;
        return *this;
    }

    constexpr Duration& operator-=(Duration rhs) noexcept {
        ns_ -= rhs.ns_;
        return *this;
    }

    constexpr auto operator<=>(const Duration& rhs) const noexcept = default;
    constexpr bool operator==(const Duration& rhs) const noexcept = default;
};

/// @brief Absolute simulation time as a Duration offset from epoch (time zero).
///
/// TimePoint +/- Duration yields a TimePoint and TimePoint - TimePoint yields
/// a Duration. Two TimePoints cannot be added.
///
/// @see time_from_seconds, time_to_seconds, Duration
/// @ingroup core_types
class TimePoint {
    Duration since_epoch_;

    explicit constexpr TimePoint(Duration d) noexcept : since_epoch_(d) {}

    friend constexpr TimePoint time_from_seconds(double s) noexcept;

public:
    /// @brief Default constructor: epoch (time zero).
    constexpr TimePoint() noexcept : since_epoch_(Duration::zero()) {}

    /// @brief Named factory returning the epoch (time zero).
    static constexpr TimePoint epoch() noexcept {
        return TimePoint{Duration::zero()};
    }

    /// @brief Return the duration elapsed since epoch.
    [[nodiscard]] constexpr Duration time_since_epoch() const noexcept {
        return since_epoch_;
    }

    constexpr TimePoint operator+(Duration d) const noexcept {
        return TimePoint{since_epoch_ + d};
    }

    constexpr TimePoint operator-(Duration d) const noexcept {
        return TimePoint{since_epoch_ - d};
    }

    constexpr TimePoint& operator+=(Duration d) noexcept {
        since_epoch_ += d;
        return *this;
    }

    constexpr Duration operator-(TimePoint rhs) const noexcept {
        return since_epoch_ - rhs.since_epoch_;
    }

    constexpr auto operator<=>(const TimePoint& rhs) const noexcept = default;
    constexpr bool operator==(const TimePoint& rhs) const noexcept = default;
};

/// @brief Integer tile coordinate on the world grid.
///
/// Ordered lexicographically (x, then y) so it can key ordered containers.
///
/// @see manhattan_distance
/// @ingroup core_types
struct GridPos {
    int32_t x{0}; ///< Column.
    int32_t y{0}; ///< Row.

    constexpr bool operator==(const GridPos&) const = default;
    constexpr auto operator<=>(const GridPos&) const = default;
};

/// @brief Manhattan (L1) distance between two tiles.
/// @ingroup core_types
[[nodiscard]] constexpr int64_t manhattan_distance(GridPos a, GridPos b) noexcept {
    int64_t dx = static_cast<int64_t>(a.x) - b.x;
    int64_t dy = static_cast<int64_t>(a.y) - b.y;
    return (dx < 0 ? -dx : dx) + (dy < 0 ? -dy : dy);
}

/// @brief Hash functor so GridPos can key unordered containers.
/// @ingroup core_types
struct GridPosHash {
    std::size_t operator()(GridPos p) const noexcept {
        uint64_t packed = (static_cast<uint64_t>(static_cast<uint32_t>(p.x)) << 32U)
                        | static_cast<uint32_t>(p.y);
        return std::hash<uint64_t>{}(packed);
    }
};

// ============================================================================
// Bridge functions: the canonical API for Duration/TimePoint conversion
// ============================================================================

/// @brief Create a Duration from a value in seconds (round to nearest ns).
[[nodiscard]] constexpr Duration duration_from_seconds(double s) noexcept {
    return Duration{Duration::secs_to_ns(s)};
}

/// @brief Create a Duration from a whole number of milliseconds.
[[nodiscard]] constexpr Duration duration_from_milliseconds(int64_t ms) noexcept {
    return Duration{ms * 1'000'000};
}

/// @brief Create a Duration from a raw nanosecond count.
[[nodiscard]] constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept {
    return Duration{ns};
}

/// @brief Convert a Duration to seconds (double).
[[nodiscard]] constexpr double duration_to_seconds(Duration d) noexcept {
    return d.seconds();
}

/// @brief Create a TimePoint from a value in seconds since epoch.
[[nodiscard]] constexpr TimePoint time_from_seconds(double s) noexcept {
    return TimePoint{duration_from_seconds(s)};
}

/// @brief Convert a TimePoint to seconds since epoch (double).
[[nodiscard]] constexpr double time_to_seconds(TimePoint tp) noexcept {
    return tp.time_since_epoch().seconds();
}

/// @brief Scale a Duration by a floating-point factor (round to nearest ns).
[[nodiscard]] constexpr Duration scale_duration(Duration d, double factor) noexcept {
    return duration_from_seconds(d.seconds() * factor);
}

} // namespace staffsim::core
