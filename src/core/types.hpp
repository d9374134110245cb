#pragma once

#include <string>
#include <chrono>
#include <array>
#include <cstdint>
#include <compare>
#include <random>
#include <sstream>
#include <iomanip>

namespace tether {

/**
 * EntityId - Identifiers are opaque strings assigned by the backing store.
 */
using EntityId = std::string;

/**
 * Uuid - Random (version 4) identifier, used for provisional and
 * adapter-assigned entity ids.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    [[nodiscard]] static Uuid generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        Bytes bytes;
        for (size_t i = 0; i < BYTE_SIZE; i += 8) {
            auto chunk = dist(gen);
            for (size_t j = 0; j < 8; ++j) {
                bytes[i + j] = static_cast<uint8_t>(chunk >> (j * 8));
            }
        }

        bytes[6] = (bytes[6] & 0x0F) | 0x40;
        bytes[8] = (bytes[8] & 0x3F) | 0x80;

        return Uuid(bytes);
    }

    /**
     * Hyphenated lowercase form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] std::string to_string() const {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (size_t i = 0; i < BYTE_SIZE; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                oss << '-';
            }
            oss << std::setw(2) << static_cast<int>(bytes_[i]);
        }
        return oss.str();
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

/**
 * Timestamp - Milliseconds since the Unix epoch.
 *
 * This is the only date-time form the stores operate on; wire values are
 * converted at the port boundary (see WireTimestamp).
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}
    explicit Timestamp(TimePoint tp) noexcept
        : millis_(std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(Duration(millis_));
    }

    [[nodiscard]] std::string to_iso_string() const {
        auto time_t = Clock::to_time_t(to_time_point());
        std::tm utc{};
        gmtime_r(&time_t, &utc);
        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << (millis_ % 1000) << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const { return Timestamp(millis_ + d.count()); }
    Timestamp operator-(Duration d) const { return Timestamp(millis_ - d.count()); }

private:
    int64_t millis_;
};

/**
 * WireTimestamp - Structured timestamp as stored by the document backend
 * (whole seconds plus a nanosecond remainder).
 */
struct WireTimestamp {
    int64_t seconds{0};
    int32_t nanos{0};

    [[nodiscard]] static WireTimestamp from_timestamp(Timestamp ts) {
        auto ms = ts.millis();
        auto secs = ms / 1000;
        auto rem = ms % 1000;
        if (rem < 0) {
            // floor toward negative infinity so nanos stays non-negative
            secs -= 1;
            rem += 1000;
        }
        return WireTimestamp{secs, static_cast<int32_t>(rem * 1'000'000)};
    }

    [[nodiscard]] Timestamp to_timestamp() const {
        return Timestamp(seconds * 1000 + nanos / 1'000'000);
    }

    bool operator==(const WireTimestamp&) const = default;
};

} // namespace tether
