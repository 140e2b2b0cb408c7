#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <compare>
#include <ctime>
#include <functional>
#include <sstream>
#include <iomanip>

namespace quire {

/**
 * Id - a strongly typed 64-bit record identifier.
 *
 * Identifiers are time-derived (milliseconds) and only unique within
 * one collection. The tag parameter keeps note and notetype ids apart.
 */
template<typename Tag>
class Id {
public:
    constexpr Id() noexcept : value_(0) {}
    explicit constexpr Id(int64_t value) noexcept : value_(value) {}

    [[nodiscard]] constexpr int64_t value() const noexcept {
        return value_;
    }

    [[nodiscard]] constexpr bool is_unset() const noexcept {
        return value_ == 0;
    }

    [[nodiscard]] std::string to_string() const {
        return std::to_string(value_);
    }

    auto operator<=>(const Id&) const = default;
    bool operator==(const Id&) const = default;

private:
    int64_t value_;
};

struct NoteIdTag {};
struct NotetypeIdTag {};

using NoteId = Id<NoteIdTag>;
using NotetypeId = Id<NotetypeIdTag>;

/**
 * Usn - update sequence number.
 *
 * Marks the sync generation in which a record was last touched; -1 means
 * "changed locally, not yet synced".
 */
struct Usn {
    int32_t value{-1};

    auto operator<=>(const Usn&) const = default;
    bool operator==(const Usn&) const = default;
};

/**
 * TimestampSecs - seconds since the Unix epoch.
 *
 * Modification times of notes and notetypes use second resolution.
 */
class TimestampSecs {
public:
    using Duration = std::chrono::seconds;
    using Clock = std::chrono::system_clock;

    constexpr TimestampSecs() noexcept : secs_(0) {}
    explicit constexpr TimestampSecs(int64_t secs) noexcept : secs_(secs) {}

    [[nodiscard]] static TimestampSecs now() {
        return TimestampSecs(std::chrono::duration_cast<Duration>(
            Clock::now().time_since_epoch()).count());
    }

    [[nodiscard]] constexpr int64_t secs() const noexcept {
        return secs_;
    }

    /**
     * Format as ISO 8601 (UTC).
     */
    [[nodiscard]] std::string to_iso_string() const {
        auto time_t = static_cast<std::time_t>(secs_);
        std::ostringstream oss;
        oss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    auto operator<=>(const TimestampSecs&) const = default;
    bool operator==(const TimestampSecs&) const = default;

    TimestampSecs operator+(Duration d) const {
        return TimestampSecs(secs_ + d.count());
    }

    TimestampSecs operator-(Duration d) const {
        return TimestampSecs(secs_ - d.count());
    }

private:
    int64_t secs_;
};

/**
 * Milliseconds since the epoch; the seed for freshly allocated ids.
 */
[[nodiscard]] int64_t now_millis();

/**
 * Generate a new random note GUID (base91 text of a random 64-bit value).
 */
[[nodiscard]] std::string generate_guid();

} // namespace quire

namespace std {
    template<typename Tag>
    struct hash<quire::Id<Tag>> {
        size_t operator()(const quire::Id<Tag>& id) const noexcept {
            return std::hash<int64_t>{}(id.value());
        }
    };
}
