#pragma once

#include "core/result.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>

namespace quire::import {

enum class ImportStage {
    Notetypes,
    Notes
};

struct ImportProgress {
    ImportStage stage{ImportStage::Notes};
    size_t count{0};

    bool operator==(const ImportProgress&) const = default;
};

/**
 * Receives progress updates; returning false asks for the session to stop.
 */
using ProgressCallback = std::function<bool(const ImportProgress&)>;

/**
 * ThrottlingProgressHandler - forwards progress to a callback at most once
 * per interval.
 *
 * The callback's answer is only seen when it is actually called, so a
 * cancellation takes effect at the next forwarded update.
 */
class ThrottlingProgressHandler {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{100};

    explicit ThrottlingProgressHandler(ProgressCallback callback,
                                       std::chrono::milliseconds interval = DEFAULT_INTERVAL);

    /**
     * Report progress. With `throttle` false the callback is always called.
     * Fails with Interrupted if the callback returns false.
     */
    [[nodiscard]] Result<void, Error> update(const ImportProgress& progress, bool throttle = true);

    [[nodiscard]] size_t forwarded() const { return forwarded_; }

private:
    ProgressCallback callback_;
    std::chrono::milliseconds interval_;
    std::optional<Clock::time_point> last_forwarded_;
    size_t forwarded_{0};
};

/**
 * Incrementor - counts processed items of one stage and reports each step
 * through a ThrottlingProgressHandler.
 */
class Incrementor {
public:
    Incrementor(ThrottlingProgressHandler& handler, ImportStage stage)
        : handler_(handler), stage_(stage) {}

    [[nodiscard]] Result<void, Error> increment();

    [[nodiscard]] size_t count() const { return count_; }

private:
    ThrottlingProgressHandler& handler_;
    ImportStage stage_;
    size_t count_{0};
};

} // namespace quire::import
