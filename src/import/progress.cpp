#include "import/progress.hpp"

namespace quire::import {

ThrottlingProgressHandler::ThrottlingProgressHandler(ProgressCallback callback,
                                                     std::chrono::milliseconds interval)
    : callback_(std::move(callback)), interval_(interval) {}

Result<void, Error> ThrottlingProgressHandler::update(const ImportProgress& progress, bool throttle) {
    const auto now = Clock::now();
    if (throttle && last_forwarded_ && now - *last_forwarded_ < interval_) {
        return Result<void, Error>::ok();
    }
    last_forwarded_ = now;
    ++forwarded_;

    if (callback_ && !callback_(progress)) {
        return Result<void, Error>::err(Error::interrupted());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Incrementor::increment() {
    ++count_;
    return handler_.update(ImportProgress{.stage = stage_, .count = count_});
}

} // namespace quire::import
