/**
 * @file ValidationClock.hpp
 * @brief Time source for validity and freshness checks
 */

#pragma once

#include <chrono>
#include <optional>

namespace epassport::certificatevalidation::domain::model {

/**
 * @brief Check-time policy
 *
 * currentTime() reads the system clock at each check (the default).
 * at(t) pins every check to a caller-supplied reference time, e.g. the
 * document presentation time, for reproducible or backdated verification.
 */
class ValidationClock {
public:
    using TimePoint = std::chrono::system_clock::time_point;

private:
    std::optional<TimePoint> referenceTime_;

    explicit ValidationClock(std::optional<TimePoint> referenceTime)
        : referenceTime_(referenceTime) {}

public:
    static ValidationClock currentTime() {
        return ValidationClock(std::nullopt);
    }

    static ValidationClock at(TimePoint referenceTime) {
        return ValidationClock(referenceTime);
    }

    [[nodiscard]] TimePoint now() const {
        return referenceTime_.value_or(std::chrono::system_clock::now());
    }

    [[nodiscard]] bool isReferenceTime() const noexcept {
        return referenceTime_.has_value();
    }
};

} // namespace epassport::certificatevalidation::domain::model
