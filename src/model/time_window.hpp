/**
 * @file time_window.hpp
 * @brief Hard and soft time windows on activity or task execution.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>

namespace uras {

enum class WindowKind : uint8_t {
    Hard,   ///< Violation makes the schedule infeasible
    Soft    ///< Violation adds weight × overage to the penalty
};

/**
 * @brief Optional earliest start and latest finish for an execution span.
 *
 * Schedulers treat the earliest start as a release time, so in produced
 * schedules only the late part of the overage can be non-zero.
 */
class TimeWindow {
public:
    /// No bounds at all.
    TimeWindow() = default;

    /// Validated construction; finish < start is InvalidSpec.
    static Result<TimeWindow> create(std::optional<TimeMs> earliest_start,
                                     std::optional<TimeMs> latest_finish,
                                     WindowKind kind = WindowKind::Hard,
                                     double penalty_per_ms = 0.0);

    static TimeWindow unbounded() { return TimeWindow{}; }
    static TimeWindow deadline(TimeMs latest_finish);
    static TimeWindow release(TimeMs earliest_start);
    static Result<TimeWindow> bounded(TimeMs earliest_start, TimeMs latest_finish);

    /// Copy of this window turned soft with the given penalty per ms.
    [[nodiscard]] TimeWindow soft(double penalty_per_ms) const;
    [[nodiscard]] TimeWindow hard() const;

    [[nodiscard]] std::optional<TimeMs> earliest_start() const noexcept { return earliest_start_; }
    [[nodiscard]] std::optional<TimeMs> latest_finish() const noexcept { return latest_finish_; }
    [[nodiscard]] WindowKind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_hard() const noexcept { return kind_ == WindowKind::Hard; }
    [[nodiscard]] double penalty_per_ms() const noexcept { return penalty_per_ms_; }

    /// Milliseconds started too early plus milliseconds finished too late.
    [[nodiscard]] TimeMs overage_ms(TimeMs start, TimeMs end) const noexcept;
    [[nodiscard]] bool is_violated(TimeMs start, TimeMs end) const noexcept {
        return overage_ms(start, end) > 0;
    }
    /// Soft penalty for the span; always 0 for a hard window.
    [[nodiscard]] double penalty(TimeMs start, TimeMs end) const noexcept;

    /// InvalidSpec when bounds are inverted or the penalty is negative / not finite.
    [[nodiscard]] Result<void> validate() const;

private:
    std::optional<TimeMs> earliest_start_;
    std::optional<TimeMs> latest_finish_;
    WindowKind kind_ = WindowKind::Hard;
    double penalty_per_ms_ = 0.0;
};

}  // namespace uras
