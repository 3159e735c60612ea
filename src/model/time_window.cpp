/**
 * @file time_window.cpp
 * @brief TimeWindow construction and violation arithmetic.
 */

#include "model/time_window.hpp"

#include <cmath>

namespace uras {

Result<TimeWindow> TimeWindow::create(std::optional<TimeMs> earliest_start,
                                      std::optional<TimeMs> latest_finish,
                                      WindowKind kind,
                                      double penalty_per_ms) {
    TimeWindow window;
    window.earliest_start_ = earliest_start;
    window.latest_finish_ = latest_finish;
    window.kind_ = kind;
    window.penalty_per_ms_ = kind == WindowKind::Soft ? penalty_per_ms : 0.0;

    if (auto valid = window.validate(); !valid) {
        return valid.error();
    }
    return window;
}

TimeWindow TimeWindow::deadline(TimeMs latest_finish) {
    TimeWindow window;
    window.latest_finish_ = latest_finish;
    return window;
}

TimeWindow TimeWindow::release(TimeMs earliest_start) {
    TimeWindow window;
    window.earliest_start_ = earliest_start;
    return window;
}

Result<TimeWindow> TimeWindow::bounded(TimeMs earliest_start, TimeMs latest_finish) {
    return create(earliest_start, latest_finish);
}

TimeWindow TimeWindow::soft(double penalty_per_ms) const {
    TimeWindow copy = *this;
    copy.kind_ = WindowKind::Soft;
    copy.penalty_per_ms_ = penalty_per_ms;
    return copy;
}

TimeWindow TimeWindow::hard() const {
    TimeWindow copy = *this;
    copy.kind_ = WindowKind::Hard;
    copy.penalty_per_ms_ = 0.0;
    return copy;
}

TimeMs TimeWindow::overage_ms(TimeMs start, TimeMs end) const noexcept {
    TimeMs early = 0;
    TimeMs late = 0;
    if (earliest_start_ && start < *earliest_start_) {
        early = *earliest_start_ - start;
    }
    if (latest_finish_ && end > *latest_finish_) {
        late = end - *latest_finish_;
    }
    return early + late;
}

double TimeWindow::penalty(TimeMs start, TimeMs end) const noexcept {
    if (kind_ == WindowKind::Hard) return 0.0;
    return penalty_per_ms_ * static_cast<double>(overage_ms(start, end));
}

Result<void> TimeWindow::validate() const {
    if (earliest_start_ && latest_finish_ && *latest_finish_ < *earliest_start_) {
        return Error{ErrorKind::InvalidSpec,
                     "time window finishes (" + std::to_string(*latest_finish_)
                     + ") before it starts (" + std::to_string(*earliest_start_) + ")"};
    }
    if (!std::isfinite(penalty_per_ms_) || penalty_per_ms_ < 0.0) {
        return Error{ErrorKind::InvalidSpec, "time window penalty must be finite and >= 0"};
    }
    return {};
}

}  // namespace uras
