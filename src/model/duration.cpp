/**
 * @file duration.cpp
 * @brief PERT, parametric distributions and the numeric helpers behind them.
 */

#include "model/duration.hpp"

#include <algorithm>
#include <cmath>

namespace uras {

namespace stats {

namespace {

constexpr int kMaxFractionTerms = 300;
constexpr double kFractionEps = 1e-14;
constexpr double kTiny = 1e-300;
constexpr int kBisectionSteps = 200;

/// Continued fraction for I_x(a, b) by the modified Lentz method.
double beta_continued_fraction(double a, double b, double x) {
    const double qab = a + b;
    const double qap = a + 1.0;
    const double qam = a - 1.0;

    double c = 1.0;
    double d = 1.0 - qab * x / qap;
    if (std::fabs(d) < kTiny) d = kTiny;
    d = 1.0 / d;
    double h = d;

    for (int m = 1; m <= kMaxFractionTerms; ++m) {
        const double m2 = 2.0 * m;

        double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
        d = 1.0 + aa * d;
        if (std::fabs(d) < kTiny) d = kTiny;
        c = 1.0 + aa / c;
        if (std::fabs(c) < kTiny) c = kTiny;
        d = 1.0 / d;
        h *= d * c;

        aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
        d = 1.0 + aa * d;
        if (std::fabs(d) < kTiny) d = kTiny;
        c = 1.0 + aa / c;
        if (std::fabs(c) < kTiny) c = kTiny;
        d = 1.0 / d;
        const double delta = d * c;
        h *= delta;
        if (std::fabs(delta - 1.0) < kFractionEps) break;
    }
    return h;
}

}  // anonymous namespace

double incomplete_beta(double x, double a, double b) {
    if (x <= 0.0) return 0.0;
    if (x >= 1.0) return 1.0;

    const double log_front = std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b)
                           + a * std::log(x) + b * std::log1p(-x);
    const double front = std::exp(log_front);

    if (x < (a + 1.0) / (a + b + 2.0)) {
        return front * beta_continued_fraction(a, b, x) / a;
    }
    return 1.0 - front * beta_continued_fraction(b, a, 1.0 - x) / b;
}

double inverse_incomplete_beta(double q, double a, double b) {
    if (q <= 0.0) return 0.0;
    if (q >= 1.0) return 1.0;

    double lo = 0.0;
    double hi = 1.0;
    for (int i = 0; i < kBisectionSteps; ++i) {
        const double mid = 0.5 * (lo + hi);
        if (incomplete_beta(mid, a, b) < q) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return hi;
}

double normal_quantile(double q) {
    q = std::clamp(q, 1e-12, 1.0 - 1e-12);

    constexpr double c0 = 2.515517;
    constexpr double c1 = 0.802853;
    constexpr double c2 = 0.010328;
    constexpr double d1 = 1.432788;
    constexpr double d2 = 0.189269;
    constexpr double d3 = 0.001308;

    const bool lower = q < 0.5;
    const double tail = lower ? q : 1.0 - q;
    const double t = std::sqrt(-2.0 * std::log(tail));
    const double z = t - (c0 + c1 * t + c2 * t * t) / (1.0 + d1 * t + d2 * t * t + d3 * t * t * t);
    return lower ? -z : z;
}

double normal_cdf(double z) {
    return 0.5 * std::erfc(-z / std::sqrt(2.0));
}

}  // namespace stats

// ─────────────────────────────────────────────
// PertEstimate
// ─────────────────────────────────────────────

Result<PertEstimate> PertEstimate::create(TimeMs optimistic, TimeMs most_likely, TimeMs pessimistic) {
    if (optimistic < 0) {
        return Error{ErrorKind::InvalidSpec, "PERT optimistic estimate is negative"};
    }
    if (!(optimistic <= most_likely && most_likely <= pessimistic)) {
        return Error{ErrorKind::InvalidSpec,
                     "PERT estimate must satisfy optimistic <= most_likely <= pessimistic, got ("
                     + std::to_string(optimistic) + ", " + std::to_string(most_likely) + ", "
                     + std::to_string(pessimistic) + ")"};
    }
    return PertEstimate(optimistic, most_likely, pessimistic);
}

Result<PertEstimate> PertEstimate::from_variance(TimeMs base, double ratio) {
    if (!std::isfinite(ratio) || ratio < 0.0) {
        return Error{ErrorKind::InvalidSpec, "PERT variance ratio must be finite and >= 0"};
    }
    auto spread = static_cast<TimeMs>(static_cast<double>(base) * ratio);
    return create(base - spread, base, base + spread);
}

Result<PertEstimate> PertEstimate::symmetric(TimeMs most_likely, TimeMs spread) {
    return create(most_likely - spread, most_likely, most_likely + spread);
}

double PertEstimate::mean_ms() const noexcept {
    return (static_cast<double>(optimistic_) + 4.0 * static_cast<double>(most_likely_)
            + static_cast<double>(pessimistic_)) / 6.0;
}

double PertEstimate::std_dev_ms() const noexcept {
    return static_cast<double>(pessimistic_ - optimistic_) / 6.0;
}

double PertEstimate::variance_ms() const noexcept {
    const double sd = std_dev_ms();
    return sd * sd;
}

double PertEstimate::alpha() const noexcept {
    if (pessimistic_ == optimistic_) return 1.0;
    return 1.0 + 4.0 * static_cast<double>(most_likely_ - optimistic_)
                     / static_cast<double>(pessimistic_ - optimistic_);
}

double PertEstimate::beta() const noexcept {
    if (pessimistic_ == optimistic_) return 1.0;
    return 1.0 + 4.0 * static_cast<double>(pessimistic_ - most_likely_)
                     / static_cast<double>(pessimistic_ - optimistic_);
}

double PertEstimate::quantile(double q) const {
    if (pessimistic_ == optimistic_) return static_cast<double>(optimistic_);
    q = std::clamp(q, 0.0, 1.0);
    const double range = static_cast<double>(pessimistic_ - optimistic_);
    return static_cast<double>(optimistic_) + range * stats::inverse_incomplete_beta(q, alpha(), beta());
}

double PertEstimate::probability_of_completion(TimeMs d) const {
    if (d < optimistic_) return 0.0;
    if (d >= pessimistic_) return 1.0;
    const double x = static_cast<double>(d - optimistic_)
                   / static_cast<double>(pessimistic_ - optimistic_);
    return stats::incomplete_beta(x, alpha(), beta());
}

TimeMs PertEstimate::p50() const { return static_cast<TimeMs>(std::ceil(quantile(0.50))); }
TimeMs PertEstimate::p85() const { return static_cast<TimeMs>(std::ceil(quantile(0.85))); }
TimeMs PertEstimate::p95() const { return static_cast<TimeMs>(std::ceil(quantile(0.95))); }

// ─────────────────────────────────────────────
// DurationDistribution
// ─────────────────────────────────────────────

Result<DurationDistribution> DurationDistribution::fixed(TimeMs ms) {
    if (ms < 0) {
        return Error{ErrorKind::InvalidSpec, "fixed duration is negative: " + std::to_string(ms)};
    }
    return DurationDistribution(Variant{FixedDuration{ms}});
}

Result<DurationDistribution> DurationDistribution::pert(TimeMs optimistic, TimeMs most_likely,
                                                        TimeMs pessimistic) {
    return PertEstimate::create(optimistic, most_likely, pessimistic)
        .map([](const PertEstimate& e) { return DurationDistribution(e); });
}

Result<DurationDistribution> DurationDistribution::uniform(TimeMs min_ms, TimeMs max_ms) {
    if (min_ms < 0 || max_ms < min_ms) {
        return Error{ErrorKind::InvalidSpec, "uniform duration requires 0 <= min <= max"};
    }
    return DurationDistribution(Variant{UniformDuration{min_ms, max_ms}});
}

Result<DurationDistribution> DurationDistribution::triangular(TimeMs min_ms, TimeMs mode_ms,
                                                              TimeMs max_ms) {
    if (min_ms < 0 || mode_ms < min_ms || max_ms < mode_ms) {
        return Error{ErrorKind::InvalidSpec, "triangular duration requires 0 <= min <= mode <= max"};
    }
    return DurationDistribution(Variant{TriangularDuration{min_ms, mode_ms, max_ms}});
}

Result<DurationDistribution> DurationDistribution::lognormal(double mu, double sigma) {
    if (!std::isfinite(mu) || !std::isfinite(sigma) || sigma < 0.0) {
        return Error{ErrorKind::InvalidSpec, "lognormal duration requires finite mu and sigma >= 0"};
    }
    return DurationDistribution(Variant{LogNormalDuration{mu, sigma}});
}

namespace {

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // anonymous namespace

double DurationDistribution::mean_ms() const {
    return std::visit(Overloaded{
        [](const FixedDuration& d) { return static_cast<double>(d.ms); },
        [](const PertEstimate& d) { return d.mean_ms(); },
        [](const UniformDuration& d) {
            return (static_cast<double>(d.min_ms) + static_cast<double>(d.max_ms)) / 2.0;
        },
        [](const TriangularDuration& d) {
            return (static_cast<double>(d.min_ms) + static_cast<double>(d.mode_ms)
                    + static_cast<double>(d.max_ms)) / 3.0;
        },
        [](const LogNormalDuration& d) { return std::exp(d.mu + d.sigma * d.sigma / 2.0); },
    }, dist_);
}

double DurationDistribution::quantile_ms(double q) const {
    q = std::clamp(q, 0.0, 1.0);
    return std::visit(Overloaded{
        [](const FixedDuration& d) { return static_cast<double>(d.ms); },
        [q](const PertEstimate& d) { return d.quantile(q); },
        [q](const UniformDuration& d) {
            return static_cast<double>(d.min_ms) + q * static_cast<double>(d.max_ms - d.min_ms);
        },
        [q](const TriangularDuration& d) {
            const double a = static_cast<double>(d.min_ms);
            const double c = static_cast<double>(d.mode_ms);
            const double b = static_cast<double>(d.max_ms);
            if (b == a) return a;
            const double split = (c - a) / (b - a);
            if (q < split) return a + std::sqrt(q * (b - a) * (c - a));
            return b - std::sqrt((1.0 - q) * (b - a) * (b - c));
        },
        [q](const LogNormalDuration& d) {
            return std::exp(d.mu + d.sigma * stats::normal_quantile(q));
        },
    }, dist_);
}

std::string_view DurationDistribution::kind() const noexcept {
    return std::visit(Overloaded{
        [](const FixedDuration&) { return std::string_view{"fixed"}; },
        [](const PertEstimate&) { return std::string_view{"pert"}; },
        [](const UniformDuration&) { return std::string_view{"uniform"}; },
        [](const TriangularDuration&) { return std::string_view{"triangular"}; },
        [](const LogNormalDuration&) { return std::string_view{"lognormal"}; },
    }, dist_);
}

// ─────────────────────────────────────────────
// DurationSpec
// ─────────────────────────────────────────────

namespace {

TimeMs ceil_ms(double value) {
    if (!(value > 0.0)) return 0;
    return static_cast<TimeMs>(std::ceil(value - 1e-9));
}

}  // anonymous namespace

DurationSpec DurationSpec::fixed_ms(TimeMs ms) {
    DurationSpec spec;
    spec.processing = DurationDistribution::fixed(ms).value_or(DurationDistribution{});
    return spec;
}

TimeMs DurationSpec::nominal_processing_ms(const EstimatePolicy& policy) const {
    const double value = policy.mode == EstimateMode::Mean
        ? processing.mean_ms()
        : processing.quantile_ms(policy.level);
    return ceil_ms(value);
}

TimeMs DurationSpec::nominal_total_ms(const EstimatePolicy& policy) const {
    return setup_ms + nominal_processing_ms(policy) + teardown_ms;
}

Result<void> DurationSpec::validate() const {
    if (setup_ms < 0 || teardown_ms < 0) {
        return Error{ErrorKind::InvalidSpec, "setup and teardown durations must be >= 0"};
    }
    return {};
}

TimeMs effective_duration(TimeMs processing_ms, TimeMs setup_ms,
                          TimeMs teardown_ms, double efficiency) noexcept {
    const double scaled = static_cast<double>(processing_ms) / efficiency;
    return setup_ms + ceil_ms(scaled) + teardown_ms;
}

}  // namespace uras
