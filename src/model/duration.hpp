/**
 * @file duration.hpp
 * @brief Duration model: PERT three-point estimates and parametric
 *        distributions with analytic mean and quantile.
 *
 * PERT quantiles follow the Beta-PERT distribution on [o, p] with shape
 * α = 1 + 4(m−o)/(p−o), β = 1 + 4(p−m)/(p−o). The regularized incomplete beta
 * function is evaluated by continued fraction and inverted by bisection, so
 * results are deterministic and monotone in q.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string_view>
#include <variant>

namespace uras {

// ─────────────────────────────────────────────
// Numeric helpers
// ─────────────────────────────────────────────

namespace stats {

/// Regularized incomplete beta function I_x(a, b), x clamped to [0, 1].
[[nodiscard]] double incomplete_beta(double x, double a, double b);

/// Smallest x in [0, 1] with I_x(a, b) >= q.
[[nodiscard]] double inverse_incomplete_beta(double q, double a, double b);

/// Standard normal quantile (Abramowitz & Stegun 26.2.23).
[[nodiscard]] double normal_quantile(double q);

/// Standard normal CDF.
[[nodiscard]] double normal_cdf(double z);

}  // namespace stats

// ─────────────────────────────────────────────
// PertEstimate
// ─────────────────────────────────────────────

class PertEstimate {
public:
    /// InvalidSpec unless 0 <= optimistic <= most_likely <= pessimistic.
    static Result<PertEstimate> create(TimeMs optimistic, TimeMs most_likely, TimeMs pessimistic);

    /// base ± base·ratio.
    static Result<PertEstimate> from_variance(TimeMs base, double ratio);
    /// most_likely ± spread.
    static Result<PertEstimate> symmetric(TimeMs most_likely, TimeMs spread);

    [[nodiscard]] TimeMs optimistic() const noexcept { return optimistic_; }
    [[nodiscard]] TimeMs most_likely() const noexcept { return most_likely_; }
    [[nodiscard]] TimeMs pessimistic() const noexcept { return pessimistic_; }

    /// (o + 4m + p) / 6
    [[nodiscard]] double mean_ms() const noexcept;
    /// (p − o) / 6
    [[nodiscard]] double std_dev_ms() const noexcept;
    [[nodiscard]] double variance_ms() const noexcept;

    [[nodiscard]] double alpha() const noexcept;
    [[nodiscard]] double beta() const noexcept;

    /// Beta-PERT quantile, q clamped to [0, 1].
    [[nodiscard]] double quantile(double q) const;
    /// P(duration <= d).
    [[nodiscard]] double probability_of_completion(TimeMs d) const;

    [[nodiscard]] TimeMs p50() const;
    [[nodiscard]] TimeMs p85() const;
    [[nodiscard]] TimeMs p95() const;

private:
    PertEstimate(TimeMs o, TimeMs m, TimeMs p) : optimistic_(o), most_likely_(m), pessimistic_(p) {}

    TimeMs optimistic_;
    TimeMs most_likely_;
    TimeMs pessimistic_;
};

// ─────────────────────────────────────────────
// DurationDistribution
// ─────────────────────────────────────────────

struct FixedDuration {
    TimeMs ms{0};
};

struct UniformDuration {
    TimeMs min_ms{0};
    TimeMs max_ms{0};
};

struct TriangularDuration {
    TimeMs min_ms{0};
    TimeMs mode_ms{0};
    TimeMs max_ms{0};
};

/// ln(duration_ms) ~ Normal(mu, sigma).
struct LogNormalDuration {
    double mu{0.0};
    double sigma{0.0};
};

class DurationDistribution {
public:
    using Variant = std::variant<FixedDuration, PertEstimate, UniformDuration,
                                 TriangularDuration, LogNormalDuration>;

    static Result<DurationDistribution> fixed(TimeMs ms);
    static Result<DurationDistribution> pert(TimeMs optimistic, TimeMs most_likely, TimeMs pessimistic);
    static Result<DurationDistribution> uniform(TimeMs min_ms, TimeMs max_ms);
    static Result<DurationDistribution> triangular(TimeMs min_ms, TimeMs mode_ms, TimeMs max_ms);
    static Result<DurationDistribution> lognormal(double mu, double sigma);

    /// Fixed zero duration.
    DurationDistribution() : dist_(FixedDuration{}) {}
    DurationDistribution(PertEstimate estimate) : dist_(estimate) {}  // NOLINT(implicit)

    [[nodiscard]] double mean_ms() const;
    [[nodiscard]] double quantile_ms(double q) const;
    [[nodiscard]] std::string_view kind() const noexcept;
    [[nodiscard]] const Variant& variant() const noexcept { return dist_; }

private:
    explicit DurationDistribution(Variant dist) : dist_(std::move(dist)) {}

    Variant dist_;
};

// ─────────────────────────────────────────────
// Estimate policy & DurationSpec
// ─────────────────────────────────────────────

enum class EstimateMode : uint8_t {
    Mean,
    Quantile
};

/**
 * @brief Which single value of a distribution the schedulers plan with.
 */
struct EstimatePolicy {
    EstimateMode mode = EstimateMode::Mean;
    double level = 0.95;     ///< Used when mode == Quantile
};

/**
 * @brief Duration of one activity: processing distribution plus fixed
 *        setup and teardown.
 *
 * Resource efficiency scales only the processing part.
 */
struct DurationSpec {
    DurationDistribution processing;
    TimeMs setup_ms{0};
    TimeMs teardown_ms{0};

    static DurationSpec fixed_ms(TimeMs ms);

    /// Processing time resolved under the policy, rounded up to whole ms.
    [[nodiscard]] TimeMs nominal_processing_ms(const EstimatePolicy& policy) const;
    /// Setup + resolved processing + teardown, at efficiency 1.
    [[nodiscard]] TimeMs nominal_total_ms(const EstimatePolicy& policy) const;

    [[nodiscard]] Result<void> validate() const;
};

/// ceil(processing / efficiency) + setup + teardown.
[[nodiscard]] TimeMs effective_duration(TimeMs processing_ms, TimeMs setup_ms,
                                        TimeMs teardown_ms, double efficiency) noexcept;

}  // namespace uras
