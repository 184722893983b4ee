#pragma once

#include "data/return_series.hpp"
#include "risk/risk_metrics.hpp"

#include <cstddef>
#include <string>

namespace riskmetrics {
namespace backtest {

/**
 * @class BacktestWindowResampler
 * @brief Re-derives risk metrics over a leading window of a return series.
 *
 * The window starts at the first row and spans duration_months calendar
 * months. Its end is snapped to the row date nearest to
 * first_date + duration_months; when two rows are equally near, the
 * earlier one is used.
 *
 * A duration whose nominal end falls after the last row is rejected,
 * unless it equals the number of rows in the series (the whole series).
 */
class BacktestWindowResampler {
public:
    BacktestWindowResampler() = default;
    explicit BacktestWindowResampler(risk::RiskMetricsEngine engine);

    /**
     * @brief Metrics over the leading duration_months window.
     * @throws ValidationError if duration_months is not positive, the
     *         series is empty or the duration exceeds the history.
     * @throws ComputationError if the window is too short for statistics.
     */
    risk::RiskMetrics resample(const ReturnSeries& returns, int duration_months) const;

    /**
     * @brief Same as above for a duration that arrived as a real number.
     * @throws ValidationError unless duration_months is a finite positive integer value.
     */
    risk::RiskMetrics resample(const ReturnSeries& returns, double duration_months) const;

    /**
     * @brief The restricted series, without computing metrics.
     */
    ReturnSeries window(const ReturnSeries& returns, int duration_months) const;

    /**
     * @brief Nominal window end: first row date plus duration_months months.
     */
    static std::string nominal_end_date(const ReturnSeries& returns, int duration_months);

    /**
     * @brief Index of the row whose date is nearest to target_date.
     *
     * Distance is measured in days. Ties go to the earlier row.
     * @throws ValidationError if the series is empty.
     */
    static std::size_t closest_row(const ReturnSeries& returns, const std::string& target_date);

    const risk::RiskMetricsEngine& engine() const { return engine_; }

private:
    risk::RiskMetricsEngine engine_;
};

} // namespace backtest
} // namespace riskmetrics
