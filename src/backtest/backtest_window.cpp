#include "backtest/backtest_window.hpp"
#include "common/date_utils.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace riskmetrics {
namespace backtest {

static void validate_duration(int duration_months) {
    if (duration_months <= 0) {
        throw ValidationError("Duration must be a positive integer. Currently of value " +
                              std::to_string(duration_months));
    }
}

BacktestWindowResampler::BacktestWindowResampler(risk::RiskMetricsEngine engine)
    : engine_(std::move(engine)) {}

risk::RiskMetrics BacktestWindowResampler::resample(const ReturnSeries& returns, int duration_months) const {
    ReturnSeries durated = window(returns, duration_months);
    return engine_.compute(durated);
}

risk::RiskMetrics BacktestWindowResampler::resample(const ReturnSeries& returns, double duration_months) const {
    if (!std::isfinite(duration_months) || duration_months != std::floor(duration_months) ||
        duration_months <= 0.0) {
        std::ostringstream oss;
        oss << "Duration must be a positive integer. Currently of value " << duration_months;
        throw ValidationError(oss.str());
    }
    if (duration_months > std::numeric_limits<int>::max()) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(0)
            << "Duration exceeds the length of the returns series: " << duration_months << " months";
        throw ValidationError(oss.str());
    }
    return resample(returns, static_cast<int>(duration_months));
}

ReturnSeries BacktestWindowResampler::window(const ReturnSeries& returns, int duration_months) const {
    validate_duration(duration_months);
    if (returns.empty()) {
        throw ValidationError("Cannot resample an empty return series");
    }

    const std::string end_date = nominal_end_date(returns, duration_months);

    // Exceeding the history is tolerated only for a duration covering every row
    if (returns.last_date() < end_date &&
        static_cast<std::size_t>(duration_months) != returns.num_periods()) {
        throw ValidationError("Duration exceeds the length of the returns series: " +
                              std::to_string(duration_months) + " months from " + returns.first_date() +
                              " ends " + end_date + ", after the last period " + returns.last_date());
    }

    std::size_t closest = closest_row(returns, end_date);

    spdlog::debug("Backtest window of {} months: nominal end {}, snapped to {} ({} of {} periods)",
                  duration_months, end_date, returns.dates()[closest], closest + 1, returns.num_periods());

    return returns.head(closest + 1);
}

std::string BacktestWindowResampler::nominal_end_date(const ReturnSeries& returns, int duration_months) {
    validate_duration(duration_months);
    if (returns.empty()) {
        throw ValidationError("Cannot resample an empty return series");
    }
    try {
        return dates::add_months(returns.first_date(), duration_months);
    } catch (const std::invalid_argument& e) {
        throw ValidationError("Duration exceeds the length of the returns series: " +
                              std::to_string(duration_months) + " months from " + returns.first_date() +
                              ". " + e.what());
    }
}

std::size_t BacktestWindowResampler::closest_row(const ReturnSeries& returns, const std::string& target_date) {
    if (returns.empty()) {
        throw ValidationError("Cannot search an empty return series");
    }

    const long long target = dates::days_since_epoch(target_date);
    const auto& row_dates = returns.dates();

    std::size_t best = 0;
    long long best_distance = std::llabs(dates::days_since_epoch(row_dates[0]) - target);

    // Dates ascend, so a strict comparison keeps the earlier row on ties
    for (std::size_t i = 1; i < row_dates.size(); ++i) {
        long long distance = std::llabs(dates::days_since_epoch(row_dates[i]) - target);
        if (distance < best_distance) {
            best = i;
            best_distance = distance;
        }
    }

    return best;
}

} // namespace backtest
} // namespace riskmetrics
