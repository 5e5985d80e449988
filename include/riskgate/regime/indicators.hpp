#pragma once

#include <vector>

namespace riskgate {
namespace indicators {

/**
 * Technical indicators over column vectors, one entry per bar.
 *
 * Warm-up positions hold NaN. Smoothers follow the recursive
 * (non-adjusted) exponential form: y[0] = x[0], y[t] = a*x[t] + (1-a)*y[t-1].
 */

/**
 * @brief Exponential moving average with span `period` (alpha = 2 / (period + 1))
 */
std::vector<double> ema(const std::vector<double>& series, int period);

/**
 * @brief Simple moving average over a full window
 */
std::vector<double> sma(const std::vector<double>& series, int period);

/**
 * @brief Rolling sample standard deviation (n - 1) over a full window
 */
std::vector<double> rolling_std(const std::vector<double>& series, int period);

/**
 * @brief Wilder smoothing, alpha = 1 / period
 *
 * Output is NaN until `min_periods` valid inputs were seen. A NaN input
 * carries the previous value forward.
 */
std::vector<double> wilder_smooth(const std::vector<double>& series, int period, int min_periods);

/**
 * @brief Average Directional Index (0-100)
 */
std::vector<double> adx(const std::vector<double>& high, const std::vector<double>& low,
                        const std::vector<double>& close, int period = 14);

/**
 * @brief Bollinger band width relative to the middle band: (upper - lower) / mid
 */
std::vector<double> bollinger_width(const std::vector<double>& close, int period = 20,
                                    double std_dev = 2.0);

/**
 * @brief Rolling percentile rank (0-100) of each value within its trailing window
 *
 * Rank = count of window values <= the current value over the window length.
 * NaN entries count toward the length but never toward the rank. Windows at
 * the start of the series are partial; fewer than `min_periods` valid values
 * yields NaN.
 */
std::vector<double> rolling_percentile_rank(const std::vector<double>& series, int window,
                                            int min_periods);

/**
 * @brief Rolling max / min over up to `window` trailing values (partial windows allowed)
 */
std::vector<double> rolling_max(const std::vector<double>& series, int window);
std::vector<double> rolling_min(const std::vector<double>& series, int window);

}  // namespace indicators
}  // namespace riskgate
