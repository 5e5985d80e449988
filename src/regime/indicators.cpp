#include "riskgate/regime/indicators.hpp"
#include <algorithm>
#include <cmath>
#include "riskgate/core/math_utils.hpp"

namespace riskgate {
namespace indicators {

using core::kNaN;

std::vector<double> ema(const std::vector<double>& series, int period) {
    std::vector<double> out(series.size(), kNaN);
    const double alpha = 2.0 / (static_cast<double>(period) + 1.0);
    double prev = kNaN;
    for (size_t i = 0; i < series.size(); ++i) {
        double x = series[i];
        if (std::isnan(x)) {
            out[i] = prev;
            continue;
        }
        prev = std::isnan(prev) ? x : alpha * x + (1.0 - alpha) * prev;
        out[i] = prev;
    }
    return out;
}

std::vector<double> sma(const std::vector<double>& series, int period) {
    std::vector<double> out(series.size(), kNaN);
    const size_t window = static_cast<size_t>(period);
    if (window == 0) {
        return out;
    }
    for (size_t i = window - 1; i < series.size(); ++i) {
        double sum = 0.0;
        bool valid = true;
        for (size_t k = i + 1 - window; k <= i; ++k) {
            if (std::isnan(series[k])) {
                valid = false;
                break;
            }
            sum += series[k];
        }
        if (valid) {
            out[i] = sum / static_cast<double>(window);
        }
    }
    return out;
}

std::vector<double> rolling_std(const std::vector<double>& series, int period) {
    std::vector<double> out(series.size(), kNaN);
    const size_t window = static_cast<size_t>(period);
    if (window < 2) {
        return out;
    }
    auto mean = sma(series, period);
    for (size_t i = window - 1; i < series.size(); ++i) {
        if (std::isnan(mean[i])) {
            continue;
        }
        double ss = 0.0;
        for (size_t k = i + 1 - window; k <= i; ++k) {
            double d = series[k] - mean[i];
            ss += d * d;
        }
        out[i] = std::sqrt(ss / static_cast<double>(window - 1));
    }
    return out;
}

std::vector<double> wilder_smooth(const std::vector<double>& series, int period,
                                  int min_periods) {
    std::vector<double> out(series.size(), kNaN);
    const double alpha = 1.0 / static_cast<double>(period);
    double prev = kNaN;
    int seen = 0;
    for (size_t i = 0; i < series.size(); ++i) {
        double x = series[i];
        if (!std::isnan(x)) {
            prev = std::isnan(prev) ? x : alpha * x + (1.0 - alpha) * prev;
            ++seen;
        }
        if (seen >= min_periods) {
            out[i] = prev;
        }
    }
    return out;
}

std::vector<double> adx(const std::vector<double>& high, const std::vector<double>& low,
                        const std::vector<double>& close, int period) {
    const size_t n = close.size();
    std::vector<double> plus_dm(n, 0.0);
    std::vector<double> minus_dm(n, 0.0);
    std::vector<double> tr(n, 0.0);

    for (size_t i = 0; i < n; ++i) {
        tr[i] = high[i] - low[i];
        if (i == 0) {
            continue;
        }
        double up = high[i] - high[i - 1];
        double down = low[i - 1] - low[i];
        plus_dm[i] = (up > down && up > 0.0) ? up : 0.0;
        minus_dm[i] = (down > up && down > 0.0) ? down : 0.0;
        tr[i] = std::max({tr[i], std::abs(high[i] - close[i - 1]),
                          std::abs(low[i] - close[i - 1])});
    }

    auto atr = wilder_smooth(tr, period, period);
    auto plus_smooth = wilder_smooth(plus_dm, period, period);
    auto minus_smooth = wilder_smooth(minus_dm, period, period);

    std::vector<double> dx(n, kNaN);
    for (size_t i = 0; i < n; ++i) {
        if (std::isnan(atr[i]) || atr[i] == 0.0) {
            continue;
        }
        double plus_di = 100.0 * plus_smooth[i] / atr[i];
        double minus_di = 100.0 * minus_smooth[i] / atr[i];
        double di_sum = plus_di + minus_di;
        if (di_sum != 0.0) {
            dx[i] = 100.0 * std::abs(plus_di - minus_di) / di_sum;
        }
    }
    return wilder_smooth(dx, period, period);
}

std::vector<double> bollinger_width(const std::vector<double>& close, int period,
                                    double std_dev) {
    auto mid = sma(close, period);
    auto sd = rolling_std(close, period);
    std::vector<double> out(close.size(), kNaN);
    for (size_t i = 0; i < close.size(); ++i) {
        if (std::isnan(mid[i]) || std::isnan(sd[i]) || mid[i] == 0.0) {
            continue;
        }
        out[i] = 2.0 * std_dev * sd[i] / mid[i];
    }
    return out;
}

std::vector<double> rolling_percentile_rank(const std::vector<double>& series, int window,
                                            int min_periods) {
    std::vector<double> out(series.size(), kNaN);
    const size_t w = static_cast<size_t>(std::max(window, 1));
    for (size_t i = 0; i < series.size(); ++i) {
        double current = series[i];
        if (std::isnan(current)) {
            continue;
        }
        size_t start = i + 1 >= w ? i + 1 - w : 0;
        int valid = 0;
        int at_or_below = 0;
        for (size_t k = start; k <= i; ++k) {
            if (std::isnan(series[k])) {
                continue;
            }
            ++valid;
            if (series[k] <= current) {
                ++at_or_below;
            }
        }
        if (valid >= min_periods) {
            out[i] = 100.0 * at_or_below / static_cast<double>(i - start + 1);
        }
    }
    return out;
}

namespace {

template <typename Pick>
std::vector<double> rolling_extreme(const std::vector<double>& series, int window, Pick pick) {
    std::vector<double> out(series.size(), kNaN);
    const size_t w = static_cast<size_t>(std::max(window, 1));
    for (size_t i = 0; i < series.size(); ++i) {
        size_t start = i + 1 >= w ? i + 1 - w : 0;
        double best = kNaN;
        for (size_t k = start; k <= i; ++k) {
            if (std::isnan(series[k])) {
                continue;
            }
            best = std::isnan(best) ? series[k] : pick(best, series[k]);
        }
        out[i] = best;
    }
    return out;
}

}  // namespace

std::vector<double> rolling_max(const std::vector<double>& series, int window) {
    return rolling_extreme(series, window, [](double a, double b) { return std::max(a, b); });
}

std::vector<double> rolling_min(const std::vector<double>& series, int window) {
    return rolling_extreme(series, window, [](double a, double b) { return std::min(a, b); });
}

}  // namespace indicators
}  // namespace riskgate
