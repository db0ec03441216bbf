#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <vector>

namespace sigflow::ta {

inline double NaN() { return std::numeric_limits<double>::quiet_NaN(); }
inline bool isFinite(double x) { return std::isfinite(x); }

// Substituted for zero denominators (DI sum, smoothed TR).
constexpr double kEpsilon = 1e-10;
// Substituted for a zero RSI average loss.
constexpr double kRsiLossEpsilon = 1e-7;

// ------- Window aggregations ending at index `end` (inclusive) -------

inline double sma_window(const std::vector<double>& xs, size_t end, size_t N) {
  if (N==0 || end >= xs.size() || end+1 < N) return NaN();
  double s=0.0; for (size_t i=end+1-N; i<=end; ++i) s += xs[i];
  return s / double(N);
}

// Population standard deviation.
inline double stddev_window(const std::vector<double>& xs, size_t end, size_t N) {
  const double mean = sma_window(xs, end, N);
  if (!isFinite(mean)) return NaN();
  double acc=0.0;
  for (size_t i=end+1-N; i<=end; ++i) {
    double d = xs[i] - mean;
    acc += d*d;
  }
  return std::sqrt(acc / double(N));
}

// ------- Recursive smoothers; an empty previous value seeds with x -------

inline double ema_next(std::optional<double> prev, double x, size_t N) {
  if (!prev) return x;
  const double k = 2.0 / (double(N) + 1.0);
  return x * k + *prev * (1.0 - k);
}

// Wilder's moving average.
inline double rma_next(std::optional<double> prev, double x, size_t N) {
  if (!prev || N == 0) return x;
  return (*prev * double(N - 1) + x) / double(N);
}

// ------- Range / direction -------

inline double true_range(double high, double low, double prevClose) {
  return std::max({ high - low, std::abs(high - prevClose), std::abs(low - prevClose) });
}

struct DirectionalMove {
  double plus  = 0.0;
  double minus = 0.0;
};

// Only the dominant, positive move counts.
inline DirectionalMove directional_move(double high, double low, double prevHigh, double prevLow) {
  const double up   = high - prevHigh;
  const double down = prevLow - low;
  DirectionalMove dm;
  dm.plus  = (up > down && up > 0.0) ? up : 0.0;
  dm.minus = (down > up && down > 0.0) ? down : 0.0;
  return dm;
}

inline double rsi_from_averages(double avgGain, double avgLoss) {
  const double rs = avgGain / (avgLoss > 0.0 ? avgLoss : kRsiLossEpsilon);
  return 100.0 - (100.0 / (1.0 + rs));
}

} // namespace sigflow::ta
