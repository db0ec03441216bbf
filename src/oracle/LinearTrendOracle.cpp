#include "sigflow/oracle/LinearTrendOracle.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sigflow::oracle {

LinearTrendOracle::LinearTrendOracle(size_t window)
  : window_(window)
{
  if (window_ < 2) throw std::invalid_argument("LinearTrendOracle window must be >= 2");
}

std::optional<double> LinearTrendOracle::predict(const std::vector<double>& closes) {
  if (closes.size() < window_) return std::nullopt;

  const size_t start = closes.size() - window_;
  auto first = closes.begin() + static_cast<std::ptrdiff_t>(start);
  const auto [mnIt, mxIt] = std::minmax_element(first, closes.end());
  const double mn = *mnIt;
  double range = *mxIt - mn;
  if (!std::isfinite(range)) return std::nullopt;
  if (range == 0.0) range = kRangeEpsilon;

  // x = 0..n-1, y = normalised close
  const double n = static_cast<double>(window_);
  double sx = 0.0, sy = 0.0, sxx = 0.0, sxy = 0.0;
  for (size_t i = 0; i < window_; ++i) {
    const double x = static_cast<double>(i);
    const double y = (closes[start + i] - mn) / range;
    sx += x; sy += y; sxx += x * x; sxy += x * y;
  }
  const double denom = n * sxx - sx * sx;
  const double slope = denom != 0.0 ? (n * sxy - sx * sy) / denom : 0.0;
  const double icept = (sy - slope * sx) / n;

  const double yNext = icept + slope * n;
  const double out = yNext * range + mn;
  if (!std::isfinite(out)) return std::nullopt;
  return out;
}

} // namespace sigflow::oracle
