#pragma once

#include "sigflow/oracle/PredictionOracle.hpp"

namespace sigflow::oracle {

// Min-max normalises the last windowSize() closes, fits a least-squares
// line through them and extrapolates one step, then maps back to price.
class LinearTrendOracle final : public PredictionOracle {
public:
  static constexpr double kRangeEpsilon = 1e-10;

  explicit LinearTrendOracle(size_t window = 30);

  size_t windowSize() const override { return window_; }
  std::optional<double> predict(const std::vector<double>& closes) override;

private:
  size_t window_;
};

} // namespace sigflow::oracle
