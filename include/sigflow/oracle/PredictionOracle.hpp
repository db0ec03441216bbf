#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace sigflow::oracle {

// Next-close forecaster. predict() receives the most recent closes, oldest
// first; fewer than windowSize() closes yields no prediction.
class PredictionOracle {
public:
  PredictionOracle() = default;
  virtual ~PredictionOracle() = default;

  PredictionOracle(const PredictionOracle&) = delete;
  PredictionOracle& operator=(const PredictionOracle&) = delete;

  virtual size_t windowSize() const = 0;
  virtual std::optional<double> predict(const std::vector<double>& closes) = 0;
};

} // namespace sigflow::oracle
