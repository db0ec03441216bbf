#pragma once

#include <vector>

#include "sigflow/Bar.hpp"

namespace sigflow {
namespace util { class Config; }

namespace ta {

struct IndicatorParams {
  int    macdFast   = 12;
  int    macdSlow   = 26;
  int    macdSignal = 9;
  int    emaTrend   = 200;
  int    bbPeriod   = 20;
  double bbMult     = 2.0;
  int    adxPeriod  = 14;
  int    rsiPeriod  = 14;

  static IndicatorParams fromConfig(const util::Config& cfg);
};

/**
 * Annotate every bar with indicators in one causal pass: the values stored on
 * bar i depend only on bars [0..i]. Existing indicator fields are overwritten.
 *
 * Availability (0-based bar index i):
 *   ema200      i >= 0
 *   atr         i >= 1
 *   rsi         i >= rsiPeriod
 *   bollinger   i >= bbPeriod - 1
 *   macd        i >= macdSlow
 *   adx         i >  2 * adxPeriod
 */
void computeIndicators(std::vector<Bar>& bars, const IndicatorParams& p = {});

} // namespace ta
} // namespace sigflow
