#include "sigflow/ta/IndicatorEngine.hpp"
#include "sigflow/ta/Indicators.hpp"
#include "sigflow/util/Config.hpp"

#include <cmath>
#include <optional>

namespace sigflow::ta {

IndicatorParams IndicatorParams::fromConfig(const util::Config& cfg) {
  IndicatorParams p;
  p.macdFast   = cfg.taMACD_fast;
  p.macdSlow   = cfg.taMACD_slow;
  p.macdSignal = cfg.taMACD_signal;
  p.emaTrend   = cfg.taEMA_trend;
  p.bbPeriod   = cfg.taBBands_n;
  p.bbMult     = cfg.taBBands_stdK;
  p.adxPeriod  = cfg.taADX_n;
  p.rsiPeriod  = cfg.taRSI_n;
  return p;
}

void computeIndicators(std::vector<Bar>& bars, const IndicatorParams& p) {
  const size_t n = bars.size();
  if (n == 0) return;

  const size_t macdFast = static_cast<size_t>(p.macdFast);
  const size_t macdSlow = static_cast<size_t>(p.macdSlow);
  const size_t macdSig  = static_cast<size_t>(p.macdSignal);
  const size_t emaTrend = static_cast<size_t>(p.emaTrend);
  const size_t bbN      = static_cast<size_t>(p.bbPeriod);
  const size_t adxN     = static_cast<size_t>(p.adxPeriod);
  const size_t rsiN     = static_cast<size_t>(p.rsiPeriod);

  std::vector<double> closes;
  closes.reserve(n);
  for (const auto& b : bars) closes.push_back(b.close);

  std::optional<double> emaFast, emaSlow, emaSignal, emaLong;
  std::optional<double> sTR, sPlusDM, sMinusDM, adx;
  std::optional<double> avgGain, avgLoss;

  for (size_t i = 0; i < n; ++i) {
    Bar& bar = bars[i];
    bar.clearIndicators();
    const double close = bar.close;

    // MACD
    emaFast = ema_next(emaFast, close, macdFast);
    emaSlow = ema_next(emaSlow, close, macdSlow);
    if (i >= macdSlow) {
      const double line = *emaFast - *emaSlow;
      emaSignal = ema_next(emaSignal, line, macdSig);
      bar.macd = MacdValue{ line, *emaSignal, line - *emaSignal };
    }

    // Long trend EMA
    emaLong = ema_next(emaLong, close, emaTrend);
    bar.ema200 = *emaLong;

    // Bollinger Bands
    if (bbN > 0 && i + 1 >= bbN) {
      const double mean = sma_window(closes, i, bbN);
      const double sd   = stddev_window(closes, i, bbN);
      bar.bollinger = BollingerValue{ mean + sd * p.bbMult, mean, mean - sd * p.bbMult };
    }

    if (i == 0) continue;
    const Bar& prev = bars[i - 1];

    // ATR / ADX
    const double tr = true_range(bar.high, bar.low, prev.close);
    const DirectionalMove dm = directional_move(bar.high, bar.low, prev.high, prev.low);
    sTR      = rma_next(sTR, tr, adxN);
    sPlusDM  = rma_next(sPlusDM, dm.plus, adxN);
    sMinusDM = rma_next(sMinusDM, dm.minus, adxN);
    bar.atr = *sTR;

    if (i > adxN * 2) {
      const double trDen   = *sTR > 0.0 ? *sTR : kEpsilon;
      const double plusDI  = 100.0 * *sPlusDM / trDen;
      const double minusDI = 100.0 * *sMinusDM / trDen;
      const double diSum   = plusDI + minusDI;
      const double dx      = 100.0 * std::abs(plusDI - minusDI) / (diSum > 0.0 ? diSum : kEpsilon);
      adx = rma_next(adx, dx, adxN);
      bar.adx = *adx;
    }

    // RSI (Wilder): seed from the first rsiN changes, then recurse.
    if (!avgGain) {
      if (rsiN > 0 && i == rsiN) {
        double gains = 0.0, losses = 0.0;
        for (size_t j = 1; j <= rsiN; ++j) {
          const double chg = closes[j] - closes[j - 1];
          if (chg > 0) gains += chg;
          else losses -= chg;
        }
        avgGain = gains / double(rsiN);
        avgLoss = losses / double(rsiN);
      }
    } else {
      const double chg  = close - prev.close;
      const double gain = chg > 0 ? chg : 0.0;
      const double loss = chg < 0 ? -chg : 0.0;
      avgGain = (*avgGain * double(rsiN - 1) + gain) / double(rsiN);
      avgLoss = (*avgLoss * double(rsiN - 1) + loss) / double(rsiN);
    }
    if (avgGain && avgLoss) {
      bar.rsi = rsi_from_averages(*avgGain, *avgLoss);
    }
  }
}

} // namespace sigflow::ta
