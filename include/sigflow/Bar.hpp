#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace sigflow {

struct MacdValue {
  double line   = 0.0;
  double signal = 0.0;
  double hist   = 0.0;
};

struct BollingerValue {
  double upper  = 0.0;
  double middle = 0.0;
  double lower  = 0.0;
};

// One interval's OHLCV summary. Indicator fields stay empty until the
// history behind the bar is long enough to compute them.
struct Bar {
  double  open   = 0.0;
  double  high   = 0.0;
  double  low    = 0.0;
  double  close  = 0.0;
  double  volume = 0.0;
  int64_t timestamp = 0;   // epoch ms, start of the interval

  std::optional<double>         ema200;
  std::optional<MacdValue>      macd;
  std::optional<BollingerValue> bollinger;
  std::optional<double>         atr;
  std::optional<double>         adx;
  std::optional<double>         rsi;

  void clearIndicators() {
    ema200.reset();
    macd.reset();
    bollinger.reset();
    atr.reset();
    adx.reset();
    rsi.reset();
  }

  bool wellFormed() const noexcept {
    return low <= high && low <= open && low <= close && open <= high && close <= high && volume >= 0.0;
  }
};

using BarSeries = std::vector<Bar>;

inline Bar makeBar(int64_t ts, double open, double high, double low, double close, double volume = 0.0) {
  Bar b;
  b.timestamp = ts;
  b.open = open; b.high = high; b.low = low; b.close = close;
  b.volume = volume;
  return b;
}

} // namespace sigflow
