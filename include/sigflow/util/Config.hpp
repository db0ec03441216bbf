#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sigflow {
namespace util {

class Config {
public:
  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if file read successfully (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Apply a single key=value pair. Returns false for unknown keys.
  bool apply(const std::string& key, const std::string& val);

  // Clamp/repair values after loading.
  void sanitize();

  // --- Bars ---
  int64_t baseIntervalMs = 60000;   // 1 minute base bars
  int     historyMax     = 3500;    // rolling window of sealed base bars

  // Timeframe labels analysed on every bar close ("Nm" / "Nh").
  std::vector<std::string> timeframes{"5m", "15m", "30m", "45m", "1h"};

  // --- Scoring / resolution ---
  double  signalThreshold   = 70.0;
  double  winPayout         = 0.85;
  double  lossPayout        = -1.0;
  int64_t resolveIntervalMs = 1000;
  uint64_t signalIdSeed     = 0;    // first id is seed+1
  int     signalHistoryMax  = 1000; // resolved signals kept in the snapshot

  // --- Prediction oracle ---
  bool    oracleEnabled   = true;
  int     oracleTimeoutMs = 50;
  int     oracleWindow    = 30;
  int     workerThreads   = 2;

  // --- TA params ---
  int    taMACD_fast   = 12;   // fast EMA period
  int    taMACD_slow   = 26;   // slow EMA period
  int    taMACD_signal = 9;
  int    taEMA_trend   = 200;
  int    taBBands_n    = 20;   // lookback
  double taBBands_stdK = 2.0;  // width in standard deviations
  int    taADX_n       = 14;
  int    taRSI_n       = 14;

  // --- Logging / metrics ---
  std::string logLevel = "info";
  bool        logJson  = false;
  std::string logFile;            // empty -> stdout
  unsigned    metricsIntervalSec = 0;   // 0 -> reporter disabled

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static std::string trim(const std::string& s);
  static bool parseBool(const std::string& v);
  static std::vector<std::string> splitList(const std::string& v);
};

} // namespace util
} // namespace sigflow
