#include "sigflow/util/Config.hpp"
#include "sigflow/signal/Timeframe.hpp"
#include "sigflow/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace sigflow {
namespace util {

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  if (k.empty()) return false;
  return true;
}

bool Config::parseBool(const std::string& v) {
  std::string x = v;
  for (auto& c : x) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return x == "1" || x == "true" || x == "yes" || x == "on";
}

std::vector<std::string> Config::splitList(const std::string& v) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : v) {
    if (c == ',') {
      auto t = trim(cur);
      if (!t.empty()) out.push_back(t);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  auto t = trim(cur);
  if (!t.empty()) out.push_back(t);
  return out;
}

bool Config::apply(const std::string& key, const std::string& val) {
  const char* s = val.c_str();

  if      (key == "baseIntervalMs")     baseIntervalMs     = std::atoll(s);
  else if (key == "historyMax")         historyMax         = std::atoi(s);
  else if (key == "timeframes")         timeframes         = splitList(val);
  else if (key == "signalThreshold")    signalThreshold    = std::atof(s);
  else if (key == "winPayout")          winPayout          = std::atof(s);
  else if (key == "lossPayout")         lossPayout         = std::atof(s);
  else if (key == "resolveIntervalMs")  resolveIntervalMs  = std::atoll(s);
  else if (key == "signalIdSeed")       signalIdSeed       = std::strtoull(s, nullptr, 10);
  else if (key == "signalHistoryMax")   signalHistoryMax   = std::atoi(s);
  else if (key == "oracleEnabled")      oracleEnabled      = parseBool(val);
  else if (key == "oracleTimeoutMs")    oracleTimeoutMs    = std::atoi(s);
  else if (key == "oracleWindow")       oracleWindow       = std::atoi(s);
  else if (key == "workerThreads")      workerThreads      = std::atoi(s);
  else if (key == "taMACD_fast")        taMACD_fast        = std::max(1, std::atoi(s));
  else if (key == "taMACD_slow")        taMACD_slow        = std::max(1, std::atoi(s));
  else if (key == "taMACD_signal")      taMACD_signal      = std::max(1, std::atoi(s));
  else if (key == "taEMA_trend")        taEMA_trend        = std::max(1, std::atoi(s));
  else if (key == "taBBands_n")         taBBands_n         = std::max(1, std::atoi(s));
  else if (key == "taBBands_stdK")      taBBands_stdK      = std::atof(s);
  else if (key == "taADX_n")            taADX_n            = std::max(1, std::atoi(s));
  else if (key == "taRSI_n")            taRSI_n            = std::max(1, std::atoi(s));
  else if (key == "logLevel")           logLevel           = val;
  else if (key == "logJson")            logJson            = parseBool(val);
  else if (key == "logFile")            logFile            = val;
  else if (key == "metricsIntervalSec") metricsIntervalSec = static_cast<unsigned>(std::max(0, std::atoi(s)));
  else return false;

  return true;
}

bool Config::loadFromFile(const std::string& path) {
  // Simple INI-ish parser: key=value per line, '#' or ';' start comments.
  // Unknown keys are ignored so new knobs don't break older builds.
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string line;
  line.reserve(1024);
  int lineNo = 0;

  while (true) {
    char tmp[1024];
    if (!std::fgets(tmp, sizeof(tmp), f)) break;
    line.assign(tmp);
    ++lineNo;

    // Strip CR/LF
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    auto s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == ';') continue; // comment

    std::string key, val;
    if (!parseLineKV(s, key, val)) {
      logger().warn("config.line.malformed", {{"path", path}, {"line", std::to_string(lineNo)}});
      continue;
    }

    if (!apply(key, val)) {
      logger().debug("config.key.unknown", {{"key", key}});
    }
  }

  std::fclose(f);
  sanitize();
  return true;
}

void Config::sanitize() {
  if (baseIntervalMs <= 0) baseIntervalMs = 60000;
  if (historyMax < 1) historyMax = 3500;
  if (signalHistoryMax < 1) signalHistoryMax = 1000;

  // Keep only labels that parse and are a whole multiple of the base interval.
  std::vector<std::string> ok;
  for (auto& tf : timeframes) {
    auto ms = signal::parseTimeframeMs(tf);
    if (!ms || ms.value() % baseIntervalMs != 0) {
      logger().warn("config.timeframe.invalid", {{"timeframe", tf}});
      continue;
    }
    if (std::find(ok.begin(), ok.end(), tf) == ok.end()) ok.push_back(tf);
  }
  timeframes = std::move(ok);

  if (signalThreshold <= 0.0) signalThreshold = 70.0;
  if (resolveIntervalMs <= 0) resolveIntervalMs = 1000;
  if (oracleTimeoutMs < 0) oracleTimeoutMs = 0;
  if (oracleWindow < 2) oracleWindow = 30;
  if (workerThreads < 1) workerThreads = 1;

  // Basic sanity: slow >= fast for MACD; stdK positive.
  if (taMACD_slow < taMACD_fast) std::swap(taMACD_slow, taMACD_fast);
  if (taBBands_stdK <= 0.0) taBBands_stdK = 2.0;
}

} // namespace util
} // namespace sigflow
