#include "sigflow/codec/JsonCodec.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <optional>

namespace sigflow::codec {

namespace {

using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

std::string at(size_t lineNo, const char* field = nullptr) {
  std::string p = "line " + std::to_string(lineNo);
  if (field) { p += "."; p += field; }
  return p;
}

std::optional<double> number(const rapidjson::Value& obj, const char* key) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsNumber()) return std::nullopt;
  const double v = it->value.GetDouble();
  if (!std::isfinite(v)) return std::nullopt;
  return v;
}

// Epoch ms. Integers are taken as-is; other numbers are floored and must
// fit in int64 (2^63 is exact in a double).
Result<int64_t> timestamp(const rapidjson::Value& obj, const char* key, size_t lineNo) {
  constexpr double kTwo63 = 9223372036854775808.0;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return Error{"missing ts", at(lineNo, key)};
  if (it->value.IsInt64()) return it->value.GetInt64();
  if (!it->value.IsNumber()) return Error{"non-numeric ts", at(lineNo, key)};

  const double v = std::floor(it->value.GetDouble());
  if (!std::isfinite(v) || v < -kTwo63 || v >= kTwo63) {
    return Error{"ts out of range", at(lineNo, key)};
  }
  return static_cast<int64_t>(v);
}

std::optional<std::string> text(const rapidjson::Value& obj, const char* key) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsString()) return std::nullopt;
  return std::string(it->value.GetString(), it->value.GetStringLength());
}

Result<FeedMessage> decodeTick(const rapidjson::Value& doc, size_t lineNo) {
  TickMessage t;
  auto price = number(doc, "price");
  if (!price) return Error{"missing or non-numeric price", at(lineNo, "price")};
  auto ts = timestamp(doc, "ts", lineNo);
  if (!ts) return ts.error();
  t.price = *price;
  t.ts    = *ts;
  if (doc.HasMember("volume")) {
    auto vol = number(doc, "volume");
    if (!vol) return Error{"non-numeric volume", at(lineNo, "volume")};
    t.volume = *vol;
  }
  return FeedMessage{t};
}

Result<FeedMessage> decodeNews(const rapidjson::Value& doc, size_t lineNo) {
  sentiment::NewsEvent ev;
  auto headline = text(doc, "headline");
  if (!headline) return Error{"missing headline", at(lineNo, "headline")};
  ev.headline = std::move(*headline);

  auto s = text(doc, "sentiment");
  auto parsedSentiment = s ? sentiment::parseSentiment(*s) : std::nullopt;
  if (!parsedSentiment) return Error{"sentiment must be POSITIVE, NEGATIVE or NEUTRAL", at(lineNo, "sentiment")};
  ev.sentiment = *parsedSentiment;

  auto i = text(doc, "impact");
  auto parsedImpact = i ? sentiment::parseImpact(*i) : std::nullopt;
  if (!parsedImpact) return Error{"impact must be HIGH, MEDIUM or LOW", at(lineNo, "impact")};
  ev.impact = *parsedImpact;

  if (doc.HasMember("ts")) {
    auto ts = timestamp(doc, "ts", lineNo);
    if (!ts) return ts.error();
    ev.timestamp = *ts;
  }
  ev.source    = text(doc, "source").value_or("");
  return FeedMessage{std::move(ev)};
}

Result<FeedMessage> decodeBar(const rapidjson::Value& doc, size_t lineNo) {
  Bar b;
  struct Slot { const char* key; double* dst; };
  const Slot slots[] = {{"open", &b.open}, {"high", &b.high}, {"low", &b.low}, {"close", &b.close}};
  for (const auto& s : slots) {
    auto v = number(doc, s.key);
    if (!v) return Error{"missing or non-numeric field", at(lineNo, s.key)};
    *s.dst = *v;
  }
  b.volume = number(doc, "volume").value_or(0.0);
  auto ts = timestamp(doc, "ts", lineNo);
  if (!ts) return ts.error();
  b.timestamp = *ts;
  if (!b.wellFormed()) return Error{"bar violates low <= open/close <= high", at(lineNo)};
  return FeedMessage{b};
}

void writeOptional(Writer& w, const char* key, const std::optional<double>& v) {
  if (!v || !std::isfinite(*v)) return;
  w.Key(key);
  w.Double(*v);
}

} // namespace

Result<FeedMessage> decodeFeedLine(const std::string& line, size_t lineNo) {
  rapidjson::Document doc;
  doc.Parse(line.c_str(), line.size());
  if (doc.HasParseError()) {
    return Error{std::string("parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()), at(lineNo)};
  }
  if (!doc.IsObject()) return Error{"record must be a JSON object", at(lineNo)};

  auto type = text(doc, "type");
  if (!type) return Error{"missing string type", at(lineNo, "type")};

  if (*type == "tick") return decodeTick(doc, lineNo);
  if (*type == "news") return decodeNews(doc, lineNo);
  if (*type == "bar")  return decodeBar(doc, lineNo);
  return Error{"unknown type '" + *type + "'", at(lineNo, "type")};
}

std::string encodeSignal(const char* event, const signal::Signal& s) {
  rapidjson::StringBuffer buf;
  Writer w(buf);
  w.StartObject();
  w.Key("event");      w.String(event);
  w.Key("id");         w.String(s.id.c_str(), static_cast<rapidjson::SizeType>(s.id.size()));
  w.Key("createdAt");  w.Int64(s.createdAtMs);
  w.Key("direction");  w.String(signal::toString(s.direction));
  w.Key("timeframe");  w.String(s.timeframe.c_str());
  w.Key("entry");      w.Double(s.entryPrice);
  w.Key("regime");     w.String(s.regime.c_str());
  w.Key("strategy");   w.String(s.strategy.c_str());
  w.Key("score");      w.Double(s.score);
  w.Key("confidence"); w.Double(s.confidence);
  w.Key("strength");   w.String(signal::toString(s.strength));
  writeOptional(w, "prediction", s.prediction);
  writeOptional(w, "predictionScore", s.predictionScore);
  if (s.sentimentContext) { w.Key("sentiment"); w.String(s.sentimentContext->c_str()); }
  w.Key("status");     w.String(signal::toString(s.status));
  writeOptional(w, "exit", s.exitPrice);
  writeOptional(w, "pnl", s.pnl);
  if (s.resolvedAtMs) { w.Key("resolvedAt"); w.Int64(*s.resolvedAtMs); }
  w.EndObject();
  return buf.GetString();
}

std::string encodeBar(const char* event, const std::string& tf, const Bar& b) {
  rapidjson::StringBuffer buf;
  Writer w(buf);
  w.StartObject();
  w.Key("event");  w.String(event);
  w.Key("tf");     w.String(tf.c_str());
  w.Key("ts");     w.Int64(b.timestamp);
  w.Key("open");   w.Double(b.open);
  w.Key("high");   w.Double(b.high);
  w.Key("low");    w.Double(b.low);
  w.Key("close");  w.Double(b.close);
  w.Key("volume"); w.Double(b.volume);
  writeOptional(w, "ema200", b.ema200);
  writeOptional(w, "atr", b.atr);
  writeOptional(w, "adx", b.adx);
  writeOptional(w, "rsi", b.rsi);
  if (b.macd) {
    w.Key("macd");
    w.StartObject();
    w.Key("line");   w.Double(b.macd->line);
    w.Key("signal"); w.Double(b.macd->signal);
    w.Key("hist");   w.Double(b.macd->hist);
    w.EndObject();
  }
  if (b.bollinger) {
    w.Key("bollinger");
    w.StartObject();
    w.Key("upper");  w.Double(b.bollinger->upper);
    w.Key("middle"); w.Double(b.bollinger->middle);
    w.Key("lower");  w.Double(b.bollinger->lower);
    w.EndObject();
  }
  w.EndObject();
  return buf.GetString();
}

std::string encodeRegime(const std::string& tf, const std::string& regime, const std::string& debug) {
  rapidjson::StringBuffer buf;
  Writer w(buf);
  w.StartObject();
  w.Key("event");  w.String("regime");
  w.Key("tf");     w.String(tf.c_str());
  w.Key("regime"); w.String(regime.c_str());
  w.Key("debug");  w.String(debug.c_str());
  w.EndObject();
  return buf.GetString();
}

std::string encodeStats(const signal::SignalStats& st) {
  rapidjson::StringBuffer buf;
  Writer w(buf);
  w.StartObject();
  w.Key("event");   w.String("stats");
  w.Key("total");   w.Uint64(st.totalSignals);
  w.Key("wins");    w.Uint64(st.wins);
  w.Key("losses");  w.Uint64(st.losses);
  w.Key("active");  w.Uint64(st.activeSignals);
  w.Key("winRate"); w.Double(st.winRate);
  w.Key("netPnl");  w.Double(st.netPnl);
  w.EndObject();
  return buf.GetString();
}

} // namespace sigflow::codec
