#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace sigflow {
namespace util {

enum class LogLevel : int {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4
};

struct Field {
  std::string k;
  std::string v;
};

LogLevel parseLevel(const std::string& s);
const char* levelName(LogLevel l);

// Fixed-precision rendering for prices in log fields.
std::string fmtPrice(double px);

class Logger {
public:
  Logger();
  ~Logger();

  Logger(const Logger&)            = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel lvl);
  void setFormatJson(bool json);
  // Empty path -> stdout. Returns false (and keeps stdout) if the file can't be opened.
  bool setFile(const std::string& path);

  LogLevel level() const;
  bool enabled(LogLevel lvl) const { return static_cast<int>(lvl) >= static_cast<int>(level()); }

  void log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields = {});

  void trace(const std::string& msg, const std::vector<Field>& fields = {}) { log(LogLevel::Trace, msg, fields); }
  void debug(const std::string& msg, const std::vector<Field>& fields = {}) { log(LogLevel::Debug, msg, fields); }
  void info (const std::string& msg, const std::vector<Field>& fields = {}) { log(LogLevel::Info,  msg, fields); }
  void warn (const std::string& msg, const std::vector<Field>& fields = {}) { log(LogLevel::Warn,  msg, fields); }
  void error(const std::string& msg, const std::vector<Field>& fields = {}) { log(LogLevel::Error, msg, fields); }

  // Thread-local context: fields added for the lifetime of the object are
  // appended to every line written from this thread.
  class Scoped {
  public:
    explicit Scoped(const std::vector<Field>& add);
    ~Scoped();

    Scoped(const Scoped&)            = delete;
    Scoped& operator=(const Scoped&) = delete;

  private:
    std::vector<Field> saved_;   // previous values of overwritten keys
    std::vector<std::string> added_;
  };

private:
  void writeLine(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields);

private:
  mutable std::mutex mx_;
  void* file_ = nullptr;            // FILE* stored as void* to avoid <cstdio> in header
  LogLevel lvl_ = LogLevel::Info;
  bool json_ = false;
};

Logger& logger();

} // namespace util
} // namespace sigflow
