// File: src/main.cpp
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>

#include <boost/asio.hpp>

#include "sigflow/codec/JsonCodec.hpp"
#include "sigflow/engine/EngineRunner.hpp"
#include "sigflow/engine/SignalEngine.hpp"
#include "sigflow/oracle/AsyncPredictor.hpp"
#include "sigflow/oracle/LinearTrendOracle.hpp"
#include "sigflow/rt/ShutdownCoordinator.hpp"
#include "sigflow/rt/ThreadPool.hpp"
#include "sigflow/util/Config.hpp"
#include "sigflow/util/Logger.hpp"
#include "sigflow/util/Metrics.hpp"

namespace {

volatile std::sig_atomic_t gStopRequested = 0;

void handleSignal(int) {
  gStopRequested = 1;
}

// Writes engine events to stdout, one JSON object per line.
class JsonLinesListener final : public sigflow::engine::IEngineListener {
public:
  explicit JsonLinesListener(std::ostream& out) : out_(out) {}

  void onBarSealed(const std::vector<sigflow::Bar>& history) override {
    if (history.empty()) return;
    write(sigflow::codec::encodeBar("bar", "1m", history.back()));
  }

  void onRegime(const std::string& tf, const std::string& regime, const std::string& debug) override {
    write(sigflow::codec::encodeRegime(tf, regime, debug));
  }

  void onSignalCreated(const sigflow::signal::Signal& s) override {
    write(sigflow::codec::encodeSignal("signal.created", s));
  }

  void onSignalResolved(const sigflow::signal::Signal& s) override {
    write(sigflow::codec::encodeSignal("signal.resolved", s));
  }

  void write(const std::string& line) {
    std::lock_guard<std::mutex> lk(mx_);
    out_ << line << '\n';
  }

private:
  std::mutex    mx_;
  std::ostream& out_;
};

} // namespace

// ---------------------------
// main
//   argv[1] = feed file (JSON lines; "-" or absent reads stdin)
//   argv[2] = config file (optional)
// ---------------------------
int main(int argc, char* argv[]) {
  using namespace sigflow;
  using util::logger;

  std::signal(SIGINT,  handleSignal);
  std::signal(SIGTERM, handleSignal);

  // 1) Config
  util::Config cfg;
  if (argc > 2 && !cfg.loadFromFile(argv[2])) {
    std::cerr << "[config] failed to load file: " << argv[2] << "\n";
    return EXIT_FAILURE;
  }

  // 2) Logger
  logger().setLevel(util::parseLevel(cfg.logLevel));
  logger().setFormatJson(cfg.logJson);
  if (!logger().setFile(cfg.logFile)) {
    std::cerr << "[log] cannot open " << cfg.logFile << ", logging to stdout\n";
  }

  const std::string feedPath = argc > 1 ? argv[1] : "-";
  logger().info("boot", {{"feed", feedPath}, {"timeframes", std::to_string(cfg.timeframes.size())}});

  rt::ShutdownCoordinator shutdown;

  // 3) Metrics
  if (cfg.metricsIntervalSec > 0) {
    util::MetricRegistry::instance().startReporter(cfg.metricsIntervalSec);
    shutdown.registerStep("metrics-stop", 90, []{ util::MetricRegistry::instance().stopReporter(); });
  }

  // 4) Workers + oracle
  auto pool = std::make_shared<rt::ThreadPool>(static_cast<unsigned>(cfg.workerThreads));
  shutdown.registerStep("pool-drain",    80, [pool]{ pool->drain(); });
  shutdown.registerStep("pool-shutdown", 85, [pool]{ pool->shutdown(); });

  std::unique_ptr<oracle::AsyncPredictor> predictor;
  if (cfg.oracleEnabled) {
    predictor = std::make_unique<oracle::AsyncPredictor>(
      std::make_shared<oracle::LinearTrendOracle>(static_cast<size_t>(cfg.oracleWindow)),
      *pool,
      std::chrono::milliseconds(cfg.oracleTimeoutMs));
  }

  // 5) Engine + runner
  std::unique_ptr<engine::SignalEngine> eng;
  try {
    eng = std::make_unique<engine::SignalEngine>(cfg, std::move(predictor));
  } catch (const std::invalid_argument& ex) {
    logger().error("engine.config.invalid", {{"err", ex.what()}});
    shutdown.stop();
    return EXIT_FAILURE;
  }

  auto out = std::make_shared<JsonLinesListener>(std::cout);
  eng->addListener(out);

  boost::asio::io_context ioc;
  auto work = boost::asio::make_work_guard(ioc);
  // Resolution runs on feed time: the newest tick the engine has processed.
  std::shared_ptr<engine::EngineRunner> runner;
  runner = engine::EngineRunner::create(
    ioc, *eng, std::chrono::milliseconds(cfg.resolveIntervalMs),
    [&runner]{ return runner->feedTimeMs(); });
  runner->start();

  std::thread ioThread([&ioc]{ ioc.run(); });

  shutdown.registerStep("runner-stop", 10, [runner]{ runner->stop(); });
  shutdown.registerStep("io-drain",    20, [&work, &ioThread]{
    work.reset();
    if (ioThread.joinable()) ioThread.join();
  });

  // 6) Feed
  std::ifstream file;
  std::istream* in = &std::cin;
  if (feedPath != "-") {
    file.open(feedPath);
    if (!file.is_open()) {
      logger().error("feed.open_failed", {{"path", feedPath}});
      shutdown.stop();
      return EXIT_FAILURE;
    }
    in = &file;
  }

  // Consecutive bar records are seeded as one batch.
  std::vector<Bar> barBatch;
  auto flushBars = [&]{
    if (barBatch.empty()) return;
    runner->submitBars(std::move(barBatch));
    barBatch.clear();
  };

  std::string line;
  size_t lineNo = 0;
  size_t bad = 0;
  while (!gStopRequested && std::getline(*in, line)) {
    ++lineNo;
    if (line.empty()) continue;

    auto msg = codec::decodeFeedLine(line, lineNo);
    if (!msg) {
      ++bad;
      SIGFLOW_METRIC_HIT("feed.bad_lines");
      logger().warn("feed.bad_line", {{"where", msg.error().path}, {"err", msg.error().message}});
      continue;
    }

    std::visit([&](auto& m) {
      using T = std::decay_t<decltype(m)>;
      if constexpr (std::is_same_v<T, Bar>) {
        barBatch.push_back(m);
        return;
      }
      flushBars();
      if constexpr (std::is_same_v<T, codec::TickMessage>) {
        runner->submitTick(m.price, m.ts, m.volume);
        runner->submitResolveAt(m.ts);
      } else if constexpr (std::is_same_v<T, sentiment::NewsEvent>) {
        runner->submitNews(std::move(m));
      }
    }, *msg);
  }
  flushBars();

  if (gStopRequested) logger().info("signal.stop_requested");
  logger().info("feed.done", {{"lines", std::to_string(lineNo)}, {"bad", std::to_string(bad)}});

  // 7) Shutdown sequencing
  shutdown.stop();

  const auto st = eng->stats();
  out->write(codec::encodeStats(st));
  logger().info("shutdown.complete", {{"signals", std::to_string(st.totalSignals)},
                                      {"wins", std::to_string(st.wins)},
                                      {"losses", std::to_string(st.losses)}});
  return EXIT_SUCCESS;
}
