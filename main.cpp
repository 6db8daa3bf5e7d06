// -----------------------------------------------------------------------------
// solseek — single executable entry point.
//
//   1) Load the engine config (argv[1], built-in defaults when absent) and
//      the feature schema it names.
//   2) Build the TradingPipeline over a ZeroMQ log source and the wall
//      clock, then start it.
//   3) Park the main thread until Ctrl-C or until ingestion halts.
//   4) Stop the pipeline and print its final status JSON.
//
// Thread layout:
//   main thread      → waits for shutdown
//   ingest thread    → LogStream producer (ZMQ recv + reconnect)
//   pipeline thread  → features, posterior, sizing, execution, risk
// -----------------------------------------------------------------------------

#include "solseek/config/engine_config.hpp"
#include "solseek/domain/errors.hpp"
#include "solseek/engine/trading_pipeline.hpp"
#include "solseek/features/feature_schema.hpp"
#include "solseek/ingest/zmq_log_source.hpp"
#include "solseek/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// Set by the SIGINT handler, polled by main(). The only global.
static std::atomic<bool> g_shutdown{false};

static void sigint_handler(int /*signum*/) { g_shutdown.store(true); }

int main(int argc, char** argv) {
  solseek::EngineConfig config;
  solseek::FeatureSchema schema = solseek::FeatureSchema::builtin();
  try {
    if (argc > 1) {
      config = solseek::loadEngineConfig(argv[1]);
      std::cout << "[main] config loaded from " << argv[1] << "\n";
    } else {
      std::cout << "[main] no config given, using defaults\n";
    }
    if (!config.features.schema_path.empty()) {
      schema = solseek::FeatureSchema::load(config.features.schema_path);
      std::cout << "[main] feature schema v" << schema.version()
                << " loaded from " << config.features.schema_path << "\n";
    }
  } catch (const solseek::SolseekError& e) {
    std::cerr << "[main] startup failed: " << e.what() << "\n";
    return 1;
  }

  if (config.stream.endpoint.empty()) {
    std::cerr << "[main] stream.endpoint is not set\n";
    return 1;
  }

  solseek::LiveTimeProvider clock;
  solseek::ZmqLogSource source(config.stream.endpoint,
                               config.stream.recv_timeout_ms);

  try {
    solseek::TradingPipeline pipeline(config, source, clock,
                                      std::move(schema));

    std::signal(SIGINT, sigint_handler);
    pipeline.start();
    std::cout << "[main] Press Ctrl-C to shut down.\n";

    while (!g_shutdown.load() && !pipeline.halted()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << (pipeline.halted() ? "[main] ingestion halted. "
                                    : "[main] SIGINT received. ")
              << "Stopping pipeline...\n";
    pipeline.stop();
    std::cout << pipeline.status() << "\n";
    return pipeline.halted() ? 2 : 0;
  } catch (const solseek::SolseekError& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return 1;
  }
}
