// kspecd: the realtime event daemon.
//
//   kspecd [port] [config]
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <functional>
#include <string>

#include "kspec/rt/ShutdownCoordinator.hpp"
#include "kspec/server/CommandHandler.hpp"
#include "kspec/server/ConnectionRegistry.hpp"
#include "kspec/server/FileWatcher.hpp"
#include "kspec/server/HeartbeatManager.hpp"
#include "kspec/server/WebSocketServer.hpp"
#include "kspec/util/Config.hpp"
#include "kspec/util/Logger.hpp"
#include "kspec/util/Metrics.hpp"

namespace {

bool parsePort(const char* s, unsigned short& out) {
  char* end = nullptr;
  const unsigned long v = std::strtoul(s, &end, 10);
  if (end == s || *end != '\0' || v == 0 || v > 65535) return false;
  out = static_cast<unsigned short>(v);
  return true;
}

} // namespace

int main(int argc, char* argv[]) {
  using namespace kspec;
  using util::LogLevel;
  using util::logger;

  // ---------------------------
  // Config: file first, CLI port wins
  // ---------------------------
  util::Config cfg;
  if (argc > 2 && !cfg.loadFromFile(argv[2])) {
    logger().log(LogLevel::Warn, "failed to load config, using defaults", {{"path", argv[2]}});
  }
  if (argc > 1) {
    unsigned short p = 0;
    if (parsePort(argv[1], p)) {
      cfg.port = p;
    } else {
      logger().log(LogLevel::Warn, "invalid port, using default",
                   {{"arg", argv[1]}, {"port", std::to_string(cfg.port)}});
    }
  }
  cfg.applyLogging();

  boost::system::error_code aec;
  const auto address = boost::asio::ip::make_address(cfg.host, aec);
  if (aec) {
    logger().log(LogLevel::Error, "invalid host", {{"host", cfg.host}, {"error", aec.message()}});
    return EXIT_FAILURE;
  }

  logger().log(LogLevel::Info, "boot",
               {{"host", cfg.host}, {"port", std::to_string(cfg.port)},
                {"version", server::WebSocketServer::kVersion}});

  // ---------------------------
  // Components
  // ---------------------------
  boost::asio::io_context ioc;

  server::ConnectionRegistry registry(cfg.backpressureBytes);
  server::CommandHandler commands(registry);
  server::HeartbeatManager heartbeat(ioc,
                                     std::chrono::seconds(cfg.pingIntervalSec),
                                     std::chrono::seconds(cfg.pongTimeoutSec));
  server::WebSocketServer ws(ioc, registry, commands, heartbeat,
                             boost::asio::ip::tcp::endpoint(address, cfg.port), cfg.wsPath);

  auto started = ws.run();
  if (!started) {
    logger().log(LogLevel::Error, "failed to start server", {{"error", started.error().describe()}});
    return EXIT_FAILURE;
  }
  heartbeat.start(registry);

  server::FileWatcher watcher(ioc, registry, cfg.watchDir,
                              std::chrono::milliseconds(cfg.watchPollMs),
                              std::chrono::milliseconds(cfg.watchDebounceMs));
  if (!cfg.watchDir.empty()) {
    watcher.start();
  }

  // ---------------------------
  // Shutdown sequencing
  // ---------------------------
  rt::ShutdownCoordinator shutdown;
  boost::asio::steady_timer grace(ioc);

  shutdown.registerStep("watcher-stop",    2,  [&watcher]{ watcher.stop(); });
  shutdown.registerStep("ws-stop-accept",  5,  [&ws]{ ws.stopAccept(); });
  shutdown.registerStep("ws-close-all",    40, [&ws]{ ws.closeAll(); });
  shutdown.registerStep("heartbeat-stop",  50, [&heartbeat]{ heartbeat.stop(); });
  shutdown.registerStep("asio-stop",       60, [&ioc, &grace]{
    // Let in-flight close handshakes finish.
    grace.expires_after(std::chrono::seconds(1));
    grace.async_wait([&ioc](const boost::system::error_code&) { ioc.stop(); });
  });

  // SIGHUP: reopen the log file after an external rotation.
  boost::asio::signal_set hangup(ioc, SIGHUP);
  std::function<void()> waitHangup = [&] {
    hangup.async_wait([&](const boost::system::error_code& ec, int) {
      if (ec) return;
      const bool ok = logger().reopen();
      logger().log(ok ? LogLevel::Info : LogLevel::Error,
                   ok ? "log reopened" : "log reopen failed, writing to stdout",
                   {{"path", logger().filePath()}});
      waitHangup();
    });
  };
  waitHangup();
  shutdown.registerStep("signals-cancel", 1, [&hangup]{
    boost::system::error_code ignored;
    hangup.cancel(ignored);
  });

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&shutdown](const boost::system::error_code& ec, int sig) {
    if (ec) return;
    logger().log(LogLevel::Info, "signal received", {{"signal", std::to_string(sig)}});
    shutdown.stop();
  });

  // ---------------------------
  // Run
  // ---------------------------
  try {
    ioc.run();
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, "io_context exception", {{"error", ex.what()}});
  }

  // Natural exit still runs the steps (once).
  if (!shutdown.stopping()) {
    watcher.stop();
    ws.shutdown();
  }

  util::MetricRegistry::instance().logSnapshot();
  logger().log(LogLevel::Info, "stopped");
  return EXIT_SUCCESS;
}
