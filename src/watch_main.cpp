// kspec-watch: subscribe to daemon topics and print every event.
//
//   kspec-watch [-c config] <host> <port> <topic>...
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "kspec/client/WebSocketManager.hpp"
#include "kspec/util/Config.hpp"
#include "kspec/util/Logger.hpp"
#include "kspec/ws/Protocol.hpp"

int main(int argc, char* argv[]) {
  using namespace kspec;
  using util::LogLevel;
  using util::logger;

  util::Config cfg;
  int i = 1;
  if (argc > 2 && std::strcmp(argv[1], "-c") == 0) {
    if (!cfg.loadFromFile(argv[2])) {
      logger().log(LogLevel::Warn, "failed to load config, using defaults", {{"path", argv[2]}});
    }
    i = 3;
  }
  if (argc - i < 3) {
    std::cerr << "usage: kspec-watch [-c config] <host> <port> <topic>...\n";
    return EXIT_FAILURE;
  }
  cfg.applyLogging();

  const std::string host = argv[i];
  const std::string port = argv[i + 1];
  std::vector<std::string> topics(argv + i + 2, argv + argc);

  client::ReconnectPolicy policy;
  policy.maxAttempts         = cfg.reconnectMaxAttempts;
  policy.maxBackoff          = std::chrono::seconds(cfg.reconnectMaxBackoffSec);
  policy.connectionLostAfter = std::chrono::seconds(cfg.connectionLostSec);
  policy.contactTimeout      = std::chrono::seconds(cfg.pongTimeoutSec);

  boost::asio::io_context ioc;
  auto mgr = client::WebSocketManager::create(ioc, host, port, cfg.wsPath, policy);
  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);

  int exitCode = EXIT_SUCCESS;

  for (const auto& t : topics) {
    mgr->on(t, [](const ws::BroadcastEvent& ev) {
      // One JSON line per event, ready for jq.
      std::cout << ws::encodeBroadcast(ev) << std::endl;
    });
  }

  mgr->onStatusChange([&signals, &exitCode](client::ConnectionStatus s, client::Connectivity c) {
    logger().log(LogLevel::Info, "status",
                 {{"status", client::toString(s)}, {"connectivity", client::toString(c)}});
    if (s == client::ConnectionStatus::GivenUp) {
      // Nothing left to wait for; let run() return.
      exitCode = EXIT_FAILURE;
      boost::system::error_code ec;
      signals.cancel(ec);
    }
  });

  signals.async_wait([mgr](const boost::system::error_code& ec, int) {
    if (ec) return;
    mgr->disconnect();
  });

  mgr->subscribe(topics);
  mgr->connect();

  try {
    ioc.run();
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, "io_context exception", {{"error", ex.what()}});
    return EXIT_FAILURE;
  }

  const auto st = mgr->stats();
  logger().log(LogLevel::Info, "exiting",
               {{"connects", std::to_string(st.connectCount)},
                {"reconnects", std::to_string(st.reconnectCount)},
                {"last_seq", std::to_string(mgr->lastSeqProcessed())}});
  return exitCode;
}
