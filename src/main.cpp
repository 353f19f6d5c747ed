// File: src/main.cpp
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>

#include "collab/auth/JwtVerifier.hpp"
#include "collab/auth/SessionAuthenticator.hpp"
#include "collab/core/ActivityRecorder.hpp"
#include "collab/core/ChatRelay.hpp"
#include "collab/core/CollaborationHub.hpp"
#include "collab/core/ConnectionRegistry.hpp"
#include "collab/core/EditCoordinator.hpp"
#include "collab/core/HeartbeatSweeper.hpp"
#include "collab/core/LockManager.hpp"
#include "collab/core/PresenceTracker.hpp"
#include "collab/core/RoomBroadcaster.hpp"
#include "collab/server/WebSocketServer.hpp"
#include "collab/store/InMemoryStore.hpp"

#include "collab/util/Clock.hpp"
#include "collab/util/Config.hpp"
#include "collab/util/Logger.hpp"
#include "collab/util/Metrics.hpp"
#include "collab/rt/ThreadPool.hpp"
#include "collab/runtime/ShutdownCoordinator.hpp"

namespace {

// argv[1] = port (optional), argv[2] = config file (optional)
void loadConfig(int argc, char* argv[], collab::util::Config& cfg) {
  using namespace collab::util;

  if (argc > 2 && !cfg.loadFromFile(argv[2])) {
    logger().log(LogLevel::Warn, "config.load_failed", {{"path", argv[2]}});
  }
  if (argc > 1) {
    const std::string port = argv[1];
    const bool numeric = !port.empty() && port.size() <= 5 &&
                         port.find_first_not_of("0123456789") == std::string::npos &&
                         std::stoul(port) <= 65535;
    if (numeric) {
      (void)cfg.set("server.port", port);
    } else {
      logger().log(LogLevel::Warn, "config.bad_port",
                   {{"value", port}, {"using", std::to_string(cfg.serverPort)}});
    }
  }
  cfg.sanitize();
}

void configureLogger(const collab::util::Config& cfg) {
  using namespace collab::util;
  logger().setLevel(parseLevel(cfg.logLevel));
  logger().setFormatJson(cfg.logJson);
  if (!cfg.logFile.empty() && !logger().setFile(cfg.logFile)) {
    logger().log(LogLevel::Warn, "log.file_unavailable", {{"path", cfg.logFile}});
  }
}

} // namespace

int main(int argc, char* argv[]) {
  using namespace collab;
  using util::LogLevel;
  using util::logger;

  // ---------------------------
  // 1) Config + logging
  // ---------------------------
  util::Config cfg;
  loadConfig(argc, argv, cfg);
  configureLogger(cfg);

  logger().log(LogLevel::Info, "boot",
               {{"port", std::to_string(cfg.serverPort)},
                {"threads", std::to_string(cfg.serverThreads)}});
  if (cfg.jwtSecret.empty()) {
    logger().log(LogLevel::Warn, "auth.no_secret", {{"effect", "all connections rejected"}});
  }

  // ---------------------------
  // 2) External collaborators
  // ---------------------------
  auto store = std::make_shared<store::InMemoryStore>();
  if (!cfg.storeFixture.empty() && !store->loadFixture(cfg.storeFixture)) {
    logger().log(LogLevel::Error, "store.fixture_unreadable", {{"path", cfg.storeFixture}});
    return EXIT_FAILURE;
  }

  // ---------------------------
  // 3) Runtime
  // ---------------------------
  rt::ShutdownCoordinator shutdown;
  auto pool = std::make_unique<rt::ThreadPool>(cfg.serverThreads);
  const util::Clock& clock = util::systemClock();

  // ---------------------------
  // 4) Core components
  // ---------------------------
  auth::JwtVerifier verifier(cfg.jwtSecret, &clock);
  auth::SessionAuthenticator authenticator(&verifier, store.get());

  core::ConnectionRegistry registry;
  core::RoomBroadcaster broadcaster(&registry);
  core::ActivityRecorder activity(store.get(), pool.get());

  core::LockManager::Options lockOpts;
  lockOpts.defaultMinutes = cfg.lockDefaultMinutes;
  lockOpts.maxMinutes = cfg.lockMaxMinutes;
  lockOpts.releaseRequiresOwnership = cfg.lockReleaseRequiresOwnership;
  lockOpts.broadcastExpiry = cfg.sweeperBroadcastExpiry;
  core::LockManager locks(store.get(), &broadcaster, &clock, lockOpts);
  try {
    locks.restore();
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Warn, "lock.restore_failed", {{"error", ex.what()}});
  }

  core::PresenceTracker presence(store.get(), &registry, &broadcaster, &locks, &clock,
                                 {static_cast<std::size_t>(cfg.snapshotActivityLimit)});
  core::EditCoordinator edits(store.get(), &locks, &broadcaster, &activity, &clock,
                              {cfg.editRequireLock});
  core::ChatRelay chat(store.get(), &broadcaster, &activity, &clock,
                       {static_cast<std::size_t>(cfg.chatMaxLength)});

  core::CollaborationHub::Deps deps;
  deps.registry    = &registry;
  deps.memberships = store.get();
  deps.presence    = &presence;
  deps.locks       = &locks;
  deps.edits       = &edits;
  deps.chat        = &chat;
  deps.broadcaster = &broadcaster;
  deps.pool        = pool.get();
  deps.clock       = &clock;
  core::CollaborationHub hub(deps);

  // ---------------------------
  // 5) ASIO + server
  // ---------------------------
  boost::asio::io_context ioc;

  WebSocketServer::Options serverOpts;
  serverOpts.address = cfg.serverAddress;
  serverOpts.port = cfg.serverPort;
  serverOpts.allowQueryToken = cfg.allowQueryToken;
  WebSocketServer ws(ioc, &hub, &authenticator, pool.get(), serverOpts);
  if (!ws.run()) return EXIT_FAILURE;

  core::HeartbeatSweeper::Options sweepOpts;
  sweepOpts.interval = std::chrono::seconds(cfg.heartbeatIntervalSeconds);
  sweepOpts.inactiveAfter = std::chrono::hours(cfg.presenceInactiveHours);
  core::HeartbeatSweeper sweeper(ioc, &locks, &presence, &broadcaster, &clock, sweepOpts);
  sweeper.start();

  if (cfg.metricsReportSeconds > 0) {
    util::MetricRegistry::instance().startReporter(static_cast<unsigned>(cfg.metricsReportSeconds));
  }

  // ---------------------------
  // 6) Shutdown sequencing
  // ---------------------------
  boost::asio::steady_timer deadline(ioc);
  shutdown.registerStep("ws-stop-accept",    5,  [&ws]{ ws.stopAccept(); });
  shutdown.registerStep("sweeper-stop",      10, [&sweeper]{ sweeper.stop(); });
  shutdown.registerStep("ws-close-sessions", 40, [&ws]{ ws.closeAll(); });
  shutdown.registerStep("metrics-stop",      50, []{ util::MetricRegistry::instance().stopReporter(); });
  // Give close handshakes a moment, then stop the loop.
  shutdown.registerStep("asio-stop",         60, [&deadline, &ioc]{
    deadline.expires_after(std::chrono::seconds(5));
    deadline.async_wait([&ioc](const boost::system::error_code&) { ioc.stop(); });
  });

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&shutdown](const boost::system::error_code& ec, int sig) {
    if (ec) return;
    logger().log(LogLevel::Info, "signal", {{"signal", std::to_string(sig)}});
    shutdown.stop();
  });

  // ---------------------------
  // 7) Run
  // ---------------------------
  try {
    ioc.run();
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, "io_context exception", {{"error", ex.what()}});
  }

  // Ensure shutdown steps run even on natural exit
  shutdown.stop();

  // Finalizers queued by the closed sessions still run before the pool joins.
  pool->drain();
  pool->shutdown();

  logger().log(LogLevel::Info, "stopped");
  return EXIT_SUCCESS;
}
