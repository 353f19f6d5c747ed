#pragma once

#include <cstdint>
#include <string>

namespace collab {
namespace util {

class Config {
public:
  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if the file was read, even if some keys were unknown.
  bool loadFromFile(const std::string& path);

  // Apply one key=value pair; returns false for unknown keys.
  bool set(const std::string& key, const std::string& value);

  // Clamp values back into their valid ranges.
  void sanitize();

  // --- server ---
  std::string    serverAddress = "0.0.0.0";
  unsigned short serverPort    = 8080;
  unsigned       serverThreads = 4;

  // --- auth ---
  std::string jwtSecret;
  bool        allowQueryToken = true;

  // --- locks ---
  int  lockDefaultMinutes           = 5;
  int  lockMaxMinutes               = 60;
  bool lockReleaseRequiresOwnership = false;

  // --- edits ---
  bool editRequireLock = true;

  // --- heartbeat / sweeper ---
  int  heartbeatIntervalSeconds = 30;
  bool sweeperBroadcastExpiry   = true;
  int  presenceInactiveHours    = 24;

  // --- snapshot / chat ---
  int snapshotActivityLimit = 50;
  int chatMaxLength         = 4000;

  // --- store ---
  std::string storeFixture;

  // --- observability ---
  int         metricsReportSeconds = 0;
  std::string logLevel = "info";
  bool        logJson  = false;
  std::string logFile;

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static bool parseBool(const std::string& v, bool fallback);
  static std::string trim(const std::string& s);
};

} // namespace util
} // namespace collab
