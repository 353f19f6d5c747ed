#include "collab/util/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace collab {
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
  return !k.empty();
}

bool Config::parseBool(const std::string& v, bool fallback) {
  std::string x = v;
  for (auto& c : x) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (x == "1" || x == "true"  || x == "yes" || x == "on")  return true;
  if (x == "0" || x == "false" || x == "no"  || x == "off") return false;
  return fallback;
}

bool Config::set(const std::string& key, const std::string& val) {
  if      (key == "server.address")                serverAddress = val;
  else if (key == "server.port")                   serverPort = static_cast<unsigned short>(std::atoi(val.c_str()));
  else if (key == "server.threads")                serverThreads = static_cast<unsigned>(std::max(1, std::atoi(val.c_str())));
  else if (key == "auth.jwtSecret")                jwtSecret = val;
  else if (key == "auth.allowQueryToken")          allowQueryToken = parseBool(val, allowQueryToken);
  else if (key == "lock.defaultMinutes")           lockDefaultMinutes = std::atoi(val.c_str());
  else if (key == "lock.maxMinutes")               lockMaxMinutes = std::atoi(val.c_str());
  else if (key == "lock.releaseRequiresOwnership") lockReleaseRequiresOwnership = parseBool(val, lockReleaseRequiresOwnership);
  else if (key == "edit.requireLock")              editRequireLock = parseBool(val, editRequireLock);
  else if (key == "heartbeat.intervalSeconds")     heartbeatIntervalSeconds = std::atoi(val.c_str());
  else if (key == "sweeper.broadcastExpiry")       sweeperBroadcastExpiry = parseBool(val, sweeperBroadcastExpiry);
  else if (key == "presence.inactiveHours")        presenceInactiveHours = std::atoi(val.c_str());
  else if (key == "snapshot.activityLimit")        snapshotActivityLimit = std::atoi(val.c_str());
  else if (key == "chat.maxLength")                chatMaxLength = std::atoi(val.c_str());
  else if (key == "store.fixture")                 storeFixture = val;
  else if (key == "metrics.reportSeconds")         metricsReportSeconds = std::atoi(val.c_str());
  else if (key == "log.level")                     logLevel = val;
  else if (key == "log.json")                      logJson = parseBool(val, logJson);
  else if (key == "log.file")                      logFile = val;
  else return false;
  return true;
}

bool Config::loadFromFile(const std::string& path) {
  // key=value per line, '#' or ';' start comments.
  // Unknown keys are ignored so new knobs don't break older builds.
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string line;
  line.reserve(1024);

  char tmp[1024];
  while (std::fgets(tmp, sizeof(tmp), f)) {
    line.assign(tmp);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    auto s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == ';') continue;

    std::string key, val;
    if (!parseLineKV(s, key, val)) continue;
    (void)set(key, val);
  }

  std::fclose(f);
  sanitize();
  return true;
}

void Config::sanitize() {
  if (serverPort == 0) serverPort = 8080;
  if (serverThreads == 0) serverThreads = 1;
  if (lockMaxMinutes < 1) lockMaxMinutes = 60;
  lockDefaultMinutes = std::clamp(lockDefaultMinutes, 1, lockMaxMinutes);
  if (heartbeatIntervalSeconds < 1) heartbeatIntervalSeconds = 30;
  if (presenceInactiveHours < 1) presenceInactiveHours = 24;
  if (snapshotActivityLimit < 0) snapshotActivityLimit = 50;
  if (chatMaxLength < 1) chatMaxLength = 4000;
  if (metricsReportSeconds < 0) metricsReportSeconds = 0;
}

} // namespace util
} // namespace collab
