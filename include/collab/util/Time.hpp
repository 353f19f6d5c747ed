#pragma once

#include "collab/Types.hpp"

#include <cstdint>
#include <string>

namespace collab::util {

// ISO-8601 UTC with milliseconds, e.g. 2026-01-02T03:04:05.678Z
std::string toIso8601(Timestamp tp);

std::int64_t toEpochMillis(Timestamp tp);
Timestamp fromEpochSeconds(std::int64_t s);

} // namespace collab::util
