#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace collab::util {

// URL-safe alphabet, no padding on encode; padding tolerated on decode.
std::string base64UrlEncode(std::string_view in);
std::optional<std::string> base64UrlDecode(std::string_view in);

} // namespace collab::util
