#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cen {

using Clock = std::chrono::system_clock;

std::string base64_encode(const std::uint8_t* data, size_t len);
std::string base64_encode(const std::string& data);
std::string base64url_encode(const std::string& data);

// RFC 3986 percent-encoding for query values and form bodies.
std::string url_encode(const std::string& s);

std::string random_hex(size_t bytes);

// "2025-08-16T14:32:10Z"
std::string format_utc_iso(Clock::time_point tp);
// Accepts an optional fractional part and trailing 'Z'.
std::optional<Clock::time_point> parse_utc_iso(const std::string& s);

std::string now_timestamp();  // local time, "2025-08-16 14:32:10"

// "https://host:port/a/b" -> {"https://host:port", "/a/b"}
std::pair<std::string, std::string> split_url(const std::string& url);

std::vector<std::string> split_list(const std::string& s, char sep);

}  // namespace cen
