#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace speakerctrl {
namespace stringutil {

// Trim leading and trailing whitespace from a string
inline void trim(std::string &str) {
  auto start = std::find_if_not(str.begin(), str.end(), ::isspace);
  auto end = std::find_if_not(str.rbegin(), str.rend(), ::isspace).base();
  str = start < end ? std::string(start, end) : std::string{};
}

inline std::string trimmed(std::string_view sv) {
  std::string s(sv);
  trim(s);
  return s;
}

inline bool contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

// Split on '\n'. A trailing newline does not produce an empty last element;
// '\r' before the newline is dropped.
std::vector<std::string> split_lines(std::string_view text);

// Split on runs of whitespace.
std::vector<std::string> split_fields(std::string_view line);

std::string join(const std::vector<std::string> &parts, std::string_view sep);

std::string ensure_trailing_newline(std::string text);

// true for a literal IPv4 or IPv6 address
bool is_ip_literal(std::string_view host);

// Host part of a URL ("http://svc:8000/x" -> "svc"). Returns empty when the
// URL carries no authority.
std::string url_hostname(std::string_view url);

// Explicit port of a URL, if any.
std::optional<std::string> url_port(std::string_view url);

// Text between the first '(' and the following ')'.
std::optional<std::string> between_parens(std::string_view text);

} // namespace stringutil
} // namespace speakerctrl
