#include "util/string_util.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>

namespace speakerctrl {
namespace stringutil {

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t nl = text.find('\n', pos);
    if (nl == std::string_view::npos) {
      nl = text.size();
    }
    std::string line(text.substr(pos, nl - pos));
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    pos = nl + 1;
  }
  return lines;
}

std::vector<std::string> split_fields(std::string_view line) {
  std::vector<std::string> fields;
  size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) {
      ++i;
    }
    size_t start = i;
    while (i < line.size() &&
           !std::isspace(static_cast<unsigned char>(line[i]))) {
      ++i;
    }
    if (i > start) {
      fields.emplace_back(line.substr(start, i - start));
    }
  }
  return fields;
}

std::string join(const std::vector<std::string> &parts, std::string_view sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) {
      out.append(sep);
    }
    out.append(parts[i]);
  }
  return out;
}

std::string ensure_trailing_newline(std::string text) {
  if (!text.empty() && text.back() != '\n') {
    text.push_back('\n');
  }
  return text;
}

bool is_ip_literal(std::string_view host) {
  if (host.empty()) {
    return false;
  }
  boost::system::error_code ec;
  boost::asio::ip::make_address(std::string(host), ec);
  return !ec;
}

namespace {
// "scheme://user@host:port/path" -> "host:port"
std::string_view authority_of(std::string_view url) {
  auto scheme = url.find("://");
  if (scheme == std::string_view::npos) {
    return {};
  }
  auto rest = url.substr(scheme + 3);
  auto end = rest.find_first_of("/?#");
  if (end != std::string_view::npos) {
    rest = rest.substr(0, end);
  }
  if (auto at = rest.rfind('@'); at != std::string_view::npos) {
    rest = rest.substr(at + 1);
  }
  return rest;
}
} // namespace

std::string url_hostname(std::string_view url) {
  auto authority = authority_of(url);
  if (authority.empty()) {
    return {};
  }
  if (authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return {};
    }
    return std::string(authority.substr(1, close - 1));
  }
  auto colon = authority.find(':');
  return std::string(authority.substr(0, colon));
}

std::optional<std::string> url_port(std::string_view url) {
  auto authority = authority_of(url);
  if (authority.empty()) {
    return std::nullopt;
  }
  size_t search_from = 0;
  if (authority.front() == '[') {
    search_from = authority.find(']');
    if (search_from == std::string_view::npos) {
      return std::nullopt;
    }
  }
  auto colon = authority.find(':', search_from);
  if (colon == std::string_view::npos || colon + 1 >= authority.size()) {
    return std::nullopt;
  }
  return std::string(authority.substr(colon + 1));
}

std::optional<std::string> between_parens(std::string_view text) {
  auto open = text.find('(');
  if (open == std::string_view::npos) {
    return std::nullopt;
  }
  auto close = text.find(')', open + 1);
  if (close == std::string_view::npos) {
    return std::nullopt;
  }
  return std::string(text.substr(open + 1, close - open - 1));
}

} // namespace stringutil
} // namespace speakerctrl
