#include "setup/dns_probe.hpp"

#include <fmt/format.h>

#include <charconv>
#include <vector>

#include "util/string_util.hpp"

namespace speakerctrl::setup {

namespace {

bool is_label_char(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '-';
}

void push_u16(std::vector<unsigned char> &out, std::uint16_t v) {
  out.push_back(static_cast<unsigned char>(v >> 8));
  out.push_back(static_cast<unsigned char>(v & 0xff));
}

bool all_digits(std::string_view s) {
  if (s.empty()) {
    return false;
  }
  for (char c : s) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

} // namespace

std::string dns_query_escape(std::string_view domain,
                             std::uint16_t transaction_id) {
  std::vector<unsigned char> msg;
  push_u16(msg, transaction_id);
  push_u16(msg, 0x0100); // recursion desired
  push_u16(msg, 1);      // QDCOUNT
  push_u16(msg, 0);
  push_u16(msg, 0);
  push_u16(msg, 0);

  std::vector<bool> literal(msg.size(), false);
  size_t start = 0;
  while (start <= domain.size()) {
    auto dot = domain.find('.', start);
    auto label = domain.substr(
        start, dot == std::string_view::npos ? std::string_view::npos
                                             : dot - start);
    if (!label.empty()) {
      msg.push_back(static_cast<unsigned char>(label.size()));
      literal.push_back(false);
      for (char c : label) {
        msg.push_back(static_cast<unsigned char>(c));
        literal.push_back(is_label_char(static_cast<unsigned char>(c)));
      }
    }
    if (dot == std::string_view::npos) {
      break;
    }
    start = dot + 1;
  }
  msg.push_back(0);
  push_u16(msg, 1); // QTYPE A
  push_u16(msg, 1); // QCLASS IN
  literal.resize(msg.size(), false);

  std::string out = fmt::format("\\x{:02x}\\x{:02x}", (msg.size() >> 8) & 0xff,
                                msg.size() & 0xff);
  for (size_t i = 0; i < msg.size(); ++i) {
    if (literal[i]) {
      out.push_back(static_cast<char>(msg[i]));
    } else {
      out += fmt::format("\\x{:02x}", msg[i]);
    }
  }
  return out;
}

std::optional<std::string> parse_od_ipv4(std::string_view od_output) {
  auto fields = stringutil::split_fields(od_output);
  if (fields.size() != 4) {
    return std::nullopt;
  }
  for (const auto &f : fields) {
    int v = -1;
    auto [ptr, ec] = std::from_chars(f.data(), f.data() + f.size(), v);
    if (ec != std::errc{} || ptr != f.data() + f.size() || v < 0 || v > 255) {
      return std::nullopt;
    }
  }
  return fmt::format("{}.{}.{}.{}", fields[0], fields[1], fields[2], fields[3]);
}

std::string dns_port_of(std::string_view bind_addr) {
  auto colon = bind_addr.rfind(':');
  auto port = colon == std::string_view::npos ? bind_addr
                                              : bind_addr.substr(colon + 1);
  if (all_digits(port)) {
    return std::string(port);
  }
  return "53";
}

} // namespace speakerctrl::setup
