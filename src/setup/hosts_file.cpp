#include "setup/hosts_file.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <set>

#include "util/string_util.hpp"

namespace speakerctrl::setup {

namespace {

bool is_entry(const std::string &line) {
  auto t = stringutil::trimmed(line);
  return !t.empty() && t.front() != '#';
}

} // namespace

std::string rewrite_hosts(std::string_view current, std::string_view ip,
                          const std::vector<std::string> &domains) {
  std::set<std::string> present;
  std::vector<std::string> out;
  for (auto &line : stringutil::split_lines(current)) {
    if (is_entry(line)) {
      auto fields = stringutil::split_fields(line);
      if (fields.size() >= 2 &&
          std::find(domains.begin(), domains.end(), fields[1]) !=
              domains.end()) {
        present.insert(fields[1]);
        out.push_back(fmt::format("{}\t{}", ip, fields[1]));
        continue;
      }
    }
    out.push_back(std::move(line));
  }
  for (const auto &domain : domains) {
    if (!present.count(domain)) {
      out.push_back(fmt::format("{}\t{}", ip, domain));
    }
  }
  return stringutil::ensure_trailing_newline(stringutil::join(out, "\n"));
}

std::string planned_hosts(std::string_view ip,
                          const std::vector<std::string> &domains) {
  std::vector<std::string> lines;
  lines.reserve(domains.size());
  for (const auto &domain : domains) {
    lines.push_back(fmt::format("{}\t{}", ip, domain));
  }
  return stringutil::join(lines, "\n");
}

std::string remove_hosts_entry(std::string_view current,
                               std::string_view domain) {
  std::vector<std::string> out;
  for (auto &line : stringutil::split_lines(current)) {
    if (is_entry(line)) {
      auto fields = stringutil::split_fields(line);
      if (fields.size() >= 2 && fields[1] == domain) {
        continue;
      }
    }
    out.push_back(std::move(line));
  }
  return stringutil::ensure_trailing_newline(stringutil::join(out, "\n"));
}

bool hosts_mentions_any(std::string_view current,
                        const std::vector<std::string> &domains) {
  for (const auto &line : stringutil::split_lines(current)) {
    if (!is_entry(line)) {
      continue;
    }
    for (const auto &domain : domains) {
      if (stringutil::contains(line, domain)) {
        return true;
      }
    }
  }
  return false;
}

} // namespace speakerctrl::setup
