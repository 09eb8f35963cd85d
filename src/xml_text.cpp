#include "util/xml_text.hpp"

#include <array>
#include <utility>

namespace speakerctrl {
namespace xmltext {

namespace {

constexpr std::array<std::pair<std::string_view, char>, 5> kEntities = {{
    {"&amp;", '&'},
    {"&lt;", '<'},
    {"&gt;", '>'},
    {"&quot;", '"'},
    {"&apos;", '\''},
}};

bool is_name_end(char c) {
  return c == '>' || c == '/' || c == ' ' || c == '\t' || c == '\r' ||
         c == '\n';
}

// Position of the next start tag named `tag` at or after `from`.
size_t find_start_tag(std::string_view xml, std::string_view tag,
                      size_t from) {
  while (true) {
    size_t lt = xml.find('<', from);
    if (lt == std::string_view::npos) {
      return std::string_view::npos;
    }
    if (xml.compare(lt + 1, tag.size(), tag) == 0 &&
        lt + 1 + tag.size() < xml.size() &&
        is_name_end(xml[lt + 1 + tag.size()])) {
      return lt;
    }
    from = lt + 1;
  }
}

struct Span {
  size_t start_tag{std::string_view::npos};
  size_t inner_begin{0};
  size_t inner_end{0};
  size_t end{0};
  bool self_closing{false};
};

std::optional<Span> find_element(std::string_view xml, std::string_view tag,
                                 size_t from) {
  Span span;
  span.start_tag = find_start_tag(xml, tag, from);
  if (span.start_tag == std::string_view::npos) {
    return std::nullopt;
  }
  size_t gt = xml.find('>', span.start_tag);
  if (gt == std::string_view::npos) {
    return std::nullopt;
  }
  if (gt > 0 && xml[gt - 1] == '/') {
    span.self_closing = true;
    span.inner_begin = span.inner_end = gt + 1;
    span.end = gt + 1;
    return span;
  }
  span.inner_begin = gt + 1;
  std::string close = "</" + std::string(tag) + ">";
  size_t close_pos = xml.find(close, span.inner_begin);
  if (close_pos == std::string_view::npos) {
    return std::nullopt;
  }
  span.inner_end = close_pos;
  span.end = close_pos + close.size();
  return span;
}

} // namespace

std::string escape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      out.append("&amp;");
      break;
    case '<':
      out.append("&lt;");
      break;
    case '>':
      out.append("&gt;");
      break;
    case '"':
      out.append("&quot;");
      break;
    case '\'':
      out.append("&apos;");
      break;
    default:
      out.push_back(c);
    }
  }
  return out;
}

std::string unescape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size();) {
    if (text[i] == '&') {
      bool matched = false;
      for (const auto &[entity, ch] : kEntities) {
        if (text.compare(i, entity.size(), entity) == 0) {
          out.push_back(ch);
          i += entity.size();
          matched = true;
          break;
        }
      }
      if (matched) {
        continue;
      }
    }
    out.push_back(text[i++]);
  }
  return out;
}

std::optional<std::string> element_text(std::string_view xml,
                                        std::string_view tag) {
  auto span = find_element(xml, tag, 0);
  if (!span) {
    return std::nullopt;
  }
  return unescape(
      xml.substr(span->inner_begin, span->inner_end - span->inner_begin));
}

std::vector<std::string> elements(std::string_view xml, std::string_view tag) {
  std::vector<std::string> out;
  size_t from = 0;
  while (auto span = find_element(xml, tag, from)) {
    out.emplace_back(
        xml.substr(span->inner_begin, span->inner_end - span->inner_begin));
    from = span->end;
  }
  return out;
}

std::optional<std::string> attribute(std::string_view xml, std::string_view tag,
                                     std::string_view attr) {
  size_t lt = find_start_tag(xml, tag, 0);
  if (lt == std::string_view::npos) {
    return std::nullopt;
  }
  size_t gt = xml.find('>', lt);
  if (gt == std::string_view::npos) {
    return std::nullopt;
  }
  auto start_tag = xml.substr(lt, gt - lt);
  size_t pos = 0;
  while (true) {
    pos = start_tag.find(attr, pos);
    if (pos == std::string_view::npos) {
      return std::nullopt;
    }
    bool boundary_before = pos > 0 && (start_tag[pos - 1] == ' ' ||
                                       start_tag[pos - 1] == '\t' ||
                                       start_tag[pos - 1] == '\n');
    size_t eq = pos + attr.size();
    while (eq < start_tag.size() && start_tag[eq] == ' ') {
      ++eq;
    }
    if (boundary_before && eq < start_tag.size() && start_tag[eq] == '=') {
      size_t q = eq + 1;
      while (q < start_tag.size() && start_tag[q] == ' ') {
        ++q;
      }
      if (q < start_tag.size() && (start_tag[q] == '"' || start_tag[q] == '\'')) {
        char quote = start_tag[q];
        size_t close = start_tag.find(quote, q + 1);
        if (close == std::string_view::npos) {
          return std::nullopt;
        }
        return unescape(start_tag.substr(q + 1, close - q - 1));
      }
    }
    pos += attr.size();
  }
}

} // namespace xmltext
} // namespace speakerctrl
