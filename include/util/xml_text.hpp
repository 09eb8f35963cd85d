#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace speakerctrl {
namespace xmltext {

// Minimal reader for the flat, namespace-free documents the speaker serves.
// No DTDs, CDATA or comments inside matched elements.

std::string escape(std::string_view text);
std::string unescape(std::string_view text);

// Unescaped text of the first <tag>...</tag> (or "" for <tag/>).
std::optional<std::string> element_text(std::string_view xml,
                                        std::string_view tag);

// Raw inner XML of every <tag ...>...</tag>, in document order.
std::vector<std::string> elements(std::string_view xml, std::string_view tag);

// Unescaped value of attr on the first <tag ...> start tag.
std::optional<std::string> attribute(std::string_view xml, std::string_view tag,
                                     std::string_view attr);

} // namespace xmltext
} // namespace speakerctrl
