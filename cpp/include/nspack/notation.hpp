#pragma once

#include <string>
#include <string_view>

namespace nspack::notation {

// Rewrites LaTeX-style math notation in UTF-8 text into characters the
// handheld font can render: \commands from a fixed table, ^x / ^{...}
// superscripts and _x / _{...} subscripts. A group with any unmappable
// character is emitted as "(group)". Unknown commands are kept verbatim.
std::string LatexToUnicode(std::string_view input);

}  // namespace nspack::notation
