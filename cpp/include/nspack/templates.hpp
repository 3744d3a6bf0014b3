#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace nspack::templates {

using Bytes = std::vector<std::uint8_t>;

// Splits every "]]>" so the script cannot close the enclosing CDATA section.
std::string FixCdataEnd(std::string_view script);

// Problem document for a Lua script, embedded in a CDATA section.
Bytes WrapLuaScript(std::string_view script);

// Problem document for a Python script stored beside it as `filename`.
// Throws Error(InvalidInput) for names longer than 240 bytes.
Bytes WrapPythonScript(std::string_view filename);

// The "=" run for a Lua long string [=*[ ... ]=*] that `text` cannot close.
std::string LongStringLevel(std::string_view text);

// Lua viewer program that shows `text` (after notation substitution) in a
// scrollable, word-wrapped page.
std::string TextToLuaScript(std::string_view text);

// Pre-protected default Document.xml body.
Bytes DefaultDocument();

// Vendor header that precedes every protected problem payload.
Bytes ProtectedHeader();

}  // namespace nspack::templates
