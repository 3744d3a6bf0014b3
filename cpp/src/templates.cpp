#include "nspack/templates.hpp"

#include "nspack/constants.hpp"
#include "nspack/error.hpp"
#include "nspack/notation.hpp"

#include <array>
#include <string>

namespace nspack::templates {

namespace {

// Fixed tables in the device's compact XML encoding.
constexpr std::array<std::uint8_t, 280> kLuaPrologue = {
    0x54, 0x49, 0x58, 0x43, 0x30, 0x31, 0x30, 0x30, 0x2D, 0x31, 0x2E, 0x30,
    0x3F, 0x3E, 0x3C, 0x70, 0x72, 0x6F, 0x62, 0x20, 0x78, 0x6D, 0x6C, 0x6E,
    0x73, 0x3D, 0x22, 0x75, 0x72, 0x6E, 0x3A, 0x54, 0x49, 0x2E, 0x50, 0xA8,
    0x5F, 0x5B, 0x1F, 0x0A, 0x22, 0x20, 0x76, 0x65, 0x72, 0x3D, 0x22, 0x31,
    0x2E, 0x30, 0x22, 0x20, 0x70, 0x62, 0x6E, 0x61, 0x6D, 0x65, 0x3D, 0x22,
    0x22, 0x3E, 0x3C, 0x73, 0x79, 0x6D, 0x3E, 0x0E, 0x01, 0x3C, 0x63, 0x61,
    0x72, 0x64, 0x20, 0x63, 0x6C, 0x61, 0x79, 0x3D, 0x22, 0x30, 0x22, 0x20,
    0x68, 0x31, 0x3D, 0x22, 0xF1, 0x00, 0x00, 0xFF, 0x22, 0x20, 0x68, 0x32,
    0x3D, 0x22, 0xF1, 0x00, 0x00, 0xFF, 0x22, 0x20, 0x77, 0x31, 0x3D, 0x22,
    0xF1, 0x00, 0x00, 0xFF, 0x22, 0x20, 0x77, 0x32, 0x3D, 0x22, 0xF1, 0x00,
    0x00, 0xFF, 0x22, 0x3E, 0x3C, 0x69, 0x73, 0x44, 0x75, 0x6D, 0x6D, 0x79,
    0x43, 0x61, 0x72, 0x64, 0x3E, 0x30, 0x0E, 0x03, 0x3C, 0x66, 0x6C, 0x61,
    0x67, 0x3E, 0x30, 0x0E, 0x04, 0x3C, 0x77, 0x64, 0x67, 0x74, 0x20, 0x78,
    0x6D, 0x6C, 0x6E, 0x73, 0x3A, 0x73, 0x63, 0x3D, 0x22, 0x75, 0x72, 0x6E,
    0x3A, 0x54, 0x49, 0x2E, 0x53, 0xAC, 0x84, 0xF2, 0x2A, 0x41, 0x70, 0x70,
    0x22, 0x20, 0x74, 0x79, 0x70, 0x65, 0x3D, 0x22, 0x54, 0x49, 0x2E, 0x53,
    0xAC, 0x84, 0xF2, 0x2A, 0x41, 0x70, 0x70, 0x22, 0x20, 0x76, 0x65, 0x72,
    0x3D, 0x22, 0x31, 0x2E, 0x30, 0x22, 0x3E, 0x3C, 0x73, 0x63, 0x3A, 0x6D,
    0x46, 0x6C, 0x61, 0x67, 0x73, 0x3E, 0x30, 0x0E, 0x06, 0x3C, 0x73, 0x63,
    0x3A, 0x76, 0x61, 0x6C, 0x75, 0x65, 0x3E, 0x2D, 0x31, 0x0E, 0x07, 0x3C,
    0x73, 0x63, 0x3A, 0x73, 0x63, 0x72, 0x69, 0x70, 0x74, 0x20, 0x76, 0x65,
    0x72, 0x73, 0x69, 0x6F, 0x6E, 0x3D, 0x22, 0x35, 0x31, 0x32, 0x22, 0x20,
    0x69, 0x64, 0x3D, 0x22, 0x30, 0x22, 0x3E, 0x3C, 0x21, 0x5B, 0x43, 0x44,
    0x41, 0x54, 0x41, 0x5B,
};

constexpr std::array<std::uint8_t, 11> kLuaEpilogue = {
    0x5D, 0x5D, 0x3E, 0x0E, 0x08, 0x0E, 0x05, 0x0E, 0x02, 0x0E, 0x00,
};

constexpr std::array<std::uint8_t, 242> kPythonPrologue = {
    0x54, 0x49, 0x58, 0x43, 0x30, 0x31, 0x30, 0x30, 0x2D, 0x31, 0x2E, 0x30,
    0x3F, 0x3E, 0x3C, 0x70, 0x72, 0x6F, 0x62, 0x20, 0x78, 0x6D, 0x6C, 0x6E,
    0x73, 0x3D, 0x22, 0x75, 0x72, 0x6E, 0x3A, 0x54, 0x49, 0x2E, 0x50, 0x72,
    0x6F, 0x62, 0x6C, 0x65, 0x6D, 0x22, 0x20, 0x76, 0x65, 0x72, 0x3D, 0x22,
    0x31, 0x2E, 0x30, 0x22, 0x20, 0x70, 0x62, 0x6E, 0x61, 0x6D, 0x65, 0x3D,
    0x22, 0x22, 0x3E, 0x3C, 0x73, 0x79, 0x6D, 0x3E, 0x0E, 0x01, 0x3C, 0x63,
    0x61, 0x72, 0x64, 0x20, 0x63, 0x6C, 0x61, 0x79, 0x3D, 0x22, 0x30, 0x22,
    0x20, 0x68, 0x31, 0x3D, 0x22, 0x31, 0x30, 0x30, 0x30, 0x30, 0x22, 0x20,
    0x68, 0x32, 0x3D, 0x22, 0x31, 0x30, 0x30, 0x30, 0x30, 0x22, 0x20, 0x77,
    0x31, 0x3D, 0x22, 0x31, 0x30, 0x30, 0x30, 0x30, 0x22, 0x20, 0x77, 0x32,
    0x3D, 0x22, 0x31, 0x30, 0x30, 0x30, 0x30, 0x22, 0x3E, 0x3C, 0x69, 0x73,
    0x44, 0x75, 0x6D, 0x6D, 0x79, 0x43, 0x61, 0x72, 0x64, 0x3E, 0x30, 0x0E,
    0x03, 0x3C, 0x66, 0x6C, 0x61, 0x67, 0x3E, 0x30, 0x0E, 0x04, 0x3C, 0x77,
    0x64, 0x67, 0x74, 0x20, 0x78, 0x6D, 0x6C, 0x6E, 0x73, 0x3A, 0x70, 0x79,
    0x3D, 0x22, 0x75, 0x72, 0x6E, 0x3A, 0x54, 0x49, 0x2E, 0x50, 0x79, 0x74,
    0x68, 0x6F, 0x6E, 0x45, 0x64, 0x69, 0x74, 0x6F, 0x72, 0x22, 0x20, 0x74,
    0x79, 0x70, 0x65, 0x3D, 0x22, 0x54, 0x49, 0x2E, 0x50, 0x79, 0x74, 0x68,
    0x6F, 0x6E, 0x45, 0x64, 0x69, 0x74, 0x6F, 0x72, 0x22, 0x20, 0x76, 0x65,
    0x72, 0x3D, 0x22, 0x31, 0x2E, 0x30, 0x22, 0x3E, 0x3C, 0x70, 0x79, 0x3A,
    0x64, 0x61, 0x74, 0x61, 0x3E, 0x3C, 0x70, 0x79, 0x3A, 0x6E, 0x61, 0x6D,
    0x65, 0x3E,
};

constexpr std::array<std::uint8_t, 61> kPythonEpilogue = {
    0x0E, 0x07, 0x3C, 0x70, 0x79, 0x3A, 0x64, 0x69, 0x72, 0x66, 0x3E, 0x2D,
    0x31, 0x30, 0x30, 0x30, 0x30, 0x30, 0x30, 0x30, 0x0E, 0x08, 0x0E, 0x06,
    0x3C, 0x70, 0x79, 0x3A, 0x6D, 0x46, 0x6C, 0x61, 0x67, 0x73, 0x3E, 0x31,
    0x30, 0x32, 0x34, 0x0E, 0x09, 0x3C, 0x70, 0x79, 0x3A, 0x76, 0x61, 0x6C,
    0x75, 0x65, 0x3E, 0x31, 0x30, 0x0E, 0x0A, 0x0E, 0x05, 0x0E, 0x02, 0x0E,
    0x00,
};

constexpr std::array<std::uint8_t, 304> kDefaultDocument = {
    0x0F, 0xCE, 0xD8, 0xD2, 0x81, 0x06, 0x86, 0x5B, 0x4A, 0x4A, 0xC5, 0xCE,
    0xA9, 0x16, 0xF2, 0xD5, 0x1D, 0xA8, 0x2F, 0x6E, 0x00, 0x22, 0xF2, 0xF0,
    0xC1, 0xA6, 0x06, 0x77, 0x4D, 0x7E, 0xA6, 0xC0, 0x3A, 0xF0, 0x5C, 0x74,
    0xBA, 0xAA, 0x44, 0x60, 0xCD, 0x58, 0xE6, 0x70, 0xD7, 0x40, 0xF6, 0x9C,
    0x17, 0xDC, 0xF0, 0x94, 0x77, 0xBF, 0xCA, 0xDE, 0xF7, 0x02, 0x09, 0xC9,
    0x62, 0xB1, 0x5D, 0xEF, 0x22, 0xFA, 0x51, 0x37, 0xA0, 0x81, 0x91, 0x48,
    0xE1, 0x83, 0x4D, 0xAD, 0x08, 0x31, 0x2D, 0xD0, 0xD3, 0xE3, 0x2D, 0x60,
    0xAB, 0x13, 0xC2, 0x98, 0x2B, 0xED, 0x39, 0x5B, 0x09, 0x24, 0x39, 0x92,
    0x2F, 0x0C, 0x7A, 0x4C, 0x95, 0x74, 0x91, 0x3B, 0x0C, 0xF4, 0x60, 0xCC,
    0x73, 0x27, 0xCB, 0x07, 0x7E, 0x7F, 0xA9, 0x17, 0x87, 0xE2, 0xAC, 0xA2,
    0x3B, 0xCC, 0xA0, 0xC4, 0xE3, 0x8E, 0x89, 0xF0, 0xC0, 0x51, 0x9F, 0xC2,
    0xBE, 0xCE, 0x28, 0x45, 0xC3, 0xD4, 0x11, 0x90, 0xA6, 0xEC, 0x53, 0xA0,
    0xFB, 0x5B, 0x46, 0x6B, 0x41, 0xAD, 0xE9, 0x53, 0xBB, 0x97, 0xDB, 0xB1,
    0xD2, 0x68, 0xE2, 0xF6, 0x36, 0x0F, 0x26, 0x36, 0x75, 0x9B, 0xE9, 0x1F,
    0x48, 0xAD, 0xE9, 0x29, 0x67, 0x00, 0x58, 0x19, 0xC3, 0xC0, 0x12, 0x76,
    0xA0, 0x4A, 0x73, 0xF3, 0xB1, 0xD3, 0x09, 0x18, 0xD6, 0x06, 0xDD, 0x97,
    0x24, 0x53, 0x3E, 0x22, 0xA4, 0xFB, 0x82, 0x50, 0x7B, 0x7C, 0x12, 0x88,
    0x4E, 0x7D, 0x41, 0x80, 0xFE, 0x72, 0x92, 0x29, 0x87, 0xE8, 0x5C, 0x56,
    0x72, 0xFF, 0x29, 0x16, 0x8C, 0x42, 0x5B, 0x8B, 0x9B, 0xA7, 0xD2, 0x08,
    0x6D, 0xD3, 0x98, 0xFF, 0x91, 0xA9, 0x9E, 0xF3, 0x93, 0xA8, 0x2E, 0x1C,
    0xB2, 0xA9, 0x6B, 0x6A, 0xDF, 0xF6, 0xCE, 0x2D, 0x15, 0x17, 0xCE, 0x6E,
    0xC0, 0x4F, 0x9A, 0x9C, 0x0E, 0xDF, 0x19, 0x8D, 0x2D, 0xFA, 0x69, 0x9F,
    0x11, 0xD2, 0x20, 0x12, 0xE0, 0x79, 0x14, 0x04, 0x4E, 0x62, 0x8F, 0x0A,
    0x2A, 0x18, 0x72, 0x5A, 0x8B, 0x80, 0xB3, 0x3C, 0x9B, 0xD5, 0x67, 0x59,
    0x4B, 0x51, 0x4D, 0xE0, 0xC3, 0x38, 0x28, 0xC3, 0xDC, 0xCD, 0x39, 0x22,
    0x12, 0x8C, 0x40, 0x55,
};

constexpr std::array<std::uint8_t, 40> kProtectedHeader = {
    0x0F, 0xCE, 0xD8, 0xD2, 0x81, 0x06, 0x86, 0x5B, 0x99, 0xDD, 0xA2, 0x3D,
    0xD9, 0xE9, 0x4B, 0xD4, 0x31, 0xBB, 0x50, 0xB6, 0x4D, 0xB3, 0x29, 0x24,
    0x70, 0x60, 0x49, 0x38, 0x1C, 0x30, 0xF8, 0x99, 0x00, 0x4B, 0x92, 0x64,
    0xE4, 0x58, 0xE6, 0xBC,
};

constexpr std::string_view kCdataRestart = "]]><![CDATA[";
constexpr std::size_t kMaxLongStringLevel = 10;

constexpr std::string_view kViewerBody = R"lua(
local FONT_SIZE = 11
local LINE_HEIGHT = 15
local MARGIN_X = 4
local MARGIN_TOP = 20
local scroll = 0
local max_scroll = 0
local wrapped_lines = {}

-- Wrap text to fit screen width
function wrap_text(gc, txt, max_width)
    wrapped_lines = {}
    for line in (txt .. "\n"):gmatch("([^\r\n]*)\r?\n") do
        if line == "" then
            table.insert(wrapped_lines, "")
        else
            local current = ""
            for word in line:gmatch("%S+") do
                local test = current == "" and word or (current .. " " .. word)
                if gc:getStringWidth(test) > max_width then
                    if current ~= "" then
                        table.insert(wrapped_lines, current)
                    end
                    -- Handle very long words
                    if gc:getStringWidth(word) > max_width then
                        local chars = ""
                        for c in word:gmatch(".") do
                            if gc:getStringWidth(chars .. c) > max_width then
                                table.insert(wrapped_lines, chars)
                                chars = c
                            else
                                chars = chars .. c
                            end
                        end
                        current = chars
                    else
                        current = word
                    end
                else
                    current = test
                end
            end
            if current ~= "" then
                table.insert(wrapped_lines, current)
            end
        end
    end
end

function on.paint(gc)
    gc:setFont("sansserif", "r", FONT_SIZE)
    local w, h = platform.window:width(), platform.window:height()

    if #wrapped_lines == 0 then
        wrap_text(gc, text, w - MARGIN_X * 2)
    end

    local y = MARGIN_TOP - scroll
    for _, line in ipairs(wrapped_lines) do
        if y + LINE_HEIGHT > 0 and y < h then
            gc:drawString(line, MARGIN_X, y)
        end
        y = y + LINE_HEIGHT
    end

    max_scroll = math.max(0, #wrapped_lines * LINE_HEIGHT - h + MARGIN_TOP + 10)
end

function on.arrowKey(key)
    if key == "up" then
        scroll = math.max(0, scroll - LINE_HEIGHT)
    elseif key == "down" then
        scroll = math.min(max_scroll, scroll + LINE_HEIGHT)
    end
    platform.window:invalidate()
end

function on.enterKey()
    scroll = 0
    platform.window:invalidate()
end

function on.resize()
    wrapped_lines = {}
    platform.window:invalidate()
end

platform.window:invalidate()
)lua";

template <std::size_t N>
void Append(Bytes& out, const std::array<std::uint8_t, N>& table) {
    out.insert(out.end(), table.begin(), table.end());
}

void Append(Bytes& out, std::string_view text) {
    out.insert(out.end(), text.begin(), text.end());
}

}  // namespace

std::string FixCdataEnd(std::string_view script) {
    std::string out;
    out.reserve(script.size());
    std::size_t i = 0;
    while (i < script.size()) {
        if (script.compare(i, 3, "]]>") == 0) {
            out += "]]";
            out += kCdataRestart;
            i += 2;
        } else {
            out.push_back(script[i]);
            i += 1;
        }
    }
    return out;
}

Bytes WrapLuaScript(std::string_view script) {
    const std::string fixed = FixCdataEnd(script);
    Bytes out;
    out.reserve(kLuaPrologue.size() + fixed.size() + kLuaEpilogue.size());
    Append(out, kLuaPrologue);
    Append(out, fixed);
    Append(out, kLuaEpilogue);
    return out;
}

Bytes WrapPythonScript(std::string_view filename) {
    if (filename.size() > constants::kMaxCompanionNameLen) {
        throw Error(ErrorKind::InvalidInput, "Python script filenames limited to 240 characters");
    }
    Bytes out;
    out.reserve(kPythonPrologue.size() + filename.size() + kPythonEpilogue.size());
    Append(out, kPythonPrologue);
    Append(out, filename);
    Append(out, kPythonEpilogue);
    return out;
}

std::string LongStringLevel(std::string_view text) {
    std::string level;
    while (text.find("]" + level + "]") != std::string_view::npos) {
        level.push_back('=');
        if (level.size() > kMaxLongStringLevel) {
            break;
        }
    }
    return level;
}

std::string TextToLuaScript(std::string_view text) {
    const std::string rendered = notation::LatexToUnicode(text);
    const std::string level = LongStringLevel(rendered);
    std::string script = "-- Text Note (generated by nspack)\n";
    script += "local text = [" + level + "[" + rendered + "]" + level + "]\n";
    script += kViewerBody;
    return script;
}

Bytes DefaultDocument() {
    return Bytes(kDefaultDocument.begin(), kDefaultDocument.end());
}

Bytes ProtectedHeader() {
    return Bytes(kProtectedHeader.begin(), kProtectedHeader.end());
}

}  // namespace nspack::templates
