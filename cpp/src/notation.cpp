#include "nspack/notation.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>

namespace nspack::notation {

namespace {

using Table = std::unordered_map<std::string_view, std::string_view>;
using CharTable = std::unordered_map<char, std::string_view>;

const Table& Commands() {
    static const Table kCommands = {
        // Greek lowercase
        {"\\alpha", "α"}, {"\\beta", "β"}, {"\\gamma", "γ"}, {"\\delta", "δ"},
        {"\\epsilon", "ε"}, {"\\varepsilon", "ε"}, {"\\zeta", "ζ"}, {"\\eta", "η"},
        {"\\theta", "θ"}, {"\\vartheta", "ϑ"}, {"\\iota", "ι"}, {"\\kappa", "κ"},
        {"\\lambda", "λ"}, {"\\mu", "μ"}, {"\\nu", "ν"}, {"\\xi", "ξ"},
        {"\\pi", "π"}, {"\\varpi", "ϖ"}, {"\\rho", "ρ"}, {"\\varrho", "ϱ"},
        {"\\sigma", "σ"}, {"\\varsigma", "ς"}, {"\\tau", "τ"}, {"\\upsilon", "υ"},
        {"\\phi", "φ"}, {"\\varphi", "ϕ"}, {"\\chi", "χ"}, {"\\psi", "ψ"},
        {"\\omega", "ω"},
        // Greek uppercase is spelled out; the device font lacks most glyphs.
        {"\\Gamma", "Gamma"}, {"\\Delta", "Delta"}, {"\\Theta", "Theta"},
        {"\\Lambda", "Lambda"}, {"\\Xi", "Xi"}, {"\\Pi", "Pi"}, {"\\Sigma", "Sigma"},
        {"\\Upsilon", "Upsilon"}, {"\\Phi", "Phi"}, {"\\Psi", "Psi"}, {"\\Omega", "Omega"},
        // Operators
        {"\\times", "×"}, {"\\div", "÷"}, {"\\cdot", "·"}, {"\\pm", "±"},
        {"\\mp", "∓"}, {"\\ast", "∗"}, {"\\star", "⋆"}, {"\\circ", "∘"},
        {"\\bullet", "•"},
        // Relations
        {"\\leq", "≤"}, {"\\le", "≤"}, {"\\geq", "≥"}, {"\\ge", "≥"},
        {"\\neq", "≠"}, {"\\ne", "≠"}, {"\\approx", "≈"}, {"\\equiv", "≡"},
        {"\\sim", "∼"}, {"\\simeq", "≃"}, {"\\cong", "≅"}, {"\\propto", "∝"},
        {"\\ll", "≪"}, {"\\gg", "≫"},
        // Sets
        {"\\subset", "<"}, {"\\supset", ">"}, {"\\subseteq", "<="}, {"\\supseteq", ">="},
        {"\\in", "in"}, {"\\notin", "not in"}, {"\\ni", "ni"}, {"\\perp", "_|_"},
        {"\\parallel", "||"},
        // Arrows
        {"\\leftarrow", "<-"}, {"\\rightarrow", "->"}, {"\\to", "->"}, {"\\uparrow", "^"},
        {"\\downarrow", "v"}, {"\\leftrightarrow", "<->"}, {"\\Leftarrow", "<="},
        {"\\Rightarrow", "=>"}, {"\\implies", "=>"}, {"\\Leftrightarrow", "<=>"},
        {"\\iff", "<=>"}, {"\\mapsto", "|->"},
        // Big operators
        {"\\sum", "SUM"}, {"\\prod", "PROD"}, {"\\coprod", "COPROD"}, {"\\int", "INT"},
        {"\\oint", "OINT"}, {"\\iint", "IINT"}, {"\\iiint", "IIINT"}, {"\\bigcup", "UNION"},
        {"\\bigcap", "INTERSECT"}, {"\\bigoplus", "OPLUS"}, {"\\bigotimes", "OTIMES"},
        // Misc
        {"\\infty", "inf"}, {"\\partial", "d"}, {"\\nabla", "nabla"}, {"\\forall", "forall"},
        {"\\exists", "exists"}, {"\\nexists", "!exists"}, {"\\emptyset", "{}"},
        {"\\varnothing", "{}"}, {"\\neg", "NOT"}, {"\\lnot", "NOT"}, {"\\land", "AND"},
        {"\\wedge", "AND"}, {"\\lor", "OR"}, {"\\vee", "OR"}, {"\\cap", "n"}, {"\\cup", "U"},
        {"\\setminus", "\\"}, {"\\angle", "<"}, {"\\triangle", "^"}, {"\\square", "[]"},
        {"\\diamond", "<>"}, {"\\clubsuit", "club"}, {"\\diamondsuit", "diamond"},
        {"\\heartsuit", "heart"}, {"\\spadesuit", "spade"}, {"\\aleph", "aleph"},
        {"\\wp", "P"}, {"\\Re", "Re"}, {"\\Im", "Im"}, {"\\hbar", "hbar"}, {"\\ell", "l"},
        {"\\prime", "'"}, {"\\degree", "deg"}, {"\\deg", "deg"},
        // Roots and vulgar fractions
        {"\\sqrt", "√"}, {"\\cbrt", "∛"},
        {"\\frac12", "½"}, {"\\frac13", "⅓"}, {"\\frac23", "⅔"}, {"\\frac14", "¼"},
        {"\\frac34", "¾"}, {"\\frac15", "⅕"}, {"\\frac25", "⅖"}, {"\\frac35", "⅗"},
        {"\\frac45", "⅘"}, {"\\frac16", "⅙"}, {"\\frac56", "⅚"}, {"\\frac18", "⅛"},
        {"\\frac38", "⅜"}, {"\\frac58", "⅝"}, {"\\frac78", "⅞"},
        // Spacing
        {"\\,", " "}, {"\\;", " "}, {"\\:", " "}, {"\\!", ""}, {"\\quad", "  "},
        {"\\qquad", "    "}, {"\\ldots", "…"}, {"\\cdots", "⋯"}, {"\\vdots", "⋮"},
        {"\\ddots", "⋱"},
        // Brackets
        {"\\langle", "⟨"}, {"\\rangle", "⟩"}, {"\\lceil", "⌈"}, {"\\rceil", "⌉"},
        {"\\lfloor", "⌊"}, {"\\rfloor", "⌋"}, {"\\lvert", "|"}, {"\\rvert", "|"},
        {"\\|", "‖"}, {"\\lVert", "‖"}, {"\\rVert", "‖"},
    };
    return kCommands;
}

const CharTable& Superscripts() {
    static const CharTable kSuperscripts = {
        {'0', "⁰"}, {'1', "¹"}, {'2', "²"}, {'3', "³"}, {'4', "⁴"}, {'5', "⁵"},
        {'6', "⁶"}, {'7', "⁷"}, {'8', "⁸"}, {'9', "⁹"}, {'+', "⁺"}, {'-', "⁻"},
        {'=', "⁼"}, {'(', "⁽"}, {')', "⁾"}, {'n', "ⁿ"}, {'i', "ⁱ"}, {'x', "ˣ"},
        {'y', "ʸ"},
    };
    return kSuperscripts;
}

const CharTable& Subscripts() {
    static const CharTable kSubscripts = {
        {'0', "₀"}, {'1', "₁"}, {'2', "₂"}, {'3', "₃"}, {'4', "₄"}, {'5', "₅"},
        {'6', "₆"}, {'7', "₇"}, {'8', "₈"}, {'9', "₉"}, {'+', "₊"}, {'-', "₋"},
        {'=', "₌"}, {'(', "₍"}, {')', "₎"}, {'a', "ₐ"}, {'e', "ₑ"}, {'h', "ₕ"},
        {'i', "ᵢ"}, {'j', "ⱼ"}, {'k', "ₖ"}, {'l', "ₗ"}, {'m', "ₘ"}, {'n', "ₙ"},
        {'o', "ₒ"}, {'p', "ₚ"}, {'r', "ᵣ"}, {'s', "ₛ"}, {'t', "ₜ"}, {'u', "ᵤ"},
        {'v', "ᵥ"}, {'x', "ₓ"},
    };
    return kSubscripts;
}

bool IsAsciiAlpha(char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

// Byte length of the UTF-8 sequence starting at pos, clipped to the input.
std::size_t CodePointLen(std::string_view text, std::size_t pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t len = 1;
    if ((lead & 0xE0) == 0xC0) {
        len = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
    }
    return std::min(len, text.size() - pos);
}

std::optional<std::string_view> Lookup(std::string_view key) {
    const auto& table = Commands();
    auto it = table.find(key);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

// Returns the replacement and the number of input bytes it covers.
std::optional<std::pair<std::string_view, std::size_t>> MatchCommand(std::string_view input,
                                                                     std::size_t start) {
    std::size_t end = start + 1;
    while (end < input.size() && IsAsciiAlpha(input[end])) {
        ++end;
    }
    const std::string_view command = input.substr(start, end - start);

    if (command == "\\frac" && end + 1 < input.size()) {
        std::string fraction(command);
        fraction.push_back(input[end]);
        fraction.push_back(input[end + 1]);
        if (auto hit = Lookup(fraction)) {
            return std::make_pair(*hit, end + 2 - start);
        }
    }
    if (auto hit = Lookup(command)) {
        return std::make_pair(*hit, end - start);
    }
    if (start + 1 < input.size()) {
        if (auto hit = Lookup(input.substr(start, 2))) {
            return std::make_pair(*hit, std::size_t{2});
        }
    }
    return std::nullopt;
}

void MapCodePoint(std::string_view piece, const CharTable& table, std::string& out, bool& all_mapped) {
    if (piece.size() == 1) {
        auto it = table.find(piece[0]);
        if (it != table.end()) {
            out += it->second;
            return;
        }
    }
    all_mapped = false;
    out += piece;
}

// Converts the operand of ^ or _ starting at `start`.
std::optional<std::pair<std::string, std::size_t>> ConvertScript(std::string_view input,
                                                                 std::size_t start,
                                                                 const CharTable& table) {
    if (start >= input.size()) {
        return std::nullopt;
    }
    std::string mapped;
    std::string original;
    bool all_mapped = true;
    std::size_t consumed = 0;

    if (input[start] == '{') {
        std::size_t i = start + 1;
        while (i < input.size() && input[i] != '}') {
            const std::string_view piece = input.substr(i, CodePointLen(input, i));
            original += piece;
            MapCodePoint(piece, table, mapped, all_mapped);
            i += piece.size();
        }
        if (i >= input.size()) {
            return std::nullopt;
        }
        consumed = i - start + 1;
    } else {
        const std::string_view piece = input.substr(start, CodePointLen(input, start));
        original += piece;
        MapCodePoint(piece, table, mapped, all_mapped);
        consumed = piece.size();
    }

    if (mapped.empty()) {
        return std::nullopt;
    }
    if (!all_mapped) {
        return std::make_pair("(" + original + ")", consumed);
    }
    return std::make_pair(std::move(mapped), consumed);
}

}  // namespace

std::string LatexToUnicode(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        const char ch = input[i];
        if (ch == '\\') {
            if (auto hit = MatchCommand(input, i)) {
                out += hit->first;
                i += hit->second;
                continue;
            }
        } else if (ch == '^' || ch == '_') {
            const CharTable& table = ch == '^' ? Superscripts() : Subscripts();
            if (auto script = ConvertScript(input, i + 1, table)) {
                out += script->first;
                i += 1 + script->second;
                continue;
            }
        }
        out.push_back(ch);
        ++i;
    }
    return out;
}

}  // namespace nspack::notation
