#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace nspack::cli {

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* RED = "\033[0;31m";
    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* CYAN = "\033[0;36m";
    constexpr const char* BOLD_RED = "\033[1;31m";
    constexpr const char* BOLD_GREEN = "\033[1;32m";
    constexpr const char* BRIGHT_BLACK = "\033[0;90m";
}

// True when `os` is a terminal and neither --no-color nor NSPACK_NO_COLOR
// disabled colors.
bool ColorsEnabled(std::ostream& os = std::cout);

// Overrides terminal detection and the environment for the whole process.
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cout);

inline std::string Red(const std::string& text, std::ostream& os = std::cout) {
    return Colorize(text, color::RED, os);
}
inline std::string Green(const std::string& text, std::ostream& os = std::cout) {
    return Colorize(text, color::GREEN, os);
}
inline std::string Yellow(const std::string& text, std::ostream& os = std::cout) {
    return Colorize(text, color::YELLOW, os);
}
inline std::string BoldRed(const std::string& text, std::ostream& os = std::cout) {
    return Colorize(text, color::BOLD_RED, os);
}

// Stage logging, off unless --verbose or NSPACK_VERBOSE.
bool VerboseEnabled();
void SetVerbose(bool enabled);
void LogStage(const std::string& message);

}  // namespace nspack::cli
