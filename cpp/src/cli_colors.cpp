#include "nspack/cli_colors.hpp"

#include "nspack/constants.hpp"
#include "nspack/env.hpp"

#include <cstdio>
#include <optional>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #define isatty _isatty
    #define fileno _fileno
#else
    #include <unistd.h>
#endif

namespace nspack::cli {

namespace {
    std::optional<bool> g_colors_override;
    std::optional<bool> g_verbose;

    bool IsTerminal(std::ostream& os) {
        if (&os == &std::cout) {
            return isatty(fileno(stdout)) != 0;
        }
        if (&os == &std::cerr || &os == &std::clog) {
            return isatty(fileno(stderr)) != 0;
        }
        return false;
    }
}

bool ColorsEnabled(std::ostream& os) {
    if (g_colors_override) {
        return *g_colors_override;
    }
    if (env::IsEnabled(constants::kEnvNoColor)) {
        return false;
    }
    return IsTerminal(os);
}

void SetColorsEnabled(bool enabled) {
    g_colors_override = enabled;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

bool VerboseEnabled() {
    if (!g_verbose) {
        g_verbose = env::IsEnabled(constants::kEnvVerbose);
    }
    return *g_verbose;
}

void SetVerbose(bool enabled) {
    g_verbose = enabled;
}

void LogStage(const std::string& message) {
    if (!VerboseEnabled()) {
        return;
    }
    std::cerr << Colorize("[nspack]", color::BRIGHT_BLACK, std::cerr) << " " << message << "\n";
}

}  // namespace nspack::cli
