#include "nspack/cli_colors.hpp"
#include "nspack/constants.hpp"
#include "nspack/nspack.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void PrintUsage() {
    std::cerr << "nspack " << nspack::constants::kEngineVersion << " - TI-Nspire .tns document builder\n";
    std::cerr << "\n";
    std::cerr << "Usage:\n";
    std::cerr << "  nspack <input> <output.tns> [--verbose] [--no-color]\n";
    std::cerr << "\n";
    std::cerr << "Input types:\n";
    std::cerr << "  .lua  Lua script (OS 3.0.2+)\n";
    std::cerr << "  .py   Python script (CX II OS 5.2+)\n";
    std::cerr << "  *     plain text note, LaTeX-style math rendered to Unicode\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  nspack script.lua output.tns\n";
    std::cerr << "  nspack notes.txt notes.tns\n";
    std::cerr << "\n";
    std::cerr << "Notation:\n";
    std::cerr << "  \\alpha \\beta \\gamma -> greek letters\n";
    std::cerr << "  x^2 H_2O             -> superscripts and subscripts\n";
    std::cerr << "  \\pm \\times \\leq      -> operators and relations\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  " << nspack::constants::kEnvVerbose << "=1   log pipeline stages to stderr\n";
    std::cerr << "  " << nspack::constants::kEnvNoColor << "=1  disable colored output\n";
}

struct CliArgs {
    std::vector<std::string> positional;
    bool verbose = false;
    bool no_color = false;
};

CliArgs ParseArgs(int argc, char** argv) {
    CliArgs args;
    for (int idx = 1; idx < argc; ++idx) {
        std::string arg(argv[idx]);
        if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        } else if (arg == "--no-color") {
            args.no_color = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::runtime_error("Unknown flag: " + arg);
        } else {
            args.positional.push_back(std::move(arg));
        }
    }
    return args;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        CliArgs args = ParseArgs(argc, argv);
        if (args.no_color) {
            nspack::cli::SetColorsEnabled(false);
        }
        if (args.verbose) {
            nspack::cli::SetVerbose(true);
        }
        if (args.positional.size() != 2) {
            PrintUsage();
            return 1;
        }

        const std::filesystem::path input(args.positional[0]);
        const std::filesystem::path output(args.positional[1]);
        nspack::converter::ConvertFile(input, output);
        std::cout << nspack::cli::Green("Created " + output.string()) << "\n";
        return 0;
    } catch (const std::exception& exc) {
        std::cerr << nspack::cli::BoldRed("Error:", std::cerr) << " " << exc.what() << "\n";
        return 1;
    }
}
