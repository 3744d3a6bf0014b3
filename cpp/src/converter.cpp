#include "nspack/converter.hpp"

#include "nspack/cli_colors.hpp"
#include "nspack/constants.hpp"
#include "nspack/nspack.hpp"
#include "nspack/payload.hpp"
#include "nspack/templates.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace nspack::converter {

namespace {

constexpr std::string_view kDefaultPythonName = "script.py";

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

Bytes ToBytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

tns::Entry DocumentEntry() {
    return tns::Entry::Protected(std::string(constants::kDocumentEntryName), templates::DefaultDocument());
}

Bytes Finish(const std::vector<tns::Entry>& entries, const ConvertOptions& options) {
    Bytes archive = tns::BuildArchive(entries, options.version);
    cli::LogStage("archive: " + std::to_string(entries.size()) + " entries, " + std::to_string(archive.size())
                  + " bytes, version " + std::string(tns::VersionTag(options.version)));
    return archive;
}

}  // namespace

ScriptKind ScriptKindFromPath(const std::filesystem::path& path) {
    const std::string ext = ToLower(path.extension().string());
    if (ext == ".lua") {
        return ScriptKind::Lua;
    }
    if (ext == ".py") {
        return ScriptKind::Python;
    }
    return ScriptKind::Text;
}

Bytes BuildLuaArchive(std::string_view script, const ConvertOptions& options) {
    Bytes problem = templates::WrapLuaScript(script);
    cli::LogStage("lua problem document: " + std::to_string(problem.size()) + " bytes");

    std::vector<tns::Entry> entries;
    entries.push_back(DocumentEntry());
    entries.push_back(payload::ProtectedEntry(std::string(constants::kProblemEntryName), problem));
    return Finish(entries, options);
}

Bytes BuildPythonArchive(std::string_view script, std::string_view filename, const ConvertOptions& options) {
    Bytes problem = templates::WrapPythonScript(filename);
    cli::LogStage("python problem document: " + std::to_string(problem.size()) + " bytes");

    std::vector<tns::Entry> entries;
    entries.push_back(DocumentEntry());
    entries.push_back(payload::ProtectedEntry(std::string(constants::kProblemEntryName), problem));
    entries.push_back(payload::CompanionEntry(std::string(filename), ToBytes(script)));
    return Finish(entries, options);
}

Bytes BuildTextArchive(std::string_view text, const ConvertOptions& options) {
    const std::string script = templates::TextToLuaScript(text);
    cli::LogStage("text note rendered as " + std::to_string(script.size()) + " bytes of lua");
    return BuildLuaArchive(script, options);
}

void ConvertLua(std::string_view script, const std::filesystem::path& output, const ConvertOptions& options) {
    WriteFile(output, BuildLuaArchive(script, options));
}

void ConvertPython(std::string_view script,
                   std::string_view filename,
                   const std::filesystem::path& output,
                   const ConvertOptions& options) {
    WriteFile(output, BuildPythonArchive(script, filename, options));
}

void ConvertText(std::string_view text, const std::filesystem::path& output, const ConvertOptions& options) {
    WriteFile(output, BuildTextArchive(text, options));
}

ScriptKind ConvertFile(const std::filesystem::path& input,
                       const std::filesystem::path& output,
                       const ConvertOptions& options) {
    const Bytes raw = ReadFile(input);
    const std::string_view content(reinterpret_cast<const char*>(raw.data()), raw.size());
    const ScriptKind kind = ScriptKindFromPath(input);
    switch (kind) {
        case ScriptKind::Lua:
            ConvertLua(content, output, options);
            break;
        case ScriptKind::Python: {
            std::string filename = input.filename().string();
            if (filename.empty()) {
                filename = std::string(kDefaultPythonName);
            }
            ConvertPython(content, filename, output, options);
            break;
        }
        case ScriptKind::Text:
            ConvertText(content, output, options);
            break;
    }
    return kind;
}

}  // namespace nspack::converter
