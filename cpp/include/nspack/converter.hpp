#pragma once

#include "nspack/tns_writer.hpp"

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

namespace nspack::converter {

using Bytes = std::vector<std::uint8_t>;

enum class ScriptKind {
    Lua,
    Python,
    Text
};

struct ConvertOptions {
    tns::FormatVersion version = tns::FormatVersion::Default;
};

// ".lua" -> Lua, ".py" -> Python (case-insensitive), anything else -> Text.
ScriptKind ScriptKindFromPath(const std::filesystem::path& path);

// In-memory archives. Nothing touches the filesystem.
Bytes BuildLuaArchive(std::string_view script, const ConvertOptions& options = {});
Bytes BuildPythonArchive(std::string_view script,
                         std::string_view filename,
                         const ConvertOptions& options = {});
Bytes BuildTextArchive(std::string_view text, const ConvertOptions& options = {});

// Build the archive, then write it with a single write. On any failure no
// output file is created.
void ConvertLua(std::string_view script, const std::filesystem::path& output, const ConvertOptions& options = {});
void ConvertPython(std::string_view script,
                   std::string_view filename,
                   const std::filesystem::path& output,
                   const ConvertOptions& options = {});
void ConvertText(std::string_view text, const std::filesystem::path& output, const ConvertOptions& options = {});

// Reads `input`, dispatches on its extension, writes `output`.
ScriptKind ConvertFile(const std::filesystem::path& input,
                       const std::filesystem::path& output,
                       const ConvertOptions& options = {});

}  // namespace nspack::converter
