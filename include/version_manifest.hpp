#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace blossom {

// Tool name -> installed version, persisted as a flat JSON object.
struct VersionManifest {
    std::map<std::string, std::string> tool_versions;

    // Returns nullopt when the file is missing, unreadable or not a flat
    // object of strings; callers treat all of those as "not provisioned".
    static std::optional<VersionManifest> load(const std::filesystem::path& path);

    // Replaces the file as a whole: writes a sibling temp file, then renames.
    void save(const std::filesystem::path& path) const;

    bool records(const std::string& tool, const std::string& version) const;
};

} // namespace blossom
