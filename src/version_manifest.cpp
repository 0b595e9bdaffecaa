#include "version_manifest.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

using json = nlohmann::json;

namespace blossom {

std::optional<VersionManifest> VersionManifest::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }

    json doc = json::parse(file, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }

    VersionManifest manifest;
    for (const auto& [tool, version] : doc.items()) {
        if (!version.is_string()) {
            return std::nullopt;
        }
        manifest.tool_versions[tool] = version.get<std::string>();
    }
    return manifest;
}

void VersionManifest::save(const std::filesystem::path& path) const {
    json doc = json::object();
    for (const auto& [tool, version] : tool_versions) {
        doc[tool] = version;
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            throw ProvisioningError("Cannot write version manifest: " + tmp.string());
        }
        file << doc.dump();
        if (!file.good()) {
            throw ProvisioningError("Failed writing version manifest: " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::string reason = ec.message();
        std::filesystem::remove(tmp, ec);
        throw ProvisioningError("Cannot replace version manifest " + path.string() + ": " + reason);
    }
}

bool VersionManifest::records(const std::string& tool, const std::string& version) const {
    auto it = tool_versions.find(tool);
    return it != tool_versions.end() && it->second == version;
}

} // namespace blossom
