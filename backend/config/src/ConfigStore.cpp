#include "../include/Config/ConfigStore.h"
#include "Common/AtomicFile.h"
#include "Common/Logger.h"

#include <filesystem>
#include <utility>

using json = nlohmann::json;

namespace Config {

Snapshot::Snapshot() : m_values(json::object()) {}

Snapshot::Snapshot(json values) : m_values(std::move(values)) {}

std::optional<std::string> Snapshot::getString(const std::string& key) const {
    auto it = m_values.find(key);
    if (it == m_values.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

bool Snapshot::contains(const std::string& key) const {
    return m_values.contains(key);
}

ConfigPatch& ConfigPatch::set(const std::string& key, const std::string& value) {
    m_entries[key] = value;
    return *this;
}

ConfigStore::ConfigStore(std::string path) : m_path(std::move(path)) {}

Common::Result<Snapshot> ConfigStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(m_path, ec)) {
        WL_LOG_DEBUG(COMPONENT_NAME, "Config file not found, using empty config", m_path);
        return Common::Result<Snapshot>(Snapshot());
    }

    std::string contents;
    if (!Common::ReadFileToString(m_path, contents)) {
        WL_LOG_ERROR(COMPONENT_NAME, "Failed to read config file", m_path);
        return Common::Result<Snapshot>("Unable to read config file " + m_path, 500);
    }

    if (contents.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Common::Result<Snapshot>(Snapshot());
    }

    try {
        json parsed = json::parse(contents);
        if (!parsed.is_object()) {
            WL_LOG_ERROR(COMPONENT_NAME, "Config root is not an object", m_path);
            return Common::Result<Snapshot>("Config file " + m_path + " is not a JSON object",
                                            422);
        }
        return Common::Result<Snapshot>(Snapshot(std::move(parsed)));
    } catch (const json::parse_error& e) {
        WL_LOG_ERROR(COMPONENT_NAME, "Malformed config file", std::string(e.what()));
        return Common::Result<Snapshot>("Config file " + m_path + " is not valid JSON", 422);
    }
}

Common::Result<bool> ConfigStore::apply(const ConfigPatch& patch) {
    WL_SCOPED_LOG(COMPONENT_NAME, "apply");

    // Reload so keys written since this process last read the file are kept
    auto current = load();
    if (!current) {
        return Common::Result<bool>(current.error(), current.errorCode);
    }

    json merged = current->values();
    for (const auto& entry : patch.entries()) {
        merged[entry.first] = entry.second;
    }

    std::string error;
    if (!Common::AtomicWriteFile(m_path, merged.dump(4) + "\n", &error)) {
        WL_LOG_ERROR(COMPONENT_NAME, "Failed to save config", error);
        return Common::Result<bool>("Unable to save config file " + m_path + ": " + error, 500);
    }

    WL_LOG_DEBUG(COMPONENT_NAME, "Config saved",
                 m_path + " (" + std::to_string(patch.entries().size()) + " keys)");
    return Common::Result<bool>(true);
}

}  // namespace Config
