#pragma once

#include "Common/CommonTypes.h"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace Config {

// Keys written by the login flow
constexpr const char* KEY_USERNAME = "username";
constexpr const char* KEY_MINING_AUTH_PUBKEY = "mining_auth_pubkey";
constexpr const char* KEY_API_HOST = "api_host";

/**
 * @brief Immutable view of the config file at the time it was loaded
 */
class Snapshot {
  public:
    Snapshot();
    explicit Snapshot(nlohmann::json values);

    /**
     * @brief String value for key; nullopt when absent, null, or not a string
     */
    std::optional<std::string> getString(const std::string& key) const;
    bool contains(const std::string& key) const;
    const nlohmann::json& values() const { return m_values; }

  private:
    nlohmann::json m_values;
};

/**
 * @brief Set of key updates to be committed together
 */
class ConfigPatch {
  public:
    ConfigPatch& set(const std::string& key, const std::string& value);
    bool empty() const { return m_entries.empty(); }
    const std::map<std::string, std::string>& entries() const { return m_entries; }

  private:
    std::map<std::string, std::string> m_entries;
};

/**
 * @brief JSON key-value config file
 *
 * load() reads the current file. apply() re-reads the file, merges the patch
 * and replaces the file in a single atomic write, so keys outside the patch
 * survive and other readers never see a partially applied patch.
 */
class ConfigStore {
  public:
    explicit ConfigStore(std::string path);

    /**
     * @brief Load the current contents. A missing file is an empty snapshot.
     * @return Failure when the file is unreadable, malformed, or not a JSON object
     */
    Common::Result<Snapshot> load() const;

    /**
     * @brief Commit a patch: reload, merge, save once
     * @return Failure leaves the file untouched
     */
    Common::Result<bool> apply(const ConfigPatch& patch);

    const std::string& path() const { return m_path; }

  private:
    std::string m_path;
    static constexpr const char* COMPONENT_NAME = "ConfigStore";
};

}  // namespace Config
