/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the admission policy (settings.json).
 *
 * Keeps JSON parsing of the policy in one place; the rest of the codebase
 * only sees the resulting domain::ScanConfig value.
 */

#pragma once

#include <string>
#include <optional>
#include <nlohmann/json_fwd.hpp>
#include "domain/ScanConfig.hpp"

namespace filegate::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Defaults with every storage path resolved under the XDG directories.
     */
    static domain::ScanConfig DefaultConfig();

    /**
     * @brief Reads a settings file on top of DefaultConfig().
     * @param path Absolute path to the JSON file.
     * @return The merged config, or nullopt if the file is unreadable or a key has the wrong type.
     */
    static std::optional<domain::ScanConfig> Load(const std::string& path);

    /**
     * @brief Applies the keys present in @p j to @p config. Throws nlohmann::json exceptions on bad types.
     */
    static void Apply(const nlohmann::json& j, domain::ScanConfig& config);

    /** @brief Parses "fail-open" / "fail-closed". */
    static std::optional<domain::UnavailablePolicy> ParsePolicy(const std::string& value);
};

} // namespace filegate::infrastructure
