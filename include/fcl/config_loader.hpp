#pragma once

#include <fcl/result.hpp>
#include <fcl/types.hpp>

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

namespace fcl {

/**
 * ConfigLoader - Reads and writes the JSON configuration file.
 *
 * Keys present in the file override the built-in defaults; keys that are
 * absent keep their default value. A missing file is created from the
 * defaults on first load.
 */
class ConfigLoader {
public:
    /**
     * Default config file location (~/.config/fcl/config.json).
     */
    static fs::path default_config_path();

    /**
     * Load configuration, creating the file from defaults if absent.
     *
     * @param path Config file path
     * @return The merged configuration, or INVALID_ARGUMENT on malformed JSON
     */
    static Result<Config> load(const fs::path& path);

    /**
     * Write a configuration to disk, creating parent directories.
     */
    static Result<void> save(const Config& config, const fs::path& path);

    static nlohmann::ordered_json to_json(const Config& config);

    /**
     * Overlay the keys of a JSON object onto a base configuration.
     */
    static Result<Config> merge(const nlohmann::ordered_json& overrides, Config base);

    /**
     * Read one top-level key of the merged configuration as JSON text.
     */
    static Result<std::string> get_value(const fs::path& path, const std::string& key);

    /**
     * Set one top-level key and save. The value is parsed as JSON and
     * stored as a plain string when it is not valid JSON.
     */
    static Result<void> set_value(const fs::path& path,
                                  const std::string& key,
                                  const std::string& value);

    /**
     * All top-level keys with their JSON-rendered values.
     */
    static Result<std::vector<std::pair<std::string, std::string>>> list_values(
        const fs::path& path);
};

}  // namespace fcl
