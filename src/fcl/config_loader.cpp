#include <fcl/config_loader.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fcl {

using json = nlohmann::ordered_json;

namespace {

constexpr uint64_t MiB = 1024ull * 1024ull;

fs::path home_directory() {
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return fs::path(home);
    }
    return fs::path(".");
}

Result<LogLevel> parse_log_level(const std::string& s) {
    if (s == "DEBUG") return LogLevel::DEBUG;
    if (s == "INFO") return LogLevel::INFO;
    if (s == "WARNING") return LogLevel::WARNING;
    if (s == "ERROR") return LogLevel::ERROR;
    return Error(ErrorCode::INVALID_ARGUMENT, "Unknown log level: " + s);
}

Result<json> read_json_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error(ErrorCode::NOT_FOUND, "Cannot read config file " + path.string());
    }
    try {
        json j = json::parse(in);
        if (!j.is_object()) {
            return Error(ErrorCode::INVALID_ARGUMENT,
                         "Config file " + path.string() + " must contain a JSON object");
        }
        return j;
    } catch (const json::exception& e) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "Malformed config file " + path.string() + ": " + e.what());
    }
}

Result<void> write_json_file(const json& j, const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Err(ec, "Failed to create config directory");
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Error(ErrorCode::PERMISSION_DENIED, "Cannot write config file " + path.string());
    }
    out << j.dump(4) << '\n';
    if (!out.good()) {
        return Error(ErrorCode::IO_ERROR, "Failed to write config file " + path.string());
    }
    return Ok();
}

}  // namespace

fs::path default_data_directory() {
    return home_directory() / ".local" / "share" / "fcl";
}

Config default_config(const fs::path& data_directory) {
    Config config;
    config.data_directory = data_directory;
    config.journal_path = data_directory / "db" / "actions.journal";
    config.index_path = data_directory / "db" / "file_index.log";
    config.log_file = data_directory / "logs" / "fcl.log";

    config.type_rules = {
        {"images", {".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".webp"}},
        {"documents", {".pdf", ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx",
                       ".txt", ".md", ".odt", ".csv", ".log"}},
        {"videos", {".mp4", ".avi", ".mkv", ".mov", ".wmv", ".flv", ".webm"}},
        {"audio", {".mp3", ".wav", ".flac", ".ogg", ".aac", ".m4a"}},
        {"archives", {".zip", ".tar", ".gz", ".rar", ".7z"}},
        {"code", {".py", ".js", ".html", ".css", ".java", ".c", ".cpp", ".h", ".php", ".rb"}},
    };

    config.size_buckets = {
        {"tiny", MiB},
        {"small", 10 * MiB},
        {"medium", 100 * MiB},
        {"large", 1024 * MiB},
        {"huge", std::nullopt},
    };

    return config;
}

fs::path ConfigLoader::default_config_path() {
    return home_directory() / ".config" / "fcl" / "config.json";
}

json ConfigLoader::to_json(const Config& config) {
    json types = json::object();
    for (const auto& rule : config.type_rules) {
        types[rule.type] = rule.extensions;
    }

    json sizes = json::object();
    for (const auto& bucket : config.size_buckets) {
        if (bucket.upper_bound.has_value()) {
            sizes[bucket.label] = *bucket.upper_bound;
        } else {
            sizes[bucket.label] = nullptr;
        }
    }

    json j = json::object();
    j["sort_criteria"] = {{"type", types}, {"size", sizes}};
    j["default_sort_criteria"] = config.default_sort_criteria;
    j["log_level"] = log_level_name(config.log_level);
    j["log_file"] = config.log_file.string();
    j["data_directory"] = config.data_directory.string();
    j["journal_path"] = config.journal_path.string();
    j["index_path"] = config.index_path.string();
    j["use_colors"] = config.use_colors;
    j["confirm_actions"] = config.confirm_actions;
    j["max_undo_history"] = config.max_undo_history;
    return j;
}

Result<Config> ConfigLoader::merge(const json& overrides, Config base) {
    if (!overrides.is_object()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Configuration must be a JSON object");
    }

    try {
        // A new data directory moves the derived paths along unless they are
        // overridden explicitly below.
        if (overrides.contains("data_directory")) {
            Config moved = default_config(overrides.at("data_directory").get<std::string>());
            base.data_directory = moved.data_directory;
            base.journal_path = moved.journal_path;
            base.index_path = moved.index_path;
            base.log_file = moved.log_file;
        }

        if (overrides.contains("sort_criteria")) {
            const auto& criteria = overrides.at("sort_criteria");
            if (criteria.contains("type")) {
                base.type_rules.clear();
                for (const auto& item : criteria.at("type").items()) {
                    TypeRule rule;
                    rule.type = item.key();
                    rule.extensions = item.value().get<std::vector<std::string>>();
                    base.type_rules.push_back(std::move(rule));
                }
            }
            if (criteria.contains("size")) {
                base.size_buckets.clear();
                for (const auto& item : criteria.at("size").items()) {
                    SizeBucket bucket;
                    bucket.label = item.key();
                    if (!item.value().is_null()) {
                        bucket.upper_bound = item.value().get<uint64_t>();
                    }
                    base.size_buckets.push_back(std::move(bucket));
                }
            }
        }

        if (overrides.contains("default_sort_criteria")) {
            std::string criterion = overrides.at("default_sort_criteria").get<std::string>();
            auto parsed = parse_dimension(criterion);
            if (!parsed.ok()) {
                return parsed.error();
            }
            base.default_sort_criteria = criterion;
        }
        if (overrides.contains("log_level")) {
            auto level = parse_log_level(overrides.at("log_level").get<std::string>());
            if (!level.ok()) {
                return level.error();
            }
            base.log_level = level.value();
        }
        if (overrides.contains("log_file")) {
            base.log_file = overrides.at("log_file").get<std::string>();
        }
        if (overrides.contains("journal_path")) {
            base.journal_path = overrides.at("journal_path").get<std::string>();
        }
        if (overrides.contains("index_path")) {
            base.index_path = overrides.at("index_path").get<std::string>();
        }
        if (overrides.contains("use_colors")) {
            base.use_colors = overrides.at("use_colors").get<bool>();
        }
        if (overrides.contains("confirm_actions")) {
            base.confirm_actions = overrides.at("confirm_actions").get<bool>();
        }
        if (overrides.contains("max_undo_history")) {
            const auto& limit = overrides.at("max_undo_history");
            if (!limit.is_number_unsigned()) {
                return Error(ErrorCode::INVALID_ARGUMENT,
                             "max_undo_history must be a non-negative integer, got " + limit.dump());
            }
            base.max_undo_history = limit.get<size_t>();
        }
    } catch (const json::exception& e) {
        return Error(ErrorCode::INVALID_ARGUMENT, std::string("Invalid configuration value: ") + e.what());
    }

    return base;
}

Result<Config> ConfigLoader::load(const fs::path& path) {
    Config defaults = default_config(default_data_directory());

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        auto saved = save(defaults, path);
        if (!saved.ok()) {
            return saved.error();
        }
        return defaults;
    }

    auto parsed = read_json_file(path);
    if (!parsed.ok()) {
        return parsed.error();
    }
    return merge(parsed.value(), std::move(defaults));
}

Result<void> ConfigLoader::save(const Config& config, const fs::path& path) {
    return write_json_file(to_json(config), path);
}

Result<std::string> ConfigLoader::get_value(const fs::path& path, const std::string& key) {
    auto config = load(path);
    if (!config.ok()) {
        return config.error();
    }

    json j = to_json(config.value());
    if (!j.contains(key)) {
        return Error(ErrorCode::NOT_FOUND, "Unknown configuration key: " + key);
    }
    return j.at(key).dump();
}

Result<void> ConfigLoader::set_value(const fs::path& path,
                                     const std::string& key,
                                     const std::string& value) {
    auto config = load(path);
    if (!config.ok()) {
        return config.error();
    }

    json current = to_json(config.value());
    if (!current.contains(key)) {
        return Error(ErrorCode::NOT_FOUND, "Unknown configuration key: " + key);
    }

    json parsed_value;
    try {
        parsed_value = json::parse(value);
    } catch (const json::exception&) {
        parsed_value = value;
    }

    json overrides = json::object();
    overrides[key] = parsed_value;

    auto merged = merge(overrides, config.value());
    if (!merged.ok()) {
        return merged.error();
    }
    return save(merged.value(), path);
}

Result<std::vector<std::pair<std::string, std::string>>> ConfigLoader::list_values(
    const fs::path& path) {
    auto config = load(path);
    if (!config.ok()) {
        return config.error();
    }

    std::vector<std::pair<std::string, std::string>> values;
    for (const auto& item : to_json(config.value()).items()) {
        values.emplace_back(item.key(), item.value().dump());
    }
    return values;
}

}  // namespace fcl
