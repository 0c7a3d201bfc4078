/// @file config.cpp
/// @brief JSON configuration loading for idmap_core

#include <idmap/core/config.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>

namespace idmap_core {

namespace {

/// Stamp the source path on a config error, record and report it
Error config_failure(ConfigError err, const std::filesystem::path& source_path) {
    if (err.path.empty() && !source_path.empty()) {
        err.path = source_path.string();
    }
    Error error(std::move(err));
    debug::record_error(error);
    core_logger()->warn("{}", build_error_chain(error));
    return error;
}

Result<void> read_bool(const nlohmann::json& section, const char* section_name,
                       const char* key, bool& out) {
    if (!section.contains(key)) {
        return Ok();
    }
    const auto& value = section[key];
    if (!value.is_boolean()) {
        return Error(ConfigError::type_mismatch(std::string(section_name) + "." + key, "a boolean"));
    }
    out = value.get<bool>();
    return Ok();
}

Result<void> read_size(const nlohmann::json& section, const char* section_name,
                       const char* key, std::size_t& out) {
    if (!section.contains(key)) {
        return Ok();
    }
    const std::string full_key = std::string(section_name) + "." + key;
    const auto& value = section[key];
    if (!value.is_number_integer()) {
        return Error(ConfigError::type_mismatch(full_key, "an integer"));
    }
    if (!value.is_number_unsigned()) {
        return Error(ConfigError::invalid_value(full_key, value.dump()));
    }
    out = value.get<std::size_t>();
    return Ok();
}

Result<void> read_string(const nlohmann::json& section, const char* section_name,
                         const char* key, std::string& out) {
    if (!section.contains(key)) {
        return Ok();
    }
    const auto& value = section[key];
    if (!value.is_string()) {
        return Error(ConfigError::type_mismatch(std::string(section_name) + "." + key, "a string"));
    }
    out = value.get<std::string>();
    return Ok();
}

Result<void> parse_logging(const nlohmann::json& j, LogConfig& log) {
    if (!j.is_object()) {
        return Error(ConfigError::type_mismatch("logging", "an object"));
    }

    if (j.contains("level")) {
        if (!j["level"].is_string()) {
            return Error(ConfigError::type_mismatch("logging.level", "a string"));
        }
        const auto name = j["level"].get<std::string>();
        auto level = parse_log_level(name);
        if (!level) {
            return Error(ConfigError::invalid_value("logging.level", name));
        }
        log.level = *level;
    }

    if (auto r = read_bool(j, "logging", "console", log.console_enabled); !r) return r;
    if (auto r = read_bool(j, "logging", "file", log.file_enabled); !r) return r;
    if (auto r = read_string(j, "logging", "directory", log.log_directory); !r) return r;
    if (auto r = read_size(j, "logging", "max_file_size", log.max_file_size); !r) return r;
    if (auto r = read_size(j, "logging", "max_files", log.max_files); !r) return r;

    if (log.file_enabled && log.log_directory.empty()) {
        return Error(ConfigError::invalid_value("logging.directory",
            "file logging requires a directory"));
    }

    return Ok();
}

Result<void> parse_structures(const nlohmann::json& j, Config& config) {
    if (!j.is_object()) {
        return Error(ConfigError::type_mismatch("structures", "an object"));
    }
    return read_size(j, "structures", "initial_capacity", config.initial_capacity);
}

} // anonymous namespace

// =============================================================================
// Parsing
// =============================================================================

Result<Config> parse_config(const std::string& json_text, const std::filesystem::path& source_path) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::exception& e) {
        return config_failure(ConfigError::parse_failed(e.what()), source_path);
    }

    if (!j.is_object()) {
        return config_failure(ConfigError::type_mismatch("<root>", "an object"), source_path);
    }

    Config config;

    if (j.contains("logging")) {
        auto result = parse_logging(j["logging"], config.log);
        if (!result) {
            const auto* err = result.error().as<ConfigError>();
            return err ? config_failure(*err, source_path) : result.error();
        }
    }

    if (j.contains("structures")) {
        auto result = parse_structures(j["structures"], config);
        if (!result) {
            const auto* err = result.error().as<ConfigError>();
            return err ? config_failure(*err, source_path) : result.error();
        }
    }

    return config;
}

Result<Config> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return config_failure(ConfigError::read_failed(path.string()), path);
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    auto result = parse_config(content, path);
    if (result) {
        core_logger()->debug("Loaded config from {}", path.string());
    }
    return result;
}

void apply_config(const Config& config) {
    configure_logging(config.log);
    core_logger()->debug("Logging configured: level={}, console={}, file={}",
        log_level_name(config.log.level), config.log.console_enabled, config.log.file_enabled);
}

} // namespace idmap_core
