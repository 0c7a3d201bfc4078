#pragma once

/// @file config.hpp
/// @brief JSON configuration for idmap
///
/// A configuration document is optional in every key:
/// @code
/// {
///   "logging": { "level": "info", "console": true, "file": false,
///                "directory": "logs", "max_file_size": 10485760, "max_files": 5 },
///   "structures": { "initial_capacity": 64 }
/// }
/// @endcode

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"
#include <cstddef>
#include <filesystem>
#include <string>

namespace idmap_core {

/// Library configuration
struct Config {
    LogConfig log;

    /// Slots reserved by maps built through make_id_map()
    std::size_t initial_capacity = 0;
};

/// Parse a configuration document
/// @param json_text JSON source
/// @param source_path File the text came from, used in error reports only
[[nodiscard]] Result<Config> parse_config(
    const std::string& json_text,
    const std::filesystem::path& source_path = {});

/// Read and parse a configuration file
[[nodiscard]] Result<Config> load_config(const std::filesystem::path& path);

/// Apply the logging part of a configuration
void apply_config(const Config& config);

} // namespace idmap_core
