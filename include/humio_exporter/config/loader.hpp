#pragma once

#include "exporter_config.hpp"
#include "error_codes.hpp"
#include <string>
#include <optional>

namespace humio_exporter {
namespace config {

struct LoadResult {
    std::optional<ExporterConfig> config;
    std::optional<ConfigError> error;
    
    bool ok() const { return config.has_value(); }
};

// Reads the raw exporter settings from TOML. Keys that are absent keep the
// values of createDefaultConfig(); a key holding the wrong type fails the load.
class ConfigLoader {
public:
    static LoadResult loadFile(const std::string& path);
    static LoadResult loadString(const std::string& content, const std::string& source_name = "<string>");
    
    // Renders one schema key ("endpoint", "logs.log_parser", "tags.env", ...)
    static std::optional<std::string> getValue(const ExporterConfig& config, const std::string& key);
};

}}
