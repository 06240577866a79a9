#pragma once

#include "exporter_config.hpp"
#include "error_codes.hpp"
#include <optional>

namespace humio_exporter {
namespace config {

struct SanitizeResult {
    std::optional<SanitizedConfig> config;
    std::optional<ConfigError> error;
    
    bool ok() const { return config.has_value(); }
};

// Builds the ready-to-use configuration: both ingest endpoints plus the
// header set sent with every request. The input is never modified.
// Sanitizing the settings() of a result again produces the same result.
class Sanitizer {
public:
    static SanitizeResult sanitize(const ExporterConfig& config);
    
    // Validate followed by sanitize; reports the first error of either.
    static SanitizeResult prepare(const ExporterConfig& config);

private:
    static void applyRequiredHeaders(const ExporterConfig& config, HeaderMap& headers);
};

}}
