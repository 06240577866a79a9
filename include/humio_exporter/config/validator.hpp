#pragma once

#include "exporter_config.hpp"
#include "error_codes.hpp"
#include <string>
#include <vector>
#include <set>
#include <optional>

namespace humio_exporter {
namespace config {

struct ValidationResult {
    bool is_valid = true;
    std::optional<ConfigError> error;
    std::vector<std::string> warnings;
};

// Checks run in a fixed order and the first failure is the one reported:
//   1. ingest token present
//   2. endpoint present
//   3. custom tags present when the service tag is disabled
//   4. endpoint combines with the unstructured ingest path into a URL
//   5. content-type, if given, is application/json
//   6. authorization is not given
//   7. content-encoding, if given, is gzip with compression enabled
//   8. timeout, queue and retry settings are in range
class ConfigValidator {
public:
    ValidationResult validate(const ExporterConfig& config) const;
    
    static std::optional<ConfigError> checkRequiredFields(const ExporterConfig& config);
    static std::optional<ConfigError> checkEndpoint(const std::string& endpoint);
    static std::optional<ConfigError> checkHeaders(const ExporterConfig& config);
    static std::optional<ConfigError> checkSendingSettings(const ExporterConfig& config);

private:
    static void collectWarnings(const ExporterConfig& config, std::vector<std::string>& warnings);
};

class ConfigMasker {
public:
    static std::string mask(const std::string& key, const std::string& value);
    static bool isSensitive(const std::string& key);

private:
    static const std::set<std::string> SENSITIVE_KEYS;
};

}}
