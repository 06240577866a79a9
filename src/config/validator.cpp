#include "humio_exporter/config/validator.hpp"
#include "humio_exporter/common/constants.hpp"
#include "humio_exporter/common/logger.hpp"
#include "humio_exporter/common/url.hpp"
#include <algorithm>
#include <cctype>

namespace humio_exporter {
namespace config {

const std::set<std::string> ConfigMasker::SENSITIVE_KEYS = {
    "ingest_token",
    "headers.authorization"
};

std::string ConfigMasker::mask(const std::string& key, const std::string& value) {
    const std::string bearer = constants::headers::BEARER_PREFIX;
    if (isSensitive(key) && value.compare(0, bearer.size(), bearer) == 0) {
        return bearer + mask("ingest_token", value.substr(bearer.size()));
    }
    
    if (isSensitive(key) && !value.empty()) {
        if (value.length() <= 8) {
            return "****";
        }
        return value.substr(0, 4) + "****";
    }
    return value;
}

bool ConfigMasker::isSensitive(const std::string& key) {
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return SENSITIVE_KEYS.find(lower) != SENSITIVE_KEYS.end();
}

ValidationResult ConfigValidator::validate(const ExporterConfig& config) const {
    ValidationResult result;
    
    common::Logger::instance().debug("[Validator] Starting validation | endpoint={}", config.http.endpoint);
    
    result.error = checkRequiredFields(config);
    if (!result.error) {
        result.error = checkEndpoint(config.http.endpoint);
    }
    if (!result.error) {
        result.error = checkHeaders(config);
    }
    if (!result.error) {
        result.error = checkSendingSettings(config);
    }
    
    result.is_valid = !result.error.has_value();
    
    if (result.is_valid) {
        collectWarnings(config, result.warnings);
        common::Logger::instance().info("[Validator] Passed | warnings={}", result.warnings.size());
    } else {
        common::Logger::instance().error("[Validator] Failed | code={} | error={}",
                                         ConfigErrorCodeHelper::toString(result.error->code),
                                         result.error->toString());
    }
    
    return result;
}

std::optional<ConfigError> ConfigValidator::checkRequiredFields(const ExporterConfig& config) {
    if (config.ingest_token.empty()) {
        return ConfigError::make(ConfigErrorCode::MISSING_INGEST_TOKEN);
    }
    
    if (config.http.endpoint.empty()) {
        return ConfigError::make(ConfigErrorCode::MISSING_ENDPOINT);
    }
    
    if (config.disable_service_tag && config.tags.empty()) {
        return ConfigError::make(ConfigErrorCode::MISSING_CUSTOM_TAGS);
    }
    
    return std::nullopt;
}

std::optional<ConfigError> ConfigValidator::checkEndpoint(const std::string& endpoint) {
    auto probe = common::deriveEndpoint(endpoint, constants::ingest::UNSTRUCTURED_PATH);
    if (!probe.ok()) {
        return ConfigError::make(ConfigErrorCode::INVALID_ENDPOINT, 
                                 "\"" + endpoint + "\": " + probe.error);
    }
    return std::nullopt;
}

std::optional<ConfigError> ConfigValidator::checkHeaders(const ExporterConfig& config) {
    using namespace constants::headers;
    const auto& headers = config.http.headers;
    
    auto content_type = headers.find(CONTENT_TYPE);
    if (content_type != headers.end() && content_type->second != JSON_CONTENT_TYPE) {
        return ConfigError::make(ConfigErrorCode::INVALID_CONTENT_TYPE, content_type->second);
    }
    
    // Always generated from the ingest token
    if (headers.find(AUTHORIZATION) != headers.end()) {
        return ConfigError::make(ConfigErrorCode::AUTHORIZATION_OVERRIDE);
    }
    
    auto encoding = headers.find(CONTENT_ENCODING);
    if (encoding != headers.end() && (config.disable_compression || encoding->second != GZIP_ENCODING)) {
        return ConfigError::make(ConfigErrorCode::CONTENT_ENCODING_MISMATCH,
            config.disable_compression ? "compression is disabled" : encoding->second);
    }
    
    return std::nullopt;
}

std::optional<ConfigError> ConfigValidator::checkSendingSettings(const ExporterConfig& config) {
    if (config.http.timeout_seconds < 0) {
        return ConfigError::make(ConfigErrorCode::INVALID_TIMEOUT,
                                 std::to_string(config.http.timeout_seconds));
    }
    
    if (config.queue.enabled) {
        if (config.queue.queue_size <= 0) {
            return ConfigError::make(ConfigErrorCode::INVALID_QUEUE_SIZE,
                                     std::to_string(config.queue.queue_size));
        }
        if (config.queue.num_consumers <= 0) {
            return ConfigError::make(ConfigErrorCode::INVALID_QUEUE_CONSUMERS,
                                     std::to_string(config.queue.num_consumers));
        }
    }
    
    if (config.retry.enabled) {
        const auto& retry = config.retry;
        if (retry.initial_interval_seconds < 0 || retry.max_interval_seconds < 0 ||
            retry.max_elapsed_time_seconds < 0) {
            return ConfigError::make(ConfigErrorCode::INVALID_RETRY_INTERVAL,
                                     "intervals must not be negative");
        }
        if (retry.max_interval_seconds < retry.initial_interval_seconds) {
            return ConfigError::make(ConfigErrorCode::INVALID_RETRY_INTERVAL,
                                     "max_interval is shorter than initial_interval");
        }
    }
    
    return std::nullopt;
}

void ConfigValidator::collectWarnings(const ExporterConfig& config, std::vector<std::string>& warnings) {
    auto parsed = common::parseUrl(config.http.endpoint);
    if (!parsed.ok()) {
        return;
    }
    
    const auto& scheme = parsed.url->scheme;
    if (scheme == "http") {
        warnings.push_back(
            "endpoint: Plain http sends the ingest token unencrypted, consider https"
        );
    } else if (scheme != "https") {
        warnings.push_back(
            "endpoint: Expected an http or https URL, got \"" + config.http.endpoint + "\""
        );
    }
}

}}
