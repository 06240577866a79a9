#include "humio_exporter/config/sanitizer.hpp"
#include "humio_exporter/config/validator.hpp"
#include "humio_exporter/common/constants.hpp"
#include "humio_exporter/common/logger.hpp"
#include "humio_exporter/common/url.hpp"

namespace humio_exporter {
namespace config {

SanitizeResult Sanitizer::sanitize(const ExporterConfig& config) {
    SanitizeResult result;
    
    auto structured = common::deriveEndpoint(config.http.endpoint, constants::ingest::STRUCTURED_PATH);
    auto unstructured = common::deriveEndpoint(config.http.endpoint, constants::ingest::UNSTRUCTURED_PATH);
    
    if (!structured.ok() || !unstructured.ok()) {
        result.error = ConfigError::make(ConfigErrorCode::MALFORMED_ENDPOINT, config.http.endpoint);
        common::Logger::instance().error("[Sanitizer] Endpoint derivation failed | endpoint={} | error={}",
                                         config.http.endpoint,
                                         structured.ok() ? unstructured.error : structured.error);
        return result;
    }
    
    ExporterConfig settings = config;
    applyRequiredHeaders(config, settings.http.headers);
    
    result.config = SanitizedConfig(std::move(settings), std::move(*structured.url), std::move(*unstructured.url));
    
    common::Logger::instance().debug("[Sanitizer] Derived | structured={} | unstructured={} | headers={}",
                                     result.config->structuredUrl(),
                                     result.config->unstructuredUrl(),
                                     result.config->headers().size());
    return result;
}

SanitizeResult Sanitizer::prepare(const ExporterConfig& config) {
    ConfigValidator validator;
    auto validation = validator.validate(config);
    
    if (!validation.is_valid) {
        SanitizeResult result;
        result.error = validation.error;
        return result;
    }
    
    for (const auto& warning : validation.warnings) {
        common::Logger::instance().warn("[Sanitizer] {}", warning);
    }
    
    return sanitize(config);
}

void Sanitizer::applyRequiredHeaders(const ExporterConfig& config, HeaderMap& headers) {
    using namespace constants::headers;
    
    headers[CONTENT_TYPE] = JSON_CONTENT_TYPE;
    headers[AUTHORIZATION] = std::string(BEARER_PREFIX) + config.ingest_token;
    
    if (!config.disable_compression) {
        headers[CONTENT_ENCODING] = GZIP_ENCODING;
    }
    
    if (headers.find(USER_AGENT) == headers.end()) {
        headers[USER_AGENT] = DEFAULT_USER_AGENT;
    }
}

}}
