#include "humio_exporter/format/json_formatter.hpp"
#include "humio_exporter/config/error_codes.hpp"

namespace humio_exporter {
namespace format {

nlohmann::json JsonFormatter::format(const config::SanitizedConfig& sanitized, bool reveal_secrets) {
    const auto& settings = sanitized.settings();
    nlohmann::json json;
    
    json["endpoint"] = settings.http.endpoint;
    json["ingest_token"] = reveal_secrets 
        ? settings.ingest_token 
        : config::ConfigMasker::mask("ingest_token", settings.ingest_token);
    
    json["endpoints"]["structured"] = sanitized.structuredUrl();
    json["endpoints"]["unstructured"] = sanitized.unstructuredUrl();
    json["headers"] = formatHeaders(sanitized.headers(), reveal_secrets);
    
    json["disable_compression"] = settings.disable_compression;
    json["disable_service_tag"] = settings.disable_service_tag;
    json["tags"] = settings.tags;
    
    if (!settings.logs.log_parser.empty()) {
        json["logs"]["log_parser"] = settings.logs.log_parser;
    } else {
        json["logs"]["log_parser"] = nullptr;
    }
    json["traces"]["unix_timestamps"] = settings.traces.unix_timestamps;
    
    json["sending"] = formatSending(settings);
    
    return json;
}

nlohmann::json JsonFormatter::formatValidation(const config::ValidationResult& result) {
    nlohmann::json json;
    json["valid"] = result.is_valid;
    
    if (result.error) {
        json["error"]["code"] = config::ConfigErrorCodeHelper::toString(result.error->code);
        json["error"]["message"] = result.error->message;
        json["error"]["detail"] = result.error->detail;
    } else {
        json["error"] = nullptr;
    }
    
    json["warnings"] = result.warnings;
    return json;
}

nlohmann::json JsonFormatter::formatHeaders(const config::HeaderMap& headers, bool reveal_secrets) {
    nlohmann::json json = nlohmann::json::object();
    
    for (const auto& [name, value] : headers) {
        std::string key = "headers." + name;
        json[name] = reveal_secrets ? value : config::ConfigMasker::mask(key, value);
    }
    
    return json;
}

nlohmann::json JsonFormatter::formatSending(const config::ExporterConfig& settings) {
    nlohmann::json json;
    
    json["timeout"] = settings.http.timeout_seconds;
    
    json["sending_queue"]["enabled"] = settings.queue.enabled;
    json["sending_queue"]["num_consumers"] = settings.queue.num_consumers;
    json["sending_queue"]["queue_size"] = settings.queue.queue_size;
    
    json["retry_on_failure"]["enabled"] = settings.retry.enabled;
    json["retry_on_failure"]["initial_interval"] = settings.retry.initial_interval_seconds;
    json["retry_on_failure"]["max_interval"] = settings.retry.max_interval_seconds;
    json["retry_on_failure"]["max_elapsed_time"] = settings.retry.max_elapsed_time_seconds;
    
    return json;
}

}}
