#include "humio_exporter/config/loader.hpp"
#include "humio_exporter/common/logger.hpp"
#include <toml.hpp>
#include <filesystem>
#include <sstream>
#include <map>
#include <stdexcept>
#include <unistd.h>

namespace humio_exporter {
namespace config {

namespace {

using StringTable = std::map<std::string, std::string>;

void applySendingQueue(const toml::value& section, QueueSettings& queue) {
    if (section.contains("enabled")) {
        queue.enabled = toml::find<bool>(section, "enabled");
    }
    if (section.contains("num_consumers")) {
        queue.num_consumers = toml::find<int>(section, "num_consumers");
    }
    if (section.contains("queue_size")) {
        queue.queue_size = toml::find<int>(section, "queue_size");
    }
}

void applyRetryOnFailure(const toml::value& section, RetrySettings& retry) {
    if (section.contains("enabled")) {
        retry.enabled = toml::find<bool>(section, "enabled");
    }
    if (section.contains("initial_interval")) {
        retry.initial_interval_seconds = toml::find<int>(section, "initial_interval");
    }
    if (section.contains("max_interval")) {
        retry.max_interval_seconds = toml::find<int>(section, "max_interval");
    }
    if (section.contains("max_elapsed_time")) {
        retry.max_elapsed_time_seconds = toml::find<int>(section, "max_elapsed_time");
    }
}

ExporterConfig fromToml(const toml::value& data) {
    ExporterConfig config = createDefaultConfig();
    
    if (data.contains("endpoint")) {
        config.http.endpoint = toml::find<std::string>(data, "endpoint");
    }
    if (data.contains("timeout")) {
        config.http.timeout_seconds = toml::find<int>(data, "timeout");
    }
    if (data.contains("headers")) {
        // HeaderMap folds case, so "Content-Encoding" and "content-encoding" collide
        for (const auto& [name, value] : toml::find<StringTable>(data, "headers")) {
            auto [existing, inserted] = config.http.headers.emplace(name, value);
            if (!inserted) {
                throw std::runtime_error("duplicate header name: " + existing->first + " and " + name);
            }
        }
    }
    
    if (data.contains("ingest_token")) {
        config.ingest_token = toml::find<std::string>(data, "ingest_token");
    }
    if (data.contains("disable_compression")) {
        config.disable_compression = toml::find<bool>(data, "disable_compression");
    }
    if (data.contains("tags")) {
        config.tags = toml::find<StringTable>(data, "tags");
    }
    if (data.contains("disable_service_tag")) {
        config.disable_service_tag = toml::find<bool>(data, "disable_service_tag");
    }
    
    if (data.contains("logs")) {
        const auto& logs_section = data.at("logs");
        if (logs_section.contains("log_parser")) {
            config.logs.log_parser = toml::find<std::string>(logs_section, "log_parser");
        }
    }
    
    if (data.contains("traces")) {
        const auto& traces_section = data.at("traces");
        if (traces_section.contains("unix_timestamps")) {
            config.traces.unix_timestamps = toml::find<bool>(traces_section, "unix_timestamps");
        }
    }
    
    if (data.contains("sending_queue")) {
        applySendingQueue(data.at("sending_queue"), config.queue);
    }
    if (data.contains("retry_on_failure")) {
        applyRetryOnFailure(data.at("retry_on_failure"), config.retry);
    }
    
    return config;
}

std::string boolString(bool value) {
    return value ? "true" : "false";
}

}

LoadResult ConfigLoader::loadFile(const std::string& path) {
    LoadResult result;
    
    if (!std::filesystem::exists(path)) {
        common::Logger::instance().error("[Loader] File not found | path={}", path);
        result.error = ConfigError::make(ConfigErrorCode::CONFIG_FILE_NOT_FOUND, path);
        return result;
    }
    
    if (access(path.c_str(), R_OK) != 0) {
        common::Logger::instance().error("[Loader] File not readable | path={}", path);
        result.error = ConfigError::make(ConfigErrorCode::CONFIG_FILE_NOT_FOUND, path + " is not readable");
        return result;
    }
    
    try {
        auto data = toml::parse(path);
        result.config = fromToml(data);
        common::Logger::instance().info("[Loader] Loaded | path={} | has_ingest_token={}",
                                        path, !result.config->ingest_token.empty());
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Loader] Parse failed | path={} | error={}", path, e.what());
        result.error = ConfigError::make(ConfigErrorCode::CONFIG_PARSE_FAILED, e.what());
    }
    
    return result;
}

LoadResult ConfigLoader::loadString(const std::string& content, const std::string& source_name) {
    LoadResult result;
    
    try {
        std::istringstream stream(content);
        auto data = toml::parse(stream, source_name);
        result.config = fromToml(data);
        common::Logger::instance().debug("[Loader] Loaded | source={}", source_name);
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Loader] Parse failed | source={} | error={}", source_name, e.what());
        result.error = ConfigError::make(ConfigErrorCode::CONFIG_PARSE_FAILED, e.what());
    }
    
    return result;
}

std::optional<std::string> ConfigLoader::getValue(const ExporterConfig& config, const std::string& key) {
    if (key == "endpoint") return config.http.endpoint;
    else if (key == "timeout") return std::to_string(config.http.timeout_seconds);
    else if (key == "ingest_token") return config.ingest_token;
    else if (key == "disable_compression") return boolString(config.disable_compression);
    else if (key == "disable_service_tag") return boolString(config.disable_service_tag);
    else if (key == "logs.log_parser") return config.logs.log_parser;
    else if (key == "traces.unix_timestamps") return boolString(config.traces.unix_timestamps);
    else if (key == "sending_queue.enabled") return boolString(config.queue.enabled);
    else if (key == "sending_queue.num_consumers") return std::to_string(config.queue.num_consumers);
    else if (key == "sending_queue.queue_size") return std::to_string(config.queue.queue_size);
    else if (key == "retry_on_failure.enabled") return boolString(config.retry.enabled);
    else if (key == "retry_on_failure.initial_interval") return std::to_string(config.retry.initial_interval_seconds);
    else if (key == "retry_on_failure.max_interval") return std::to_string(config.retry.max_interval_seconds);
    else if (key == "retry_on_failure.max_elapsed_time") return std::to_string(config.retry.max_elapsed_time_seconds);
    
    if (key.rfind("headers.", 0) == 0) {
        auto it = config.http.headers.find(key.substr(8));
        if (it != config.http.headers.end()) return it->second;
    } else if (key.rfind("tags.", 0) == 0) {
        auto it = config.tags.find(key.substr(5));
        if (it != config.tags.end()) return it->second;
    }
    
    return std::nullopt;
}

}}
