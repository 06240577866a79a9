#pragma once

#include "../common/url.hpp"
#include "../common/constants.hpp"
#include <string>
#include <map>
#include <algorithm>
#include <cctype>
#include <utility>

namespace humio_exporter {
namespace config {

// Header names are case-insensitive on the wire.
struct HeaderNameLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }
};

using HeaderMap = std::map<std::string, std::string, HeaderNameLess>;
using TagMap = std::map<std::string, std::string>;

struct HttpClientSettings {
    std::string endpoint;
    HeaderMap headers;
    int timeout_seconds = constants::config_defaults::HTTP_TIMEOUT_SECONDS;
};

struct QueueSettings {
    bool enabled = constants::config_defaults::QUEUE_ENABLED;
    int num_consumers = constants::config_defaults::QUEUE_NUM_CONSUMERS;
    int queue_size = constants::config_defaults::QUEUE_SIZE;
};

struct RetrySettings {
    bool enabled = constants::config_defaults::RETRY_ENABLED;
    int initial_interval_seconds = constants::config_defaults::RETRY_INITIAL_INTERVAL_SECONDS;
    int max_interval_seconds = constants::config_defaults::RETRY_MAX_INTERVAL_SECONDS;
    int max_elapsed_time_seconds = constants::config_defaults::RETRY_MAX_ELAPSED_TIME_SECONDS;
};

struct LogsConfig {
    // Custom parser for ingest tokens that carry no parser of their own
    std::string log_parser;
};

struct TracesConfig {
    // Unix timestamps instead of ISO 8601 strings
    bool unix_timestamps = false;
};

struct ExporterConfig {
    HttpClientSettings http;
    QueueSettings queue;
    RetrySettings retry;
    
    std::string ingest_token;
    bool disable_compression = false;
    TagMap tags;
    bool disable_service_tag = false;
    
    LogsConfig logs;
    TracesConfig traces;
};

ExporterConfig createDefaultConfig();

// Result of sanitization. Only the sanitizer builds it; afterwards it is
// read-only and may be shared between request workers.
class SanitizedConfig {
public:
    const ExporterConfig& settings() const { return settings_; }
    const HeaderMap& headers() const { return settings_.http.headers; }
    
    const common::Url& structuredEndpoint() const { return structured_endpoint_; }
    const common::Url& unstructuredEndpoint() const { return unstructured_endpoint_; }
    
    std::string structuredUrl() const { return structured_endpoint_.toString(); }
    std::string unstructuredUrl() const { return unstructured_endpoint_.toString(); }

private:
    friend class Sanitizer;
    
    SanitizedConfig(ExporterConfig settings, common::Url structured, common::Url unstructured)
        : settings_(std::move(settings)),
          structured_endpoint_(std::move(structured)),
          unstructured_endpoint_(std::move(unstructured)) {}
    
    ExporterConfig settings_;
    common::Url structured_endpoint_;
    common::Url unstructured_endpoint_;
};

}}
