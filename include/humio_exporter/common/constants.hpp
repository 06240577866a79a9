#pragma once

#include <string>

namespace humio_exporter {
namespace constants {

namespace version {
    constexpr const char* TOOL_VERSION = "0.1.0";
    
    inline std::string getFullVersion() {
        return std::string("Humio exporter config tool v") + TOOL_VERSION;
    }
}

namespace ingest {
    constexpr const char* STRUCTURED_PATH = "api/v1/ingest/humio-structured";
    constexpr const char* UNSTRUCTURED_PATH = "api/v1/ingest/humio-unstructured";
}

namespace headers {
    constexpr const char* CONTENT_TYPE = "content-type";
    constexpr const char* AUTHORIZATION = "authorization";
    constexpr const char* CONTENT_ENCODING = "content-encoding";
    constexpr const char* USER_AGENT = "user-agent";
    
    constexpr const char* JSON_CONTENT_TYPE = "application/json";
    constexpr const char* GZIP_ENCODING = "gzip";
    constexpr const char* BEARER_PREFIX = "Bearer ";
    constexpr const char* DEFAULT_USER_AGENT = "opentelemetry-collector-contrib Humio";
}

namespace system {
    constexpr const char* APPLICATION_NAME = "Humio exporter configuration";
    constexpr const char* LOGGER_NAME = "humio-exporter";
}

namespace config_defaults {
    constexpr int HTTP_TIMEOUT_SECONDS = 30;
    
    constexpr bool QUEUE_ENABLED = true;
    constexpr int QUEUE_NUM_CONSUMERS = 10;
    constexpr int QUEUE_SIZE = 5000;
    
    constexpr bool RETRY_ENABLED = true;
    constexpr int RETRY_INITIAL_INTERVAL_SECONDS = 5;
    constexpr int RETRY_MAX_INTERVAL_SECONDS = 30;
    constexpr int RETRY_MAX_ELAPSED_TIME_SECONDS = 300;
    
    constexpr size_t LOG_ROTATION_SIZE_MB = 100;
    constexpr size_t LOG_MAX_FILES = 5;
}

}
}
