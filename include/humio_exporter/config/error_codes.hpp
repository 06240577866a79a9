#pragma once

#include "../common/error_framework.hpp"
#include <string>

namespace humio_exporter {
namespace config {

enum class ConfigErrorCode {
    MISSING_INGEST_TOKEN = 100,
    MISSING_ENDPOINT = 101,
    MISSING_CUSTOM_TAGS = 102,
    INVALID_ENDPOINT = 103,
    INVALID_CONTENT_TYPE = 104,
    AUTHORIZATION_OVERRIDE = 105,
    CONTENT_ENCODING_MISMATCH = 106,
    
    INVALID_TIMEOUT = 200,
    INVALID_QUEUE_SIZE = 201,
    INVALID_QUEUE_CONSUMERS = 202,
    INVALID_RETRY_INTERVAL = 203,
    
    MALFORMED_ENDPOINT = 300,
    
    CONFIG_FILE_NOT_FOUND = 400,
    CONFIG_PARSE_FAILED = 401
};

using ConfigErrorCodeHelper = common::ErrorRegistry<ConfigErrorCode>;

}}

namespace humio_exporter {
namespace common {

template<>
inline const ErrorRegistry<config::ConfigErrorCode>::Table&
ErrorRegistry<config::ConfigErrorCode>::table() {
    using config::ConfigErrorCode;
    static const Table entries = {
        {ConfigErrorCode::MISSING_INGEST_TOKEN, {"MISSING_INGEST_TOKEN", "missing ingest token"}},
        {ConfigErrorCode::MISSING_ENDPOINT, {"MISSING_ENDPOINT", "missing endpoint"}},
        {ConfigErrorCode::MISSING_CUSTOM_TAGS, {"MISSING_CUSTOM_TAGS", "at least one custom tag required when service tag is disabled"}},
        {ConfigErrorCode::INVALID_ENDPOINT, {"INVALID_ENDPOINT", "invalid endpoint"}},
        {ConfigErrorCode::INVALID_CONTENT_TYPE, {"INVALID_CONTENT_TYPE", "content-type must be application/json"}},
        {ConfigErrorCode::AUTHORIZATION_OVERRIDE, {"AUTHORIZATION_OVERRIDE", "authorization header must not be set by the user"}},
        {ConfigErrorCode::CONTENT_ENCODING_MISMATCH, {"CONTENT_ENCODING_MISMATCH", "content-encoding mismatch with compression setting"}},
        {ConfigErrorCode::INVALID_TIMEOUT, {"INVALID_TIMEOUT", "timeout must not be negative"}},
        {ConfigErrorCode::INVALID_QUEUE_SIZE, {"INVALID_QUEUE_SIZE", "queue size must be positive"}},
        {ConfigErrorCode::INVALID_QUEUE_CONSUMERS, {"INVALID_QUEUE_CONSUMERS", "number of queue consumers must be positive"}},
        {ConfigErrorCode::INVALID_RETRY_INTERVAL, {"INVALID_RETRY_INTERVAL", "invalid retry intervals"}},
        {ConfigErrorCode::MALFORMED_ENDPOINT, {"MALFORMED_ENDPOINT", "malformed endpoint"}},
        {ConfigErrorCode::CONFIG_FILE_NOT_FOUND, {"CONFIG_FILE_NOT_FOUND", "configuration file not found"}},
        {ConfigErrorCode::CONFIG_PARSE_FAILED, {"CONFIG_PARSE_FAILED", "failed to parse configuration"}}
    };
    return entries;
}

}}

namespace humio_exporter {
namespace config {

struct ConfigError {
    ConfigErrorCode code;
    std::string message;
    std::string detail;
    
    static ConfigError make(ConfigErrorCode code, const std::string& detail = "") {
        return ConfigError{code, ConfigErrorCodeHelper::getMessage(code), detail};
    }
    
    std::string toString() const {
        return ConfigErrorCodeHelper::describe(code, detail);
    }
};

}}
