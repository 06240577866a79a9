#include "humio_exporter/config/validator.hpp"

#include <gtest/gtest.h>

namespace humio_exporter {
namespace config {

namespace {

ExporterConfig validConfig() {
    ExporterConfig config = createDefaultConfig();
    config.ingest_token = "abc123";
    config.http.endpoint = "https://cloud.example.com";
    return config;
}

void expectError(const ExporterConfig& config, ConfigErrorCode code) {
    ConfigValidator validator;
    auto result = validator.validate(config);
    EXPECT_FALSE(result.is_valid);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, code) << result.error->toString();
}

}

TEST(ConfigValidator, valid_config) {
    ConfigValidator validator;
    auto result = validator.validate(validConfig());
    EXPECT_TRUE(result.is_valid);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_TRUE(result.warnings.empty());
}

TEST(ConfigValidator, missing_ingest_token) {
    auto config = validConfig();
    config.ingest_token = "";
    expectError(config, ConfigErrorCode::MISSING_INGEST_TOKEN);

    ConfigValidator validator;
    EXPECT_EQ(validator.validate(config).error->message, "missing ingest token");
}

TEST(ConfigValidator, missing_ingest_token_wins_over_everything) {
    auto config = createDefaultConfig();
    config.disable_service_tag = true;
    config.http.headers["authorization"] = "Bearer x";
    config.http.headers["content-type"] = "text/plain";
    config.queue.queue_size = 0;
    expectError(config, ConfigErrorCode::MISSING_INGEST_TOKEN);

    config.http.endpoint = "https://cloud example.com";
    expectError(config, ConfigErrorCode::MISSING_INGEST_TOKEN);
}

TEST(ConfigValidator, missing_endpoint) {
    auto config = validConfig();
    config.http.endpoint = "";
    expectError(config, ConfigErrorCode::MISSING_ENDPOINT);

    ConfigValidator validator;
    EXPECT_EQ(validator.validate(config).error->message, "missing endpoint");
}

TEST(ConfigValidator, disabled_service_tag_requires_tags) {
    auto config = validConfig();
    config.disable_service_tag = true;
    expectError(config, ConfigErrorCode::MISSING_CUSTOM_TAGS);

    config.tags["env"] = "prod";
    ConfigValidator validator;
    EXPECT_TRUE(validator.validate(config).is_valid);
}

TEST(ConfigValidator, tags_optional_with_service_tag) {
    auto config = validConfig();
    config.disable_service_tag = false;
    config.tags.clear();
    ConfigValidator validator;
    EXPECT_TRUE(validator.validate(config).is_valid);
}

TEST(ConfigValidator, missing_tags_checked_before_endpoint) {
    auto config = validConfig();
    config.disable_service_tag = true;
    config.http.endpoint = "https://cloud example.com";
    expectError(config, ConfigErrorCode::MISSING_CUSTOM_TAGS);
}

TEST(ConfigValidator, invalid_endpoint) {
    const char* bad_endpoints[] = {
        "https://cloud example.com",
        "https://cloud.example.com:abc",
        "http://[::1",
        "://cloud.example.com",
        "https://cloud.example.com/%zz",
        "localhost:8080",
        "https:",
    };
    for (const char* endpoint : bad_endpoints) {
        auto config = validConfig();
        config.http.endpoint = endpoint;
        SCOPED_TRACE(endpoint);
        expectError(config, ConfigErrorCode::INVALID_ENDPOINT);
    }
}

TEST(ConfigValidator, invalid_endpoint_checked_before_headers) {
    auto config = validConfig();
    config.http.endpoint = "https://cloud example.com";
    config.http.headers["authorization"] = "Bearer x";
    expectError(config, ConfigErrorCode::INVALID_ENDPOINT);
}

TEST(ConfigValidator, content_type_must_be_json) {
    const char* bad_types[] = {"text/plain", "application/xml", "", "application/json; charset=utf-8"};
    for (const char* type : bad_types) {
        auto config = validConfig();
        config.http.headers["content-type"] = type;
        SCOPED_TRACE(type);
        expectError(config, ConfigErrorCode::INVALID_CONTENT_TYPE);
    }

    auto config = validConfig();
    config.http.headers["content-type"] = "application/json";
    ConfigValidator validator;
    EXPECT_TRUE(validator.validate(config).is_valid);
}

TEST(ConfigValidator, header_names_are_case_insensitive) {
    auto config = validConfig();
    config.http.headers["Content-Type"] = "text/plain";
    expectError(config, ConfigErrorCode::INVALID_CONTENT_TYPE);

    config = validConfig();
    config.http.headers["Authorization"] = "Bearer abc123";
    expectError(config, ConfigErrorCode::AUTHORIZATION_OVERRIDE);
}

TEST(ConfigValidator, authorization_never_user_supplied) {
    const char* values[] = {"Bearer abc123", "Basic dXNlcjpwdw==", ""};
    for (const char* value : values) {
        auto config = validConfig();
        config.http.headers["authorization"] = value;
        SCOPED_TRACE(value);
        expectError(config, ConfigErrorCode::AUTHORIZATION_OVERRIDE);
    }

    auto config = validConfig();
    config.http.headers["authorization"] = "Bearer abc123";
    ConfigValidator validator;
    EXPECT_EQ(validator.validate(config).error->message, "authorization header must not be set by the user");
}

TEST(ConfigValidator, content_type_checked_before_authorization) {
    auto config = validConfig();
    config.http.headers["content-type"] = "text/plain";
    config.http.headers["authorization"] = "Bearer x";
    expectError(config, ConfigErrorCode::INVALID_CONTENT_TYPE);
}

TEST(ConfigValidator, content_encoding_follows_compression) {
    ConfigValidator validator;

    auto config = validConfig();
    config.disable_compression = false;
    config.http.headers["content-encoding"] = "gzip";
    EXPECT_TRUE(validator.validate(config).is_valid);

    config.http.headers["content-encoding"] = "deflate";
    expectError(config, ConfigErrorCode::CONTENT_ENCODING_MISMATCH);

    config.disable_compression = true;
    config.http.headers["content-encoding"] = "gzip";
    expectError(config, ConfigErrorCode::CONTENT_ENCODING_MISMATCH);

    config.http.headers["content-encoding"] = "identity";
    expectError(config, ConfigErrorCode::CONTENT_ENCODING_MISMATCH);
}

TEST(ConfigValidator, absent_content_encoding_is_fine) {
    ConfigValidator validator;

    auto config = validConfig();
    config.disable_compression = false;
    EXPECT_TRUE(validator.validate(config).is_valid);

    config.disable_compression = true;
    EXPECT_TRUE(validator.validate(config).is_valid);
}

TEST(ConfigValidator, negative_timeout) {
    auto config = validConfig();
    config.http.timeout_seconds = -1;
    expectError(config, ConfigErrorCode::INVALID_TIMEOUT);
}

TEST(ConfigValidator, queue_settings) {
    auto config = validConfig();
    config.queue.queue_size = 0;
    expectError(config, ConfigErrorCode::INVALID_QUEUE_SIZE);

    config = validConfig();
    config.queue.num_consumers = 0;
    expectError(config, ConfigErrorCode::INVALID_QUEUE_CONSUMERS);

    config.queue.enabled = false;
    config.queue.queue_size = 0;
    ConfigValidator validator;
    EXPECT_TRUE(validator.validate(config).is_valid);
}

TEST(ConfigValidator, retry_settings) {
    auto config = validConfig();
    config.retry.initial_interval_seconds = 60;
    config.retry.max_interval_seconds = 30;
    expectError(config, ConfigErrorCode::INVALID_RETRY_INTERVAL);

    config = validConfig();
    config.retry.max_elapsed_time_seconds = -5;
    expectError(config, ConfigErrorCode::INVALID_RETRY_INTERVAL);

    config.retry.enabled = false;
    ConfigValidator validator;
    EXPECT_TRUE(validator.validate(config).is_valid);
}

TEST(ConfigValidator, header_errors_precede_sending_settings) {
    auto config = validConfig();
    config.queue.queue_size = -1;
    config.http.headers["content-encoding"] = "br";
    expectError(config, ConfigErrorCode::CONTENT_ENCODING_MISMATCH);
}

TEST(ConfigValidator, warns_about_plain_http) {
    auto config = validConfig();
    config.http.endpoint = "http://cloud.example.com";
    ConfigValidator validator;
    auto result = validator.validate(config);
    EXPECT_TRUE(result.is_valid);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("unencrypted"), std::string::npos);
}

TEST(ConfigValidator, warns_about_missing_scheme) {
    auto config = validConfig();
    config.http.endpoint = "cloud.example.com";
    ConfigValidator validator;
    auto result = validator.validate(config);
    EXPECT_TRUE(result.is_valid);
    EXPECT_EQ(result.warnings.size(), 1u);
}

TEST(ConfigValidator, validation_is_repeatable_and_pure) {
    auto config = validConfig();
    config.http.headers["x-custom"] = "1";
    config.tags["env"] = "prod";
    const ExporterConfig before = config;

    ConfigValidator validator;
    auto first = validator.validate(config);
    auto second = validator.validate(config);

    EXPECT_EQ(first.is_valid, second.is_valid);
    EXPECT_EQ(first.warnings, second.warnings);
    EXPECT_EQ(config.http.headers, before.http.headers);
    EXPECT_EQ(config.tags, before.tags);
    EXPECT_EQ(config.http.endpoint, before.http.endpoint);
}

TEST(ConfigValidator, default_constructed_matches_default_config) {
    ExporterConfig constructed;
    const auto defaults = createDefaultConfig();
    EXPECT_EQ(constructed.http.timeout_seconds, defaults.http.timeout_seconds);
    EXPECT_EQ(constructed.queue.enabled, defaults.queue.enabled);
    EXPECT_EQ(constructed.queue.num_consumers, defaults.queue.num_consumers);
    EXPECT_EQ(constructed.queue.queue_size, defaults.queue.queue_size);
    EXPECT_EQ(constructed.retry.enabled, defaults.retry.enabled);
    EXPECT_EQ(constructed.retry.initial_interval_seconds, defaults.retry.initial_interval_seconds);
    EXPECT_EQ(constructed.retry.max_interval_seconds, defaults.retry.max_interval_seconds);
    EXPECT_EQ(constructed.retry.max_elapsed_time_seconds, defaults.retry.max_elapsed_time_seconds);

    constructed.ingest_token = "abc123";
    constructed.http.endpoint = "https://cloud.example.com";
    ConfigValidator validator;
    auto from_constructed = validator.validate(constructed);
    auto from_defaults = validator.validate(validConfig());
    EXPECT_TRUE(from_constructed.is_valid);
    EXPECT_EQ(from_constructed.is_valid, from_defaults.is_valid);
    EXPECT_EQ(from_constructed.warnings, from_defaults.warnings);
}

TEST(ConfigError, to_string_includes_detail) {
    auto error = ConfigError::make(ConfigErrorCode::INVALID_CONTENT_TYPE, "text/plain");
    EXPECT_EQ(error.toString(), "content-type must be application/json: text/plain");
    EXPECT_STREQ(ConfigErrorCodeHelper::toString(ConfigErrorCode::INVALID_CONTENT_TYPE), "INVALID_CONTENT_TYPE");

    auto plain = ConfigError::make(ConfigErrorCode::MISSING_ENDPOINT);
    EXPECT_EQ(plain.toString(), "missing endpoint");
}

TEST(ConfigError, unregistered_code_falls_back) {
    auto code = static_cast<ConfigErrorCode>(999);
    EXPECT_STREQ(ConfigErrorCodeHelper::toString(code), "UNKNOWN");
    EXPECT_EQ(ConfigErrorCodeHelper::describe(code, "x"), "unknown error: x");
}

TEST(ConfigMasker, masks_sensitive_keys) {
    EXPECT_EQ(ConfigMasker::mask("ingest_token", "abcdefghijkl"), "abcd****");
    EXPECT_EQ(ConfigMasker::mask("ingest_token", "short"), "****");
    EXPECT_EQ(ConfigMasker::mask("ingest_token", ""), "");
    EXPECT_EQ(ConfigMasker::mask("headers.authorization", "Bearer abcdefghijkl"), "Bearer abcd****");
    EXPECT_EQ(ConfigMasker::mask("headers.Authorization", "Bearer abc"), "Bearer ****");
    EXPECT_EQ(ConfigMasker::mask("endpoint", "https://cloud.example.com"), "https://cloud.example.com");
    EXPECT_TRUE(ConfigMasker::isSensitive("headers.AUTHORIZATION"));
    EXPECT_FALSE(ConfigMasker::isSensitive("headers.user-agent"));
}

}}
