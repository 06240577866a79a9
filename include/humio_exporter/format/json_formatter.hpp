#pragma once

#include "../config/exporter_config.hpp"
#include "../config/validator.hpp"
#include <nlohmann/json.hpp>

namespace humio_exporter {
namespace format {

class JsonFormatter {
public:
    static nlohmann::json format(const config::SanitizedConfig& sanitized, bool reveal_secrets);
    static nlohmann::json formatValidation(const config::ValidationResult& result);

private:
    static nlohmann::json formatHeaders(const config::HeaderMap& headers, bool reveal_secrets);
    static nlohmann::json formatSending(const config::ExporterConfig& settings);
};

}}
