#include "config_command.hpp"
#include "humio_exporter/common/logger.hpp"
#include "humio_exporter/config/loader.hpp"
#include "humio_exporter/config/sanitizer.hpp"
#include "humio_exporter/config/validator.hpp"
#include "humio_exporter/format/json_formatter.hpp"
#include <iostream>

namespace humio_exporter {
namespace cli {

ConfigCommand::ConfigCommand() : was_called_(false) {}

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    validate_cmd_ = subcommand->add_subcommand("validate", "Validate an exporter configuration");
    validate_cmd_->add_option("file", validate_path_, "Configuration file (TOML)")->required();
    validate_cmd_->add_flag("--json", validate_json_, "Print the result as JSON");
    validate_cmd_->callback([this]() { was_called_ = true; });

    show_cmd_ = subcommand->add_subcommand("show", "Show derived endpoints and headers");
    show_cmd_->add_option("file", show_path_, "Configuration file (TOML)")->required();
    show_cmd_->add_flag("--json", show_json_, "Print the result as JSON");
    show_cmd_->add_flag("--reveal-secrets", reveal_secrets_, "Show the ingest token unmasked");
    show_cmd_->callback([this]() { was_called_ = true; });

    get_cmd_ = subcommand->add_subcommand("get", "Get a single configuration value");
    get_cmd_->add_option("file", get_path_, "Configuration file (TOML)")->required();
    get_cmd_->add_option("key", get_key_, "Configuration key, e.g. logs.log_parser")->required();
    get_cmd_->add_flag("--reveal-secrets", get_reveal_secrets_, "Show sensitive information");
    get_cmd_->callback([this]() { was_called_ = true; });
}

bool ConfigCommand::wasCalled() const {
    return was_called_;
}

int ConfigCommand::execute() {
    if (validate_cmd_->parsed()) {
        return executeValidate();
    } else if (show_cmd_->parsed()) {
        return executeShow();
    } else if (get_cmd_->parsed()) {
        return executeGet();
    }

    std::cout << subcommand_->help() << std::endl;
    return 0;
}

std::optional<config::ExporterConfig> ConfigCommand::loadOrReport(const std::string& path) {
    auto loaded = config::ConfigLoader::loadFile(path);
    if (!loaded.ok()) {
        std::cerr << "\033[31mError: " << loaded.error->toString() << "\033[0m\n";
        return std::nullopt;
    }
    return loaded.config;
}

int ConfigCommand::executeValidate() {
    auto exporter_config = loadOrReport(validate_path_);
    if (!exporter_config) {
        return 1;
    }

    config::ConfigValidator validator;
    auto result = validator.validate(*exporter_config);

    if (validate_json_) {
        std::cout << format::JsonFormatter::formatValidation(result).dump(2) << std::endl;
        return result.is_valid ? 0 : 1;
    }

    std::cout << "Validating: " << validate_path_ << "\n\n";

    if (result.error) {
        std::cout << "  ERROR: " << result.error->toString() << "\n";
    }

    for (const auto& warning : result.warnings) {
        std::cout << "  WARNING: " << warning << "\n";
    }

    if (result.is_valid) {
        std::cout << "\nConfiguration is valid.\n";
        return 0;
    }

    std::cout << "\nConfiguration has errors.\n";
    return 1;
}

int ConfigCommand::executeShow() {
    auto exporter_config = loadOrReport(show_path_);
    if (!exporter_config) {
        return 1;
    }

    auto prepared = config::Sanitizer::prepare(*exporter_config);
    if (!prepared.ok()) {
        std::cerr << "\033[31mError: " << prepared.error->toString() << "\033[0m\n";
        return 1;
    }

    const auto& sanitized = *prepared.config;

    if (show_json_) {
        std::cout << format::JsonFormatter::format(sanitized, reveal_secrets_).dump(2) << std::endl;
        return 0;
    }

    std::cout << "Configuration file: " << show_path_ << "\n\n";
    std::cout << "Endpoints:\n";
    std::cout << "  structured:   " << sanitized.structuredUrl() << "\n";
    std::cout << "  unstructured: " << sanitized.unstructuredUrl() << "\n\n";

    std::cout << "Headers:\n";
    for (const auto& [name, value] : sanitized.headers()) {
        std::string shown = reveal_secrets_ ? value : config::ConfigMasker::mask("headers." + name, value);
        std::cout << "  " << name << ": " << shown << "\n";
    }

    const auto& tags = sanitized.settings().tags;
    if (!tags.empty()) {
        std::cout << "\nTags:\n";
        for (const auto& [key, value] : tags) {
            std::cout << "  " << key << "=" << value << "\n";
        }
    }

    return 0;
}

int ConfigCommand::executeGet() {
    auto exporter_config = loadOrReport(get_path_);
    if (!exporter_config) {
        return 1;
    }

    auto value = config::ConfigLoader::getValue(*exporter_config, get_key_);
    if (!value) {
        std::cerr << get_key_ << ": (not set)\n";
        return 1;
    }

    if (!get_reveal_secrets_) {
        *value = config::ConfigMasker::mask(get_key_, *value);
    }

    std::cout << get_key_ << " = " << *value << "\n";
    return 0;
}

}}
