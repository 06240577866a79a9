#pragma once

#include "main_command.hpp"
#include "humio_exporter/config/exporter_config.hpp"
#include <CLI/CLI.hpp>
#include <optional>
#include <string>

namespace humio_exporter {
namespace cli {

class ConfigCommand : public MainCommand {
public:
    ConfigCommand();
    
    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;
    
    CLI::App* validate_cmd_;
    std::string validate_path_;
    bool validate_json_ = false;
    
    CLI::App* show_cmd_;
    std::string show_path_;
    bool show_json_ = false;
    bool reveal_secrets_ = false;
    
    CLI::App* get_cmd_;
    std::string get_path_;
    std::string get_key_;
    bool get_reveal_secrets_ = false;
    
    int executeValidate();
    int executeShow();
    int executeGet();
    
    std::optional<config::ExporterConfig> loadOrReport(const std::string& path);
};

}}
