#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>

#include "humio_exporter/common/constants.hpp"
#include "humio_exporter/common/logger.hpp"
#include "cli/config_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{humio_exporter::constants::system::APPLICATION_NAME, "humio-exporter"};
        app.set_version_flag("--version,-v", humio_exporter::constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string log_level_text = "WARN";
        std::string log_file;
        bool json_logs = false;
        app.add_option("--log-level", log_level_text, "DEBUG, INFO, WARN or ERROR");
        app.add_option("--log-file", log_file, "Write logs to a rotating file instead of stderr");
        app.add_flag("--json-logs", json_logs, "Emit log lines as JSON");

        auto config_cmd = std::make_unique<humio_exporter::cli::ConfigCommand>();
        config_cmd->setup(app.add_subcommand("config", "Validate and inspect exporter configuration"));

        CLI11_PARSE(app, argc, argv);

        humio_exporter::common::LogLevel log_level = humio_exporter::common::LogLevel::WARN;
        if (!humio_exporter::common::parseLogLevel(log_level_text, log_level)) {
            std::cerr << "Error: unknown log level '" << log_level_text << "'" << std::endl;
            return 1;
        }

        auto logging_config = humio_exporter::common::createDefaultLoggingConfig();
        if (json_logs) {
            logging_config.format = humio_exporter::common::LogFormat::JSON;
        }

        humio_exporter::common::Logger::instance().initialize(
            log_file.empty() ? humio_exporter::common::LogMode::CONSOLE_ONLY
                             : humio_exporter::common::LogMode::FILE_ONLY,
            log_file,
            log_level,
            logging_config
        );

        int rc = 0;
        if (config_cmd->wasCalled()) {
            rc = config_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }

        humio_exporter::common::Logger::instance().shutdown();
        return rc;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
