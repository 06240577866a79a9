#include "humio_exporter/common/logger.hpp"
#include "humio_exporter/common/constants.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <filesystem>
#include <vector>
#include <algorithm>
#include <cctype>

namespace humio_exporter {
namespace common {

static spdlog::sink_ptr makeConsoleSink(spdlog::level::level_enum level) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(level);
    return console_sink;
}

LoggingConfig createDefaultLoggingConfig() {
    LoggingConfig config;
    config.rotation_size_mb = constants::config_defaults::LOG_ROTATION_SIZE_MB;
    config.max_files = constants::config_defaults::LOG_MAX_FILES;
    config.format = LogFormat::TEXT;
    return config;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config) {
    if (initialized_) {
        if (logger_) {
            logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        }
        return;
    }

    if (logger_) {
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }

    try {
        auto spdlog_level = toSpdlogLevel(level);
        std::vector<spdlog::sink_ptr> sinks;
        current_format_ = logging_config.format;

        if (mode == LogMode::FILE_ONLY) {
            std::filesystem::path log_dir = std::filesystem::path(log_file).parent_path();

            std::error_code ec;
            if (log_file.empty()) {
                std::cerr << "[Logger] No log file path given for file mode" << std::endl;
                std::cerr << "[Logger] Falling back to console output" << std::endl;
                sinks.push_back(makeConsoleSink(spdlog_level));
            } else if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec) &&
                !std::filesystem::create_directories(log_dir, ec)) {
                std::cerr << "[Logger] Failed to create log directory: " << log_dir
                         << " - " << ec.message() << std::endl;
                std::cerr << "[Logger] Falling back to console output" << std::endl;
                sinks.push_back(makeConsoleSink(spdlog_level));
            } else {
                try {
                    std::string effective_log_file = getLogFileWithSuffix(logging_config.format, log_file);

                    size_t max_size = logging_config.rotation_size_mb * 1024 * 1024;

                    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        effective_log_file, max_size, logging_config.max_files);
                    file_sink->set_level(spdlog_level);
                    sinks.push_back(file_sink);
                } catch (const spdlog::spdlog_ex& ex) {
                    std::cerr << "[Logger] Failed to open log file: " << log_file
                             << " - " << ex.what() << std::endl;
                    std::cerr << "[Logger] Falling back to console output" << std::endl;
                    sinks.push_back(makeConsoleSink(spdlog_level));
                }
            }
        } else {
            sinks.push_back(makeConsoleSink(spdlog_level));
        }

        logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, sinks.begin(), sinks.end());

        if (current_format_ == LogFormat::JSON) {
            logger_->set_pattern(R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","message":"%v"})");
        } else {
            logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        }

        logger_->set_level(spdlog_level);

        if (mode == LogMode::FILE_ONLY) {
            logger_->flush_on(spdlog::level::info);
        }

        spdlog::register_logger(logger_);
        initialized_ = true;

    } catch (const std::exception& ex) {
        std::cerr << "[Logger] Initialization failed: " << ex.what() << std::endl;
        logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, makeConsoleSink(toSpdlogLevel(level)));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger_->set_level(toSpdlogLevel(level));
        initialized_ = true;
    }
}

void Logger::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(toSpdlogLevel(level));
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }
    initialized_ = false;
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
        default: return spdlog::level::info;
    }
}

std::string Logger::getLogFileWithSuffix(LogFormat format, const std::string& base_path) const {
    if (format == LogFormat::JSON) {
        std::filesystem::path p(base_path);
        std::string stem = p.stem().string();
        std::string ext = p.extension().string();
        std::string parent = p.parent_path().string();

        if (parent.empty()) {
            return stem + ".json" + ext;
        } else {
            return parent + "/" + stem + ".json" + ext;
        }
    }
    return base_path;
}

bool parseLogLevel(const std::string& text, LogLevel& level) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") level = LogLevel::DEBUG;
    else if (upper == "INFO") level = LogLevel::INFO;
    else if (upper == "WARN") level = LogLevel::WARN;
    else if (upper == "ERROR") level = LogLevel::ERROR;
    else return false;

    return true;
}

}}
