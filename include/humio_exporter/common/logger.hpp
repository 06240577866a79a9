#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <string>

namespace humio_exporter {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

enum class LogMode {
    CONSOLE_ONLY,
    FILE_ONLY
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

LoggingConfig createDefaultLoggingConfig();

// Process-wide logger. Every call is a no-op until initialize() runs, so
// the configuration core stays silent inside hosts that never set it up.
class Logger {
public:
    static Logger& instance();
    
    void initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config);
    void setLevel(LogLevel level);
    void shutdown();
    
    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        if (logger_) logger_->error(fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        if (logger_) logger_->warn(fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        if (logger_) logger_->info(fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        if (logger_) logger_->debug(fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    void flush();
    
    bool isInitialized() const { return initialized_; }

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> logger_;
    bool initialized_ = false;
    LogFormat current_format_ = LogFormat::TEXT;
    
    spdlog::level::level_enum toSpdlogLevel(LogLevel level);
    std::string getLogFileWithSuffix(LogFormat format, const std::string& base_path) const;
};

bool parseLogLevel(const std::string& text, LogLevel& level);

}}
