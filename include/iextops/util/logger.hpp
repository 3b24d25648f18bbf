/*
    IexTops Logging

    Based on Quill - a low-latency asynchronous logging library.
    Log calls enqueue to a lock-free SPSC queue; a background thread formats
    and writes. The decode path itself never logs; the stream decoder and
    tools do.

    Compiled in when the build defines IEX_HAS_LOGGING, otherwise every
    macro below is a no-op.
*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#ifdef IEX_HAS_LOGGING

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>

#include <filesystem>
#include <memory>
#include <vector>

namespace iex::logging {

enum class Level {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

struct LogConfig {
    std::string log_dir = "logs";
    std::string log_name = "iextops";
    bool console_output = true;
    bool file_output = false;
    Level min_level = Level::Info;
    size_t max_file_size = 10 * 1024 * 1024;  // 10MB
    uint32_t max_backup_files = 5;
};

inline constexpr const char* LOGGER_NAME = "iex";

/// Start the backend thread and create the "iex" logger
inline void init(const LogConfig& config = {}) {
    quill::BackendOptions backend_options;
    backend_options.thread_name = "iex_logger";
    quill::Backend::start(backend_options);

    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (config.console_output) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }

    if (config.file_output) {
        std::filesystem::create_directories(config.log_dir);
        std::string log_path = config.log_dir + "/" + config.log_name + ".log";

        quill::RotatingFileSinkConfig file_config;
        file_config.set_open_mode('a');
        file_config.set_filename_append_option(quill::FilenameAppendOption::StartDateTime);
        file_config.set_rotation_max_file_size(config.max_file_size);
        file_config.set_max_backup_files(config.max_backup_files);

        sinks.push_back(quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(
            log_path, file_config));
    }

    quill::Logger* logger = quill::Frontend::create_or_get_logger(LOGGER_NAME, std::move(sinks));

    switch (config.min_level) {
        case Level::Trace:    logger->set_log_level(quill::LogLevel::TraceL1); break;
        case Level::Debug:    logger->set_log_level(quill::LogLevel::Debug); break;
        case Level::Info:     logger->set_log_level(quill::LogLevel::Info); break;
        case Level::Warning:  logger->set_log_level(quill::LogLevel::Warning); break;
        case Level::Error:    logger->set_log_level(quill::LogLevel::Error); break;
        case Level::Critical: logger->set_log_level(quill::LogLevel::Critical); break;
    }
}

/// nullptr until init() has run
inline quill::Logger* get() {
    return quill::Frontend::get_logger(LOGGER_NAME);
}

inline void shutdown() {
    quill::Backend::stop();
}

inline void flush() {
    if (auto* logger = get()) {
        logger->flush_log();
    }
}

} // namespace iex::logging

// ============================================================================
// Convenience Macros
// ============================================================================
// Library code may log before (or without) init(); the macros skip the call
// when no logger exists.

#define IEX_LOG_IMPL_(macro, fmt, ...) \
    do { if (auto* iex_logger_ = iex::logging::get()) macro(iex_logger_, fmt, ##__VA_ARGS__); } while(0)

#define IEX_LOG_DEBUG(fmt, ...) IEX_LOG_IMPL_(LOG_DEBUG, fmt, ##__VA_ARGS__)
#define IEX_LOG_INFO(fmt, ...)  IEX_LOG_IMPL_(LOG_INFO, fmt, ##__VA_ARGS__)
#define IEX_LOG_WARN(fmt, ...)  IEX_LOG_IMPL_(LOG_WARNING, fmt, ##__VA_ARGS__)
#define IEX_LOG_ERROR(fmt, ...) IEX_LOG_IMPL_(LOG_ERROR, fmt, ##__VA_ARGS__)

#else // IEX_HAS_LOGGING not defined

// ============================================================================
// No-op stubs when logging is disabled
// ============================================================================

namespace iex::logging {

enum class Level { Trace, Debug, Info, Warning, Error, Critical };

struct LogConfig {
    std::string log_dir = "logs";
    std::string log_name = "iextops";
    bool console_output = true;
    bool file_output = false;
    Level min_level = Level::Info;
    size_t max_file_size = 10 * 1024 * 1024;
    uint32_t max_backup_files = 5;
};

inline void init(const LogConfig& = {}) {}
inline void* get() { return nullptr; }
inline void shutdown() {}
inline void flush() {}

} // namespace iex::logging

#define IEX_LOG_DEBUG(fmt, ...) ((void)0)
#define IEX_LOG_INFO(fmt, ...)  ((void)0)
#define IEX_LOG_WARN(fmt, ...)  ((void)0)
#define IEX_LOG_ERROR(fmt, ...) ((void)0)

#endif // IEX_HAS_LOGGING
