//
// console_log_sink.hpp
//

#ifndef DOCSCRUB_CONSOLE_LOG_SINK_HPP
#define DOCSCRUB_CONSOLE_LOG_SINK_HPP

#include "../../../libdocscrub/include/log_sink.hpp"
#include "../../../libdocscrub/include/logger.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Prints log lines at or above log_level. Debug and Info go to
 * stdout, Warning and Error to stderr.
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Error;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) {
            return;
        }
        std::lock_guard lock(mtx_);
        std::ostream& os = level >= LogLevel::Warning ? std::cerr : std::cout;
        switch (level) {
            case LogLevel::Debug:   os << "[DEBUG]"; break;
            case LogLevel::Info:    os << "[INFO ]"; break;
            case LogLevel::Warning: os << "[WARN ]"; break;
            case LogLevel::Error:   os << "[ERROR]"; break;
        }
        os << "[" << tag << "] " << message << std::endl;
    }

private:
    std::mutex mtx_;
};

#endif // DOCSCRUB_CONSOLE_LOG_SINK_HPP
