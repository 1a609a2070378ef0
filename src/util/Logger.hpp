#pragma once

#include <string>

namespace trackr {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide diagnostic logger
 *
 * All levels write to stderr so that rendered command output on stdout is
 * never interleaved with diagnostics. Threshold comes from TRACKR_LOG and
 * can be raised with --verbose.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    LogLevel currentLevel;
};

}
