/**
 * This file declares the API for logging.
 *
 *   @file: logging.h
 *
 *    Copyright 2023 University Corporation for Atmospheric Research
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef MAIN_MISC_LOGGING_H_
#define MAIN_MISC_LOGGING_H_

#include <atomic>
#include <cerrno>
#include <cstring>
#include <exception>
#include <iostream>
#include <signal.h>
#include <stdlib.h>
#include <string>

namespace sockcast {

/// Logging level
class LogLevel
{
    int level;

    LogLevel(const int level) noexcept
        : level{level}
    {}

public:
    static const LogLevel TRACE; ///< Lowest priority logging level
    static const LogLevel DEBUG; ///< Logging level for debug messages
    static const LogLevel INFO;  ///< Logging level for informational messages
    static const LogLevel NOTE;  ///< Logging level for notices
    static const LogLevel WARN;  ///< Logging level for warnings
    static const LogLevel ERROR; ///< Logging level for errors
    static const LogLevel FATAL; ///< Logging level for fatal errors

    LogLevel() noexcept
        : LogLevel(0)
    {}

    /**
     * Casts this instance to an integer.
     * @return The integer representation of this instance
     */
    operator int() const noexcept {
        return level;
    }

    /**
     * Indicates if this logging level includes a given one.
     * @param[in] arg  The given logging level to be examined
     * @retval    true     This logging level includes the given one
     * @retval    false    This logging level does not include the given one
     */
    bool includes(const LogLevel& arg) const noexcept {
        return arg.level >= level;
    }

    /**
     * Lowers the logging level making it more verbose.
     */
    void lower() noexcept {
        if (level)
            --level;
    }

    /**
     * Returns the string representation of this instance.
     * @return The string representation of this instance
     */
    const std::string& to_string() const noexcept {
        static const std::string strings[] = {
                "TRACE", "DEBUG", "INFO", "NOTE", "WARN", "ERROR", "FATAL"
        };
        return strings[level];
    }
};

std::ostream& operator<<(std::ostream& ostream, const LogLevel& level);

typedef std::atomic<LogLevel> LogThreshold; ///< Type of the logging threshold
extern LogThreshold           logThreshold; ///< The logging threshold

/**
 * Sets the name of the program that appears in every log message.
 * @param[in] name  Name of the program
 */
void log_setName(const std::string& name);

/**
 * Returns the name of the program.
 * @return Name of the program
 */
const std::string& log_getName() noexcept;

/**
 * Installs a handler that rotates the logging threshold through NOTE, INFO, DEBUG, and TRACE each
 * time a signal is received.
 * @param[in] signal  The signal
 */
void log_setLevelSignal(const int signal = SIGUSR2) noexcept;

/**
 * Returns the current logging level.
 *
 * @return  Current logging level
 */
LogLevel log_getLevel() noexcept;

/**
 * Sets the logging level.
 * @param[in] level  The logging level
 */
void log_setLevel(const LogLevel level) noexcept;

/**
 * Sets the logging level. Useful in command-line decoding.
 *
 * @param[in] name               Name of the logging level. One of "trace",
 *                               "debug", "info", "note", "warn", "error", or
 *                               "fatal". Fewer characters can be used. Matching
 *                               is case independent.
 * @throw std::invalid_argument  Name isn't one of the allowed names
 */
void log_setLevel(const std::string& name);

/**
 * Indicates if a message at a given logging level would be logged.
 * @param[in] level  The logging level
 * @retval    true   A message at the level would be logged
 * @retval    false  A message at the level would not be logged
 */
inline bool log_enabled(const LogLevel& level) noexcept {
    return logThreshold.load().includes(level);
}

void log(
        const LogLevel        level,
        const std::exception& ex);
void log(
        const LogLevel level,
        const char*    file,
        const int      line,
        const char*    func,
        const char*    fmt,
        ...);
void log(
        const LogLevel        level,
        const char*           file,
        const int             line,
        const char*           func,
        const std::exception& ex,
        const char*           fmt,
        ...);
void log(
        const LogLevel     level,
        const char*        file,
        const int          line,
        const char*        func,
        const std::string& msg);
void log(
        const LogLevel        level,
        const char*           file,
        const int             line,
        const char*           func,
        const std::exception& ex);

/// Macro for logging a message at the trace level
#define LOG_TRACE(...) \
    do \
        if (sockcast::log_enabled(sockcast::LogLevel::TRACE)) \
            sockcast::log(sockcast::LogLevel::TRACE, __FILE__, __LINE__, __func__, __VA_ARGS__); \
    while(false)

/// Macro for logging a message at the debug level
#define LOG_DEBUG(...) \
    do \
        if (sockcast::log_enabled(sockcast::LogLevel::DEBUG)) \
            sockcast::log(sockcast::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__); \
    while(false)

/// Macro for logging a message at the info level
#define LOG_INFO(...) \
    do \
        if (sockcast::log_enabled(sockcast::LogLevel::INFO)) \
            sockcast::log(sockcast::LogLevel::INFO, __FILE__, __LINE__, __func__, __VA_ARGS__); \
    while(false)

/// Macro for logging a message at the note level
#define LOG_NOTE(...) \
    do \
        if (sockcast::log_enabled(sockcast::LogLevel::NOTE)) \
            sockcast::log(sockcast::LogLevel::NOTE, __FILE__, __LINE__, __func__, __VA_ARGS__); \
    while(false)

/// Macro for logging a message at the warning level
#define LOG_WARNING(...) \
    do \
        if (sockcast::log_enabled(sockcast::LogLevel::WARN)) \
            sockcast::log(sockcast::LogLevel::WARN, __FILE__, __LINE__, __func__, __VA_ARGS__); \
    while(false)

/// Macro for logging a message at the error level
#define LOG_ERROR(...) \
    do \
        if (sockcast::log_enabled(sockcast::LogLevel::ERROR)) \
            sockcast::log(sockcast::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__); \
    while(false)

/// Macro for logging a message at the system-error level
#define LOG_SYSERR(...) \
    do \
        if (sockcast::log_enabled(sockcast::LogLevel::ERROR)) { \
            sockcast::log(sockcast::LogLevel::ERROR, __FILE__, __LINE__, __func__, "%s", \
                    ::strerror(errno)); \
            sockcast::log(sockcast::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    while(false)

/// Macro for logging a message at the fatal level
#define LOG_FATAL(...) \
    do \
        if (sockcast::log_enabled(sockcast::LogLevel::FATAL)) \
            sockcast::log(sockcast::LogLevel::FATAL, __FILE__, __LINE__, __func__, __VA_ARGS__); \
    while(false)

} // namespace

#endif /* MAIN_MISC_LOGGING_H_ */
