/**
 * @file
 * @brief Logger component
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <common/common.hpp>

#include <cstdint>
#include <iostream>
#include <sstream>

namespace resprint {

/**
 * The logging level
 */
enum class LogLevel : uint8_t {
    none,
    error,
    warning,
    info,
    debug,
    trace
};

/**
 * @brief Increase the log level
 */
LogLevel operator++(LogLevel &level, int);

/**
 * @brief Decrease the log level
 */
LogLevel operator--(LogLevel &level, int);

/**
 * @brief A logger component
 *
 * Messages are written to the standard error output unless redirected
 * by set_output().
 */
class Logger {
public:
    /**
     * @brief A single log line
     *
     * The line is composed in a local buffer and written at once when
     * the line object is destroyed.
     */
    class Line {
        DISABLE_COPY_AND_MOVE(Line)

    public:
        /**
         * @brief Finish the log line
         */
        ~Line();

        /**
         * @brief Write value onto the log line
         *
         * @param value  The value to write
         *
         * @return reference to self
         */
        template <typename T>
        Line &operator<<(const T& value)
        {
            if (!m_ignored) {
                m_buffer << value;
            }
            return *this;
        }

    private:
        friend class Logger;

        std::ostream &m_output;
        bool m_ignored;
        std::ostringstream m_buffer;

        Line(std::ostream &output, LogLevel verbosity_level, LogLevel message_level);
    };

    /**
     * @brief Get the instance of the logger
     */
    static Logger &get_instance();

    /**
     * @brief Set the maximum level of messages to show
     *
     * @param level  The level
     */
    void set_log_level(LogLevel level)
    {
        m_log_level = level;
    }

    /** @brief Get the maximum level of messages to show */
    LogLevel get_log_level() const { return m_log_level; }

    /**
     * @brief Redirect log lines to another stream
     *
     * @param output  The stream, nullptr restores the standard error output
     */
    void set_output(std::ostream *output)
    {
        m_output = (output != nullptr) ? output : &std::cerr;
    }

    /**
     * @brief Log a line on a specified logging level
     *
     * @param level  The log level
     *
     * @return The line object
     */
    Line log(LogLevel level)
    {
        return {*m_output, m_log_level, level};
    }

private:
    LogLevel m_log_level = LogLevel::warning;
    std::ostream *m_output = &std::cerr;

    Logger() = default;
};

#define LOG_TRACE (Logger::get_instance().log(LogLevel::trace))
#define LOG_DEBUG (Logger::get_instance().log(LogLevel::debug))
#define LOG_INFO (Logger::get_instance().log(LogLevel::info))
#define LOG_WARNING (Logger::get_instance().log(LogLevel::warning))
#define LOG_ERROR (Logger::get_instance().log(LogLevel::error))

} // resprint
