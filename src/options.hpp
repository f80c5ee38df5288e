/**
 * @file
 * @brief Command line options
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <string>
#include <vector>
#include <stdexcept>

#include <common/logger.hpp>

namespace resprint {

class OptionsException : public std::invalid_argument {
public:
    OptionsException(const std::string &what_arg)
        : std::invalid_argument(what_arg)
        {};

    OptionsException(const char *what_arg)
        : std::invalid_argument(what_arg)
        {};
};

/**
 * @brief Command line arguments.
 *
 * Parse and validate user-specified command line arguments.
 */
class Options {
public:
    /**
     * @brief Print the usage message
     */
    static void print_usage();

    /**
     * @brief Create options with default values.
     */
    Options();
    /**
     * @brief Create options and parse command line arguments.
     * @param[in] argc Number of arguments
     * @param[in] argv Array of arguments
     * @throw OptionsException if the arguments are invalid
     */
    Options(int argc, char *argv[]);
    ~Options() = default;

    /**
     * @brief Reset all values to default.
     */
    void reset();

    bool get_help_flag() const { return m_help_flag; };

    /** @brief Get output format (empty = table) */
    const std::string &get_output_format() const { return m_output_format; };
    /** @brief Get template text or path to the template file */
    const std::string &get_template() const { return m_template; };
    /** @brief Get API version of versioned output */
    const std::string &get_api_version() const { return m_api_version; };
    /** @brief Whether to suppress table headers */
    bool get_no_headers() const { return m_no_headers; };

    /** @brief Get list of input files ("-" = standard input) */
    const std::vector<std::string> &get_input_files() const { return m_input_files; };

    /** @brief Get the logging level */
    LogLevel get_log_level() const { return m_log_level; }

private:
    bool m_help_flag;

    std::string m_output_format;
    std::string m_template;
    std::string m_api_version;
    bool m_no_headers;

    std::vector<std::string> m_input_files;

    LogLevel m_log_level;

    void parse(int argc, char *argv[]);
    void validate();
};

} // resprint
