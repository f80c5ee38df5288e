/**
 * @file
 * @brief Argument parser component
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace resprint {

class Args {
    friend class ArgParser;

public:
    /**
     * @brief Check if a short option exists.
     *
     * @param short_opt The short option character to check.
     * @return true if the short option exists, false otherwise.
     */
    bool has(char short_opt) const;

    /**
     * @brief Check if a long option exists.
     *
     * @param long_opt The long option string to check.
     * @return true if the long option exists, false otherwise.
     */
    bool has(const std::string &long_opt) const;

    /**
     * @brief Count the occurrences of a short option.
     *
     * @param short_opt The short option character to count.
     * @return The count of occurrences of the short option.
     */
    size_t count(char short_opt) const;

    /**
     * @brief Get the value of a short option.
     *
     * If the option is given more than once, the last value wins.
     * @param short_opt The short option character.
     * @return The value associated with the short option.
     */
    std::string get(char short_opt) const;

    /**
     * @brief Get the value of a long option.
     *
     * @param long_opt The long option string.
     * @return The value associated with the long option.
     */
    std::string get(const std::string &long_opt) const;

    /** @brief Get all positional arguments in the order of appearance. */
    const std::vector<std::string> &positional() const { return m_pos_args; }

private:
    struct NamedArg {
        char short_opt;
        std::string long_opt;
        std::string value;
    };

    std::vector<NamedArg> m_named_args;
    std::vector<std::string> m_pos_args;
};

class ArgParser {
public:
    struct UnknownArgument {
        std::string arg;
    };

    struct MissingArgument {
        std::string arg;
    };

    /**
     * @brief Add a new option.
     *
     * @param short_opt The short option character (0 = long option only).
     * @param long_opt The long option string (empty = short option only).
     * @param value_name Name of the value shown in the usage (empty = the option has no value).
     * @param help Description of the option shown in the usage.
     */
    void add(char short_opt, const std::string &long_opt,
        const std::string &value_name, const std::string &help);

    /**
     * @brief Parse the command-line arguments.
     *
     * @param argc The number of command-line arguments.
     * @param argv The array of command-line argument strings.
     * @return Args object containing parsed arguments.
     * @throw UnknownArgument, MissingArgument
     */
    Args parse(int argc, char **argv) const;

    /**
     * @brief Print a description of all options, one option per line.
     */
    void print_options(std::ostream &out) const;

private:
    struct ArgDef {
        char short_opt;
        std::string long_opt;
        std::string value_name;
        std::string help;

        bool requires_value() const { return !value_name.empty(); }
    };

    std::vector<ArgDef> m_defs;
};

} // resprint
