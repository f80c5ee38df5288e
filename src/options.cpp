/**
 * @file
 * @brief Command line options
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <iostream>

#include <api/codec.hpp>
#include <common/argParser.hpp>
#include <common/common.hpp>
#include <options.hpp>

namespace resprint {

static ArgParser
make_parser()
{
    ArgParser parser;
    parser.add('h', "help", "", "Show this help message");
    parser.add('o', "output", "FORMAT", "Output format - json, yaml, template, templatefile (default = table)");
    parser.add('t', "template", "TEMPLATE", "Template text or path to the template file");
    parser.add('a', "api-version", "VERSION", "API version of versioned output (default = v1beta1)");
    parser.add('H', "no-headers", "", "Do not print table headers");
    parser.add('v', "verbose", "", "Increase logging verbosity");
    parser.add('q', "quiet", "", "Decrease logging verbosity");
    return parser;
}

void Options::print_usage()
{
    std::cerr << "Usage: resprint [OPTIONS] [FILE...]\n";
    std::cerr << "\n";
    std::cerr << "Print resource documents read from files (default = standard input).\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    make_parser().print_options(std::cerr);
}

Options::Options()
{
    reset();
}

Options::Options(int argc, char *argv[])
{
    reset();
    parse(argc, argv);
    validate();
}

void Options::reset()
{
    m_help_flag = false;

    m_output_format.clear();
    m_template.clear();
    m_api_version = "v1beta1";
    m_no_headers = false;

    m_input_files.clear();

    m_log_level = LogLevel::warning;
}

/**
 * @brief Parse command line arguments.
 *
 * Previously specified values are not reset. Previous values might be
 * redefined or extended (e.g. files to process).
 * @param[in] argc Number of arguments
 * @param[in] argv Array of arguments
 */
void Options::parse(int argc, char *argv[])
{
    const ArgParser parser = make_parser();

    Args args;
    try {
        args = parser.parse(argc, argv);
    } catch (const ArgParser::MissingArgument& missing) {
        throw OptionsException("Missing argument for " + missing.arg);
    } catch (const ArgParser::UnknownArgument& unknown) {
        throw OptionsException("Unknown argument " + unknown.arg);
    }

    if (args.has('h')) {
        m_help_flag = true;
    }

    if (args.has('o')) {
        m_output_format = args.get('o');
    }

    if (args.has('t')) {
        m_template = args.get('t');
    }

    if (args.has('a')) {
        m_api_version = args.get('a');
    }

    if (args.has('H')) {
        m_no_headers = true;
    }

    for (const auto &file : args.positional()) {
        m_input_files.push_back(file);
    }

    for (size_t i = 0; i < args.count('v'); i++) {
        m_log_level++;
    }

    for (size_t i = 0; i < args.count('q'); i++) {
        m_log_level--;
    }
}

void Options::validate()
{
    if (m_api_version.empty()) {
        throw OptionsException("invalid -a/--api-version value - empty version");
    }

    bool known = false;
    for (const auto &version : api::supported_versions()) {
        known = known || (version == m_api_version);
    }
    if (!known) {
        throw OptionsException("unsupported API version \"" + m_api_version
            + "\", supported: " + string_join(api::supported_versions(), ", "));
    }

    if (m_input_files.empty()) {
        m_input_files.push_back("-");
    }
}

} // resprint
