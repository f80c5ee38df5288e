/**
 * @file
 * @brief resprint main entrypoint
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>

#include <common/common.hpp>
#include <common/error.hpp>
#include <common/logger.hpp>
#include <printer/humanReadablePrinter.hpp>
#include <printer/printer.hpp>

#include <options.hpp>
#include <reader.hpp>

using namespace resprint;

static void
print_input(printer::Printer &printer, std::istream &input, const std::string &source)
{
    const auto objects = read_objects(input, source);

    LOG_INFO << "Printing " << objects.size() << " object(s) of " << source;
    for (const auto &obj : objects) {
        printer.print_obj(*obj, std::cout);
    }
}

int
main(int argc, char *argv[])
{
    try {
        Options options {argc, argv};

        Logger::get_instance().set_log_level(options.get_log_level());

        if (options.get_help_flag()) {
            Options::print_usage();
            return EXIT_SUCCESS;
        }

        auto fallback = std::make_shared<printer::HumanReadablePrinter>(options.get_no_headers());
        auto printer = printer::printer_factory(
            options.get_api_version(),
            options.get_output_format(),
            options.get_template(),
            fallback);

        for (const auto &file : options.get_input_files()) {
            if (file == "-") {
                print_input(*printer, std::cin, "<stdin>");
                continue;
            }

            std::ifstream input = open_file(file);
            print_input(*printer, input, file);
        }

        std::cout.flush();

    } catch (const OptionsException &ex) {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        Options::print_usage();
        return EXIT_FAILURE;

    } catch (const std::exception &ex) {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
