/**
 * @file
 * @brief Resource printer interface and factory
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <api/types.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <ostream>
#include <string>

namespace resprint {
namespace printer {

/**
 * @brief Interface of a printer that knows how to print resource objects.
 */
class Printer {
public:
    virtual
    ~Printer() {};

    /**
     * @brief Format an arbitrary object and print it to the stream.
     *
     * @param obj    Object to print
     * @param output Output stream, it is not retained after the call
     * @throw Error on failure (see error.hpp for kinds)
     */
    virtual void
    print_obj(const api::Object &obj, std::ostream &output) = 0;

    /**
     * @brief Whether the printer emits properly versioned output.
     */
    virtual bool
    is_versioned() const = 0;
};

/**
 * @brief Create a printer of the given output format.
 *
 * Format "json", "yaml", "template" (@p template_source is the template text)
 * and "templatefile" (@p template_source is a path to the template) are
 * supported. An empty format selects the @p fallback printer.
 *
 * @param version         API version of versioned output
 * @param format          Output format
 * @param template_source Template text or path
 * @param fallback        Printer returned for an empty format
 * @throw UnsupportedFormat, MissingTemplateInput, FileReadError, TemplateParseError
 */
std::shared_ptr<Printer>
printer_factory(
    const std::string &version,
    const std::string &format,
    const std::string &template_source,
    std::shared_ptr<Printer> fallback);

/**
 * @brief Encode an object at the API version and convert it to a generic mapping.
 * @throw EncodingError
 */
nlohmann::json
to_versioned_map(const std::string &version, const api::Object &obj);

} // printer
} // resprint
