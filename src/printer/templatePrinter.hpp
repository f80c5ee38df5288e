/**
 * @file
 * @brief Template printer
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <string>

#include <printer/printer.hpp>
#include <printer/template.hpp>

namespace resprint {
namespace printer {

/**
 * @brief Printer that applies a text template to the versioned form of an object.
 */
class TemplatePrinter : public Printer {
public:
    /**
     * @param version API version the object is converted to before the template is applied
     * @param text    Template text
     * @throw TemplateParseError if the template is malformed
     */
    TemplatePrinter(const std::string &version, const std::string &text);

    virtual
    ~TemplatePrinter() = default;

    virtual void
    print_obj(const api::Object &obj, std::ostream &output) override;

    virtual bool
    is_versioned() const override { return true; }

private:
    std::string m_version;
    Template m_template;
};

} // printer
} // resprint
