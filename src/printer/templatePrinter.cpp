/**
 * @file
 * @brief Template printer
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <common/logger.hpp>

#include <printer/templatePrinter.hpp>

namespace resprint {
namespace printer {

TemplatePrinter::TemplatePrinter(const std::string &version, const std::string &text)
    : m_version(version), m_template("output", text)
{
}

void
TemplatePrinter::print_obj(const api::Object &obj, std::ostream &output)
{
    const nlohmann::json data = to_versioned_map(m_version, obj);

    LOG_TRACE << "Applying template to " << obj.kind();
    m_template.execute(output, data);
}

} // printer
} // resprint
