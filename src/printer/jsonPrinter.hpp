/**
 * @file
 * @brief JSON printer
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <string>

#include <printer/printer.hpp>

namespace resprint {
namespace printer {

/**
 * @brief Printer of objects encoded as indented JSON documents.
 */
class JsonPrinter : public Printer {
public:
    JsonPrinter(const std::string &version);

    virtual
    ~JsonPrinter() = default;

    virtual void
    print_obj(const api::Object &obj, std::ostream &output) override;

    virtual bool
    is_versioned() const override { return true; }

private:
    std::string m_version;
};

} // printer
} // resprint
