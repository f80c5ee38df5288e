/**
 * @file
 * @brief YAML printer
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include <printer/printer.hpp>

namespace resprint {
namespace printer {

/**
 * @brief Printer of objects encoded as YAML documents.
 */
class YamlPrinter : public Printer {
public:
    YamlPrinter(const std::string &version);

    virtual
    ~YamlPrinter() = default;

    virtual void
    print_obj(const api::Object &obj, std::ostream &output) override;

    virtual bool
    is_versioned() const override { return true; }

private:
    std::string m_version;
};

/**
 * @brief Serialize a generic mapping as a YAML block document.
 *
 * The document is terminated by a newline.
 */
std::string
to_yaml(const nlohmann::json &value);

} // printer
} // resprint
