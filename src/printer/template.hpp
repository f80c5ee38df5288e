/**
 * @file
 * @brief Text templates evaluated over generic documents
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <memory>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace resprint {
namespace printer {

/**
 * @brief Parsed text template.
 *
 * Text outside of actions is copied to the output. Actions are delimited by
 * "{{" and "}}" and contain a pipeline or a control structure:
 *
 * - `{{.a.b}}`, `{{$}}`, `{{$var.a}}` print a value of the document,
 * - `{{cmd1 | cmd2 arg}}` passes the result of a command as the last argument
 *   of the next one,
 * - `{{$x := pipeline}}` declares a variable,
 * - `{{if P}}..{{else if P}}..{{else}}..{{end}}`,
 *   `{{range [$i, $e :=] P}}..{{else}}..{{end}}`,
 *   `{{with P}}..{{else}}..{{end}}`,
 * - `{{/* comment *\/}}`,
 * - "{{- " and " -}}" trim white space around the action.
 *
 * Functions: and, or, not, len, index, eq, ne, lt, le, gt, ge, print,
 * printf, println.
 *
 * Accessing a missing key of a map is an execution error.
 */
class Template {
public:
    struct Tree;

    /**
     * @brief Parse a template.
     *
     * @param name Name of the template used in error messages
     * @param text Template text
     * @throw TemplateParseError if the template is malformed
     */
    Template(const std::string &name, const std::string &text);

    ~Template();

    Template(Template &&other) noexcept;
    Template &operator=(Template &&other) noexcept;

    /** @brief Name of the template */
    const std::string &name() const { return m_name; }

    /**
     * @brief Apply the template to a document and write the result.
     *
     * Output produced before a failure is kept in the stream.
     * @throw TemplateExecError if the template cannot be applied to the document
     * @throw WriteError if the output stream fails
     */
    void
    execute(std::ostream &output, const nlohmann::json &data) const;

private:
    std::string m_name;
    std::unique_ptr<Tree> m_tree;
};

} // printer
} // resprint
