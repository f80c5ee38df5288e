/**
 * @file
 * @brief Resource printer factory
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <functional>
#include <vector>

#include <api/codec.hpp>
#include <common/common.hpp>
#include <common/error.hpp>
#include <common/logger.hpp>

#include <printer/printer.hpp>
#include <printer/jsonPrinter.hpp>
#include <printer/templatePrinter.hpp>
#include <printer/yamlPrinter.hpp>

namespace resprint {
namespace printer {

struct PrinterFactory {
    const char *name;
    std::function<Printer *(const std::string &, const std::string &)> create_fn;
};

static Printer *
create_template_printer(const std::string &version, const std::string &text)
{
    if (text.empty()) {
        throw MissingTemplateInput("template format specified but no template given");
    }

    try {
        return new TemplatePrinter(version, text);
    } catch (const TemplateParseError &ex) {
        throw TemplateParseError("error parsing template {}, {}", text, ex.what());
    }
}

static Printer *
create_template_file_printer(const std::string &version, const std::string &path)
{
    if (path.empty()) {
        throw MissingTemplateInput("templatefile format specified but no template file given");
    }

    std::string text;
    try {
        text = read_file(path);
    } catch (const FileReadError &ex) {
        throw FileReadError("error reading template, {}", ex.what());
    }

    try {
        return new TemplatePrinter(version, text);
    } catch (const TemplateParseError &ex) {
        throw TemplateParseError("error parsing template {}, {}", path, ex.what());
    }
}

static const std::vector<struct PrinterFactory> g_printers {
    {"json", [](const std::string &version, const std::string &) {
        return new JsonPrinter(version); }
    },
    {"yaml", [](const std::string &version, const std::string &) {
        return new YamlPrinter(version); }
    },
    {"template", create_template_printer},
    {"templatefile", create_template_file_printer},
};

std::shared_ptr<Printer>
printer_factory(
    const std::string &version,
    const std::string &format,
    const std::string &template_source,
    std::shared_ptr<Printer> fallback)
{
    if (format.empty()) {
        return fallback;
    }

    for (const auto &it : g_printers) {
        if (format != it.name) {
            continue;
        }

        LOG_DEBUG << "Using '" << it.name << "' output of API version " << version;
        return std::shared_ptr<Printer>(it.create_fn(version, template_source));
    }

    throw UnsupportedFormat("output format \"{}\" not recognized", format);
}

nlohmann::json
to_versioned_map(const std::string &version, const api::Object &obj)
{
    const std::string data = api::codec_for(version).encode(obj);
    nlohmann::json doc = nlohmann::json::parse(data, nullptr, false);

    if (doc.is_discarded() || !doc.is_object()) {
        throw EncodingError("encoder of version \"{}\" produced an invalid document", version);
    }

    return doc;
}

} // printer
} // resprint
