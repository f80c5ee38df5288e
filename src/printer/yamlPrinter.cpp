/**
 * @file
 * @brief YAML printer
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <cstdlib>
#include <string>

#include <strings.h>

#include <yaml-cpp/yaml.h>

#include <common/error.hpp>

#include <printer/yamlPrinter.hpp>

namespace resprint {
namespace printer {

/**
 * @brief Check whether a plain scalar would be read back as another type
 */
static bool
is_ambiguous_string(const std::string &str)
{
    static const char *keywords[] = {
        "true", "false", "yes", "no", "on", "off", "null", "~", "y", "n"
    };

    if (str.empty()) {
        return true;
    }

    for (const char *keyword : keywords) {
        if (strcasecmp(str.c_str(), keyword) == 0) {
            return true;
        }
    }

    char *end;
    std::strtod(str.c_str(), &end);
    return *end == '\0';
}

static void
emit_value(YAML::Emitter &out, const nlohmann::json &value)
{
    switch (value.type()) {
    case nlohmann::json::value_t::null:
        out << YAML::Null;
        break;
    case nlohmann::json::value_t::boolean:
        out << value.get<bool>();
        break;
    case nlohmann::json::value_t::number_integer:
        out << value.get<int64_t>();
        break;
    case nlohmann::json::value_t::number_unsigned:
        out << value.get<uint64_t>();
        break;
    case nlohmann::json::value_t::number_float:
        out << value.get<double>();
        break;
    case nlohmann::json::value_t::string: {
        const std::string &str = value.get_ref<const std::string &>();
        if (is_ambiguous_string(str)) {
            out << YAML::DoubleQuoted;
        }
        out << str;
        break;
    }
    case nlohmann::json::value_t::array:
        out << YAML::BeginSeq;
        for (const auto &item : value) {
            emit_value(out, item);
        }
        out << YAML::EndSeq;
        break;
    case nlohmann::json::value_t::object:
        out << YAML::BeginMap;
        for (const auto &item : value.items()) {
            out << YAML::Key << item.key() << YAML::Value;
            emit_value(out, item.value());
        }
        out << YAML::EndMap;
        break;
    default:
        throw EncodingError("value of type {} cannot be represented in YAML", value.type_name());
    }
}

std::string
to_yaml(const nlohmann::json &value)
{
    YAML::Emitter out;

    emit_value(out, value);
    if (!out.good()) {
        throw EncodingError("failed to serialize YAML: {}", out.GetLastError());
    }

    std::string result = out.c_str();
    result.push_back('\n');
    return result;
}

YamlPrinter::YamlPrinter(const std::string &version)
    : m_version(version)
{
}

void
YamlPrinter::print_obj(const api::Object &obj, std::ostream &output)
{
    const std::string buffer = to_yaml(to_versioned_map(m_version, obj));

    output.write(buffer.data(), buffer.size());
    if (!output) {
        throw WriteError("failed to write YAML output");
    }
}

} // printer
} // resprint
