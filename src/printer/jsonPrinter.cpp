/**
 * @file
 * @brief JSON printer
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <string>

#include <nlohmann/json.hpp>

#include <api/codec.hpp>
#include <common/error.hpp>

#include <printer/jsonPrinter.hpp>

namespace resprint {
namespace printer {

static constexpr int JSON_INDENT = 4;

JsonPrinter::JsonPrinter(const std::string &version)
    : m_version(version)
{
}

void
JsonPrinter::print_obj(const api::Object &obj, std::ostream &output)
{
    const std::string data = api::codec_for(m_version).encode(obj);

    // Re-indent the document, the field order is kept
    nlohmann::ordered_json doc = nlohmann::ordered_json::parse(data, nullptr, false);
    if (doc.is_discarded()) {
        throw EncodingError("encoder of version \"{}\" produced an invalid document", m_version);
    }

    std::string buffer = doc.dump(JSON_INDENT);
    buffer.push_back('\n');

    output.write(buffer.data(), buffer.size());
    if (!output) {
        throw WriteError("failed to write JSON output");
    }
}

} // printer
} // resprint
