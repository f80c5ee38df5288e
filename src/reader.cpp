/**
 * @file
 * @brief Reader of resource documents
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <nlohmann/json.hpp>

#include <api/codec.hpp>
#include <common/error.hpp>
#include <common/logger.hpp>

#include <reader.hpp>

namespace resprint {

std::vector<std::unique_ptr<api::Object>>
read_objects(std::istream &input, const std::string &source)
{
    std::vector<std::unique_ptr<api::Object>> objects;
    nlohmann::json doc;

    try {
        doc = nlohmann::json::parse(input);
    } catch (const nlohmann::json::parse_error &ex) {
        throw DecodingError("{}: invalid JSON input, {}", source, ex.what());
    }

    if (!doc.is_array()) {
        try {
            objects.push_back(api::decode(doc));
        } catch (const DecodingError &ex) {
            throw DecodingError("{}: {}", source, ex.what());
        }
        return objects;
    }

    for (size_t i = 0; i < doc.size(); i++) {
        try {
            objects.push_back(api::decode(doc[i]));
        } catch (const DecodingError &ex) {
            throw DecodingError("{}: document #{}: {}", source, i + 1, ex.what());
        }
    }

    LOG_DEBUG << "Read " << objects.size() << " document(s) from " << source;
    return objects;
}

} // resprint
