/**
 * @file
 * @brief Versioned encoding of resource objects
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <api/types.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace resprint {
namespace api {

/**
 * @brief Interface of a codec converting objects to documents of one API version.
 */
class Codec {
public:
    virtual
    ~Codec() = default;

    /** @brief API version of produced documents */
    virtual const std::string &
    version() const = 0;

    /**
     * @brief Encode an object as a JSON document.
     *
     * The document always contains "kind" and "apiVersion" fields.
     * @throw EncodingError if the object kind has no representation
     */
    virtual std::string
    encode(const Object &obj) const = 0;

    /**
     * @brief Decode a document of this API version.
     * @throw DecodingError if the document is malformed or of an unknown kind
     */
    virtual std::unique_ptr<Object>
    decode(const nlohmann::json &doc) const = 0;
};

/**
 * @brief Get the codec of an API version.
 * @throw EncodingError if the version is not supported
 */
const Codec &
codec_for(const std::string &version);

/** @brief Get all supported API versions, oldest first */
std::vector<std::string>
supported_versions();

/**
 * @brief Decode a document using the codec named by its "apiVersion" field.
 * @throw DecodingError if the document cannot be decoded
 */
std::unique_ptr<Object>
decode(const nlohmann::json &doc);

/**
 * @brief Parse and decode a document.
 * @throw DecodingError if the text is not a JSON object or cannot be decoded
 */
std::unique_ptr<Object>
decode_text(const std::string &data);

} // api
} // resprint
