/**
 * @file
 * @brief Reader of resource documents
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <istream>
#include <memory>
#include <string>
#include <vector>

#include <api/types.hpp>

namespace resprint {

/**
 * @brief Read and decode resource documents.
 *
 * The input contains either one JSON document or a JSON array of documents.
 * Every document is decoded by the codec of its "apiVersion".
 *
 * @param input  Input stream
 * @param source Name of the input used in error messages
 * @throw DecodingError if the input is not valid JSON or a document cannot be decoded
 */
std::vector<std::unique_ptr<api::Object>>
read_objects(std::istream &input, const std::string &source);

} // resprint
