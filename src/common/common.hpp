/**
 * @file
 * @brief General utility functions
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <tl/optional.hpp>

#include <fstream>
#include <string>
#include <vector>

namespace resprint {

#define DISABLE_COPY_AND_MOVE(CLASSNAME) \
    CLASSNAME ( CLASSNAME &) = delete; \
    CLASSNAME (const CLASSNAME &&) = delete; \
    CLASSNAME &operator=( CLASSNAME &) = delete; \
    CLASSNAME &operator=(const CLASSNAME &&) = delete;

template <typename T>
using Optional = tl::optional<T>;

/**
 * @brief Split string using a user-defined delimeter.
 *
 * If no delimeter is found, the result contains only the original string.
 * @param str String to be splitted
 * @param delimiter String delimeter
 * @param max_pieces The maximum number of pieces (0 = no limit)
 * @return Vector of piecies.
 */
std::vector<std::string>
string_split(
    const std::string &str,
    const std::string &delimiter,
    unsigned int max_pieces = 0);

/**
 * @brief Join strings using a delimiter.
 */
std::string
string_join(const std::vector<std::string> &pieces, const std::string &delimiter);

void
string_ltrim(std::string &str);

void
string_rtrim(std::string &str);

/**
 * @brief Get the number of UTF-8 code points of a string
 *
 * Continuation bytes are not counted, invalid sequences are counted per byte.
 */
size_t
utf8_length(const std::string &str);

/**
 * @brief Open a regular file for reading.
 *
 * @param path Path to the file
 * @throw FileReadError if the path is not a regular file or cannot be opened
 */
std::ifstream
open_file(const std::string &path);

/**
 * @brief Read the whole content of a regular file.
 *
 * @param path Path to the file
 * @throw FileReadError naming the path if the file cannot be opened or read
 */
std::string
read_file(const std::string &path);

} // resprint
