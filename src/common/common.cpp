/**
 * @file
 * @brief Common utility functions
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <common/common.hpp>
#include <common/error.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <sys/stat.h>

namespace resprint {

std::vector<std::string>
string_split(
    const std::string &str,
    const std::string &delimiter,
    unsigned int max_pieces)
{
    std::vector<std::string> pieces;
    std::size_t pos = 0;

    for (;;) {
        if (max_pieces > 0 && pieces.size() == max_pieces - 1) {
            pieces.emplace_back(str.begin() + pos, str.end());
            break;
        }

        std::size_t next_pos = str.find(delimiter, pos);
        if (next_pos == std::string::npos) {
            pieces.emplace_back(str.begin() + pos, str.end());
            break;
        }
        pieces.emplace_back(str.begin() + pos, str.begin() + next_pos);
        pos = next_pos + delimiter.size();
    }
    return pieces;
}

std::string
string_join(const std::vector<std::string> &pieces, const std::string &delimiter)
{
    std::string result;

    for (size_t i = 0; i < pieces.size(); i++) {
        if (i > 0) {
            result.append(delimiter);
        }
        result.append(pieces[i]);
    }

    return result;
}

void
string_ltrim(std::string &str)
{
    auto is_space = [](char ch) {
        return std::isspace(int(static_cast<unsigned char>(ch)));
    };

    auto first_char = std::find_if_not(str.begin(), str.end(), is_space);
    str.erase(str.begin(), first_char);
}

void
string_rtrim(std::string &str)
{
    auto is_space = [](char ch) {
        return std::isspace(int(static_cast<unsigned char>(ch)));
    };

    auto last_char = std::find_if_not(str.rbegin(), str.rend(), is_space);
    str.erase(last_char.base(), str.end());
}

size_t
utf8_length(const std::string &str)
{
    size_t length = 0;

    for (unsigned char ch : str) {
        // Skip continuation bytes 10xxxxxx
        if ((ch & 0xC0) != 0x80) {
            length++;
        }
    }

    return length;
}

std::ifstream
open_file(const std::string &path)
{
    struct stat info;

    if (stat(path.c_str(), &info) != 0) {
        throw FileReadError("unable to open file {}, {}", path, std::strerror(errno));
    }
    if (!S_ISREG(info.st_mode)) {
        throw FileReadError("unable to open file {}, not a regular file", path);
    }

    std::ifstream file {path, std::ios::in | std::ios::binary};
    if (!file) {
        throw FileReadError("unable to open file {}, {}", path, std::strerror(errno));
    }

    return file;
}

std::string
read_file(const std::string &path)
{
    std::ifstream file = open_file(path);
    std::ostringstream content;

    if (file.peek() != std::ifstream::traits_type::eof()) {
        content << file.rdbuf();
        if (content.fail()) {
            throw FileReadError("unable to read file {}", path);
        }
    }
    if (file.bad()) {
        throw FileReadError("unable to read file {}", path);
    }

    return content.str();
}

} // resprint
