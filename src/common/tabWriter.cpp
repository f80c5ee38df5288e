/**
 * @file
 * @brief Column-aligning buffered output
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <common/error.hpp>
#include <common/tabWriter.hpp>

#include <algorithm>

namespace resprint {

TabWriter::TabWriter(std::ostream &output, size_t min_width, size_t tab_width,
    size_t padding, char pad_char)
    : m_output(output),
      m_min_width(min_width),
      m_tab_width(tab_width),
      m_padding(padding),
      m_pad_char(pad_char),
      m_last_newline(false)
{
}

TabWriter::~TabWriter()
{
    // Errors of the target stream are reported by an explicit flush() only
    const std::string text = format_buffer();
    if (!text.empty()) {
        m_output.write(text.data(), text.size());
    }
}

void
TabWriter::flush()
{
    const std::string text = format_buffer();

    if (!text.empty()) {
        m_output.write(text.data(), text.size());
    }
    m_output.flush();

    if (!m_output) {
        throw WriteError("failed to write {} bytes of output", text.size());
    }
}

std::string
TabWriter::format_buffer()
{
    std::string text = m_buffer.str();
    std::string result;

    m_buffer.str("");
    m_buffer.clear();

    if (text.empty()) {
        return result;
    }

    parse_lines(text);
    result.reserve(text.size() * 2);
    format_block(result, 0, m_lines.size());

    m_lines.clear();
    m_widths.clear();
    return result;
}

void
TabWriter::parse_lines(const std::string &text)
{
    std::vector<std::string> lines = string_split(text, "\n");

    m_last_newline = (text.back() == '\n');
    if (m_last_newline) {
        // The text after the last newline is empty
        lines.pop_back();
    }

    m_lines.clear();
    m_lines.reserve(lines.size());
    for (const auto &line : lines) {
        m_lines.push_back(string_split(line, "\t"));
    }
}

void
TabWriter::format_block(std::string &result, size_t line0, size_t line1)
{
    const size_t column = m_widths.size();

    for (size_t cur = line0; cur < line1; cur++) {
        if (column + 1 >= m_lines[cur].size()) {
            // The line has no cell in this column
            continue;
        }

        // The line starts a new column block, print the preceding lines
        write_lines(result, line0, cur);
        line0 = cur;

        size_t width = m_min_width;
        for (; cur < line1; cur++) {
            const Line &line = m_lines[cur];

            if (column + 1 >= line.size()) {
                break;
            }
            width = std::max(width, utf8_length(line[column]) + m_padding);
        }

        m_widths.push_back(width);
        format_block(result, line0, cur);
        m_widths.pop_back();
        line0 = cur;
    }

    write_lines(result, line0, line1);
}

void
TabWriter::write_lines(std::string &result, size_t line0, size_t line1)
{
    for (size_t i = line0; i < line1; i++) {
        const Line &line = m_lines[i];

        for (size_t j = 0; j < line.size(); j++) {
            const std::string &cell = line[j];

            result.append(cell);
            if (j < m_widths.size()) {
                write_padding(result, utf8_length(cell), m_widths[j]);
            }
        }

        if (i + 1 < m_lines.size() || m_last_newline) {
            result.push_back('\n');
        }
    }
}

void
TabWriter::write_padding(std::string &result, size_t text_width, size_t cell_width)
{
    if (m_pad_char == '\t') {
        if (m_tab_width == 0) {
            return;
        }

        // Make cell width a multiple of the tab width
        cell_width = (cell_width + m_tab_width - 1) / m_tab_width * m_tab_width;
        const size_t missing = cell_width - text_width;
        result.append((missing + m_tab_width - 1) / m_tab_width, '\t');
        return;
    }

    result.append(cell_width - text_width, m_pad_char);
}

} // resprint
