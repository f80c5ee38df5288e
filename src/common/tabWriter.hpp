/**
 * @file
 * @brief Column-aligning buffered output
 *
 * Copyright: (C) 2024 CESNET, z.s.p.o.
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <common/common.hpp>

#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace resprint {

/**
 * @brief Buffered writer that aligns tab-separated cells into columns.
 *
 * Text written to stream() is kept in memory until flush(). A cell is text
 * terminated by a tab character. The cells of the same column in consecutive
 * lines form a column block and are padded to a common width, which is the
 * widest cell of the block plus padding, but at least the minimal width.
 * The last cell of a line is not terminated by a tab and it is never padded.
 *
 * The writer always flushes on destruction, so output written before an
 * exception is not lost.
 */
class TabWriter {
    DISABLE_COPY_AND_MOVE(TabWriter)

public:
    /**
     * @param output    Target stream (borrowed)
     * @param min_width Minimal width of a column including padding
     * @param tab_width Width of a tab character if tabs are used for padding
     * @param padding   Number of padding characters added to the widest cell
     * @param pad_char  Padding character
     */
    TabWriter(std::ostream &output, size_t min_width, size_t tab_width,
        size_t padding, char pad_char);

    ~TabWriter();

    /** @brief Stream to write the tab-separated text to */
    std::ostream &stream() { return m_buffer; }

    /**
     * @brief Format the buffered text and write it to the target stream
     * @throw WriteError if the target stream fails
     */
    void flush();

private:
    using Line = std::vector<std::string>;

    std::ostream &m_output;
    size_t m_min_width;
    size_t m_tab_width;
    size_t m_padding;
    char m_pad_char;

    std::ostringstream m_buffer;

    // Formatting state
    std::vector<Line> m_lines;
    std::vector<size_t> m_widths;
    bool m_last_newline;

    std::string format_buffer();
    void parse_lines(const std::string &text);
    void format_block(std::string &result, size_t line0, size_t line1);
    void write_lines(std::string &result, size_t line0, size_t line1);
    void write_padding(std::string &result, size_t text_width, size_t cell_width);
};

} // resprint
