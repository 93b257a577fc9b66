#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace transtree {

struct DelimitedRow {
    std::vector<std::string> fields;
    // Offset of the first character of the next row; the row terminator is consumed.
    std::size_t pos_after_end = 0;
    // Line number of the next row, counting line breaks embedded in quoted fields.
    std::size_t next_line_number = 1;
};

// Reads one logical row starting at offset. Throws TextParseError on an unterminated quoted field.
DelimitedRow read_delimited_line(
    std::string_view content,
    std::size_t offset,
    std::size_t line_number,
    char separator,
    bool quoted_fields
);

}  // namespace transtree
