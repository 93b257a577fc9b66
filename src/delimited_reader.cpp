#include "delimited_reader.hpp"

#include "parse_error.hpp"

#include <string>
#include <utility>

namespace transtree {

DelimitedRow read_delimited_line(
    std::string_view content,
    std::size_t offset,
    std::size_t line_number,
    char separator,
    bool quoted_fields
) {
    DelimitedRow row;
    row.next_line_number = line_number;

    const std::size_t n = content.size();
    if (offset >= n) {
        row.pos_after_end = n;
        return row;
    }

    std::string cell;
    cell.reserve(64);
    std::size_t i = offset;
    std::size_t current_line = line_number;
    std::size_t quote_start = 0;
    std::size_t quote_line = line_number;
    std::size_t quote_column = 1;
    std::size_t line_start = offset;
    bool in_quotes = false;

    while (i < n) {
        const char ch = content[i];

        if (in_quotes) {
            if (ch == '"') {
                if (i + 1 < n && content[i + 1] == '"') {
                    cell.push_back('"');
                    i += 2;
                } else {
                    in_quotes = false;
                    ++i;
                }
                continue;
            }

            if (ch == '\r' && i + 1 < n && content[i + 1] == '\n') {
                // CRLF inside a quoted field is stored as LF
                ++i;
                continue;
            }
            if (ch == '\n' || ch == '\r') {
                ++current_line;
                line_start = i + 1;
            }
            cell.push_back(ch);
            ++i;
            continue;
        }

        if (quoted_fields && ch == '"') {
            in_quotes = true;
            quote_start = i;
            quote_line = current_line;
            quote_column = i - line_start + 1;
            ++i;
        } else if (ch == separator) {
            row.fields.push_back(std::move(cell));
            cell.clear();
            ++i;
        } else if (ch == '\r' || ch == '\n') {
            break;
        } else {
            cell.push_back(ch);
            ++i;
        }
    }

    if (in_quotes) {
        throw TextParseError(
            "Unclosed quote at " + std::to_string(quote_line) + ":" + std::to_string(quote_column),
            quote_start,
            i,
            quote_line,
            quote_column
        );
    }

    row.fields.push_back(std::move(cell));

    if (i < n) {
        if (content[i] == '\r') {
            ++i;
            if (i < n && content[i] == '\n') {
                ++i;
            }
        } else if (content[i] == '\n') {
            ++i;
        }
        ++current_line;
    }

    row.pos_after_end = i;
    row.next_line_number = current_line;
    return row;
}

}  // namespace transtree
