#include "table_parser.hpp"

#include "parse_error.hpp"
#include "text_utils.hpp"

#include <unordered_set>

namespace transtree {
namespace {

TextParseError row_error(const std::string& message, const TableRow& row) {
    return TextParseError(message, row.start_offset, row.end_offset, row.line_number, 1);
}

}  // namespace

TableData TableParser::read_table(const std::string& content) const {
    TableData table;
    std::unordered_set<std::string> seen_keys;
    bool header_read = false;

    std::size_t offset = 0;
    std::size_t line_number = 1;

    while (offset < content.size()) {
        const char ch = content[offset];
        if (ch == '\r' || ch == '\n') {
            // blank line
            offset += ch == '\r' && offset + 1 < content.size() && content[offset + 1] == '\n' ? 2 : 1;
            ++line_number;
            continue;
        }

        DelimitedRow cells = read_cells(content, offset, line_number);

        TableRow row;
        row.line_number = line_number;
        row.start_offset = offset;
        row.end_offset = cells.pos_after_end;

        offset = cells.pos_after_end;
        line_number = cells.next_line_number;

        if (!header_read) {
            header_read = true;
            const bool many_columns = cells.fields.size() > 2;
            for (std::size_t i = 0; i < cells.fields.size(); ++i) {
                std::string caption = trim(cells.fields[i]);
                if (i > 0 && many_columns && caption.empty()) {
                    throw row_error(
                        "Multiple columns are provided, but the locale name is empty for at least one column. "
                        "Locale names must be listed as column captions on the first non-empty text line.",
                        row
                    );
                }
                if (i > 0 && !table.description_column && iequals(caption, settings().description_column_caption)) {
                    table.description_column = i;
                }
                table.captions.push_back(std::move(caption));
            }
            continue;
        }

        const std::string line_text = std::to_string(row.line_number);

        std::string key = trim(cells.fields.front());
        if (key.empty()) {
            throw row_error("Empty key detected on line " + line_text, row);
        }
        if (!seen_keys.insert(to_lower_ascii(key)).second) {
            throw row_error("A duplicate key " + key + " detected on line " + line_text, row);
        }

        if (cells.fields.size() < table.captions.size()) {
            throw row_error(
                "Insufficient number of columns detected on line " + line_text + " (" +
                    std::to_string(table.captions.size()) + " columns expected, " +
                    std::to_string(cells.fields.size()) + " columns found)",
                row
            );
        }

        row.cells.reserve(table.captions.size());
        row.cells.push_back(std::move(key));
        // cells beyond the captioned columns are ignored
        for (std::size_t i = 1; i < table.captions.size(); ++i) {
            row.cells.push_back(trim(cells.fields[i]));
        }
        table.rows.push_back(std::move(row));
    }

    return table;
}

std::optional<std::size_t> TableParser::find_locale_column(const TableData& table, const std::string& locale) {
    auto is_value_column = [&](std::size_t i) {
        return i > 0 && (!table.description_column || *table.description_column != i);
    };

    if (locale.empty()) {
        for (std::size_t i = 1; i < table.captions.size(); ++i) {
            if (is_value_column(i)) {
                return i;
            }
        }
        return std::nullopt;
    }

    for (std::size_t i = 1; i < table.captions.size(); ++i) {
        if (is_value_column(i) && iequals(table.captions[i], locale)) {
            return i;
        }
    }

    if (locale.size() > 2 && locale[2] == '-') {
        const std::string language = locale.substr(0, 2);
        for (std::size_t i = 1; i < table.captions.size(); ++i) {
            if (is_value_column(i) && iequals(table.captions[i], language)) {
                return i;
            }
        }
    }

    return std::nullopt;
}

std::optional<Translation> TableParser::load_translation(const std::string& content, const std::string& locale) const {
    if (content.empty()) {
        return std::nullopt;
    }

    const TableData table = read_table(content);
    if (table.captions.size() < 2) {
        return std::nullopt;
    }

    const auto column = find_locale_column(table, locale);
    if (!column) {
        return std::nullopt;
    }

    Translation translation(table.captions[*column]);

    for (const auto& row : table.rows) {
        const std::string& value = row.cells[*column];
        if (value.empty() && settings().treat_empty_values_as_absent) {
            continue;
        }

        TranslationEntry entry = is_reference(value)
            ? TranslationEntry::reference_to(trim(value.substr(1)))
            : make_literal_entry(value);

        if (table.description_column) {
            entry.description = row.cells[*table.description_column];
        }

        translation.add(row.cells.front(), std::move(entry));
    }

    return translation;
}

TranslationTree TableParser::load_structure(const std::string& content) const {
    TranslationTree tree;
    if (content.empty()) {
        return tree;
    }

    const TableData table = read_table(content);
    const auto column = find_locale_column(table, std::string());

    for (const auto& row : table.rows) {
        bool templated = false;
        if (column) {
            const std::string& value = row.cells[*column];
            templated = !is_reference(value) && is_templated_text(value);
        }
        tree.add_entry(row.cells.front(), templated);
    }

    return tree;
}

TranslationConfiguration TableParser::parse_configuration(const std::string& content) const {
    return parse_ini_configuration(content);
}

bool CsvParser::can_handle_extension(std::string_view extension) const {
    return iequals(extension, ".csv");
}

DelimitedRow CsvParser::read_cells(const std::string& content, std::size_t offset, std::size_t line_number) const {
    return read_delimited_line(content, offset, line_number, settings().csv_separator, true);
}

bool TsvParser::can_handle_extension(std::string_view extension) const {
    return iequals(extension, ".tsv");
}

DelimitedRow TsvParser::read_cells(const std::string& content, std::size_t offset, std::size_t line_number) const {
    return read_delimited_line(content, offset, line_number, '\t', settings().tsv_expect_quotes);
}

}  // namespace transtree
