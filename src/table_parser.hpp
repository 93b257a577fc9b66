#pragma once

#include "delimited_reader.hpp"
#include "translation_parser.hpp"

#include <optional>
#include <string>
#include <vector>

namespace transtree {

struct TableRow {
    std::vector<std::string> cells;
    std::size_t line_number = 1;
    std::size_t start_offset = 0;
    std::size_t end_offset = 0;
};

// A delimited table: the first non-empty row holds column captions, column 0 holds keys.
struct TableData {
    std::vector<std::string> captions;
    std::vector<TableRow> rows;
    std::optional<std::size_t> description_column;
};

// Base of the CSV and TSV formats. Locale captions name the value columns.
class TableParser : public TranslationParser {
public:
    using TranslationParser::TranslationParser;

    std::optional<Translation> load_translation(const std::string& content, const std::string& locale) const override;
    TranslationTree load_structure(const std::string& content) const override;

    // Table formats keep their configuration in INI files.
    TranslationConfiguration parse_configuration(const std::string& content) const override;

    // Throws TextParseError for empty or duplicate keys, missing cells and unnamed columns.
    TableData read_table(const std::string& content) const;

    // Column holding the texts of the locale: exact caption match first, then the
    // language part of a "ll-RR" locale. An empty locale picks the first value column.
    static std::optional<std::size_t> find_locale_column(const TableData& table, const std::string& locale);

protected:
    TextFormat default_text_format() const override { return TextFormat::None; }

    virtual DelimitedRow read_cells(const std::string& content, std::size_t offset, std::size_t line_number) const = 0;
};

class CsvParser final : public TableParser {
public:
    using TableParser::TableParser;

    bool can_handle_extension(std::string_view extension) const override;

protected:
    DelimitedRow read_cells(const std::string& content, std::size_t offset, std::size_t line_number) const override;
};

class TsvParser final : public TableParser {
public:
    using TableParser::TableParser;

    bool can_handle_extension(std::string_view extension) const override;

protected:
    DelimitedRow read_cells(const std::string& content, std::size_t offset, std::size_t line_number) const override;
};

}  // namespace transtree
