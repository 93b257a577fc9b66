#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace transtree {

std::string trim(std::string_view s);
std::string to_lower_ascii(std::string s);
bool iequals(std::string_view a, std::string_view b) noexcept;

// Resolves backslash escapes (\n, \t, \", \\, \uXXXX ...). Unknown escapes are kept as written.
std::string unescape_string(std::string_view value);

struct TextPosition {
    std::size_t line = 1;
    std::size_t column = 1;
};

TextPosition position_at(std::string_view text, std::size_t offset) noexcept;

bool is_identifier(std::string_view s) noexcept;
bool is_identifier_with_dots(std::string_view s) noexcept;

bool read_text_file(const std::filesystem::path& path, std::string& out, std::string& error);

}  // namespace transtree
