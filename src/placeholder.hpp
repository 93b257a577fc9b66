#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace transtree {

// Escaping convention that decides which placeholder syntax is recognized in a value.
enum class TextFormat {
    None,
    BackslashEscaping,
    Arb,
    ArbNoEscaping,
    DotNet,
};

const char* to_string(TextFormat format) noexcept;
std::optional<TextFormat> text_format_from_string(std::string_view name);

// Placeholder syntax rules of one TextFormat.
struct PlaceholderSyntax {
    bool braces = false;           // {name} opens a parameter
    bool doubled_braces = false;   // {{ and }} are literal braces
    bool quoted_literals = false;  // '...' suppresses braces, '' is a literal quote
};

PlaceholderSyntax placeholder_syntax(TextFormat format) noexcept;

// True if the text has at least one parameter under the given convention. Malformed
// syntax (unmatched brace, hanging quote) yields false.
bool string_has_parameters(std::string_view text, TextFormat format) noexcept;

struct Placeholder {
    std::string name;
    std::optional<std::string> type;
    std::optional<std::string> format;
    std::optional<std::string> example;
    std::map<std::string, std::string> properties;
    std::map<std::string, std::string> optional_parameters;
};

Placeholder parse_placeholder(const std::string& name, const nlohmann::ordered_json& definition);

}  // namespace transtree
