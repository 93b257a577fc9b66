#include "placeholder.hpp"

#include "text_utils.hpp"

namespace transtree {
namespace {

constexpr const char* kKeyType = "type";
constexpr const char* kKeyFormat = "format";
constexpr const char* kKeyExample = "example";
constexpr const char* kKeyOptionalParameters = "optionalParameters";

}  // namespace

const char* to_string(TextFormat format) noexcept {
    switch (format) {
        case TextFormat::None: return "none";
        case TextFormat::BackslashEscaping: return "backslash";
        case TextFormat::Arb: return "arb";
        case TextFormat::ArbNoEscaping: return "arb-no-escaping";
        case TextFormat::DotNet: return "dotnet";
    }
    return "none";
}

std::optional<TextFormat> text_format_from_string(std::string_view name) {
    const std::string lower = to_lower_ascii(trim(name));
    if (lower == "none") {
        return TextFormat::None;
    }
    if (lower == "backslash" || lower == "backslashescaping") {
        return TextFormat::BackslashEscaping;
    }
    if (lower == "arb") {
        return TextFormat::Arb;
    }
    if (lower == "arb-no-escaping" || lower == "arbnoescaping") {
        return TextFormat::ArbNoEscaping;
    }
    if (lower == "dotnet") {
        return TextFormat::DotNet;
    }
    return std::nullopt;
}

PlaceholderSyntax placeholder_syntax(TextFormat format) noexcept {
    PlaceholderSyntax syntax;
    switch (format) {
        case TextFormat::None:
        case TextFormat::BackslashEscaping:
            break;
        case TextFormat::Arb:
            syntax.braces = true;
            syntax.quoted_literals = true;
            break;
        case TextFormat::ArbNoEscaping:
            syntax.braces = true;
            break;
        case TextFormat::DotNet:
            syntax.braces = true;
            syntax.doubled_braces = true;
            break;
    }
    return syntax;
}

bool string_has_parameters(std::string_view text, TextFormat format) noexcept {
    const PlaceholderSyntax syntax = placeholder_syntax(format);
    if (text.empty() || !syntax.braces) {
        return false;
    }

    bool in_quotes = false;
    std::size_t open_braces = 0;
    std::size_t i = 0;

    while (i < text.size()) {
        const char c = text[i];
        const char next = i + 1 < text.size() ? text[i + 1] : '\0';

        if (syntax.quoted_literals) {
            if (c == '\'' && next == '\'') {
                i += 2;
                continue;
            }
            if (c == '\'') {
                in_quotes = !in_quotes;
                ++i;
                continue;
            }
        }

        if (syntax.doubled_braces) {
            if (c == '{' && next == '{') {
                i += 2;
                continue;
            }
            // inside an open parameter the first '}' closes it
            if (c == '}' && next == '}' && open_braces == 0) {
                i += 2;
                continue;
            }
        }

        if (!in_quotes) {
            if (c == '{') {
                ++open_braces;
            } else if (c == '}') {
                return open_braces > 0;
            }
        }

        ++i;
    }

    return false;
}

Placeholder parse_placeholder(const std::string& name, const nlohmann::ordered_json& definition) {
    Placeholder placeholder;
    placeholder.name = name;

    if (!definition.is_object()) {
        return placeholder;
    }

    for (const auto& [raw_key, value] : definition.items()) {
        const std::string key = trim(raw_key);

        if (value.is_string()) {
            const auto& text = value.get_ref<const std::string&>();
            if (iequals(key, kKeyType)) {
                placeholder.type = text;
            } else if (iequals(key, kKeyFormat)) {
                placeholder.format = text;
            } else if (iequals(key, kKeyExample)) {
                placeholder.example = text;
            } else {
                placeholder.properties[key] = text;
            }
        } else if (value.is_object() && iequals(key, kKeyOptionalParameters)) {
            for (const auto& [param_key, param_value] : value.items()) {
                if (param_value.is_string()) {
                    placeholder.optional_parameters[trim(param_key)] = param_value.get<std::string>();
                }
            }
        }
    }

    return placeholder;
}

}  // namespace transtree
