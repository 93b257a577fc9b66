#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace transtree {

class ParserError : public std::runtime_error {
public:
    explicit ParserError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed input at a known place in the source text. Lines and columns are 1-based.
class TextParseError : public ParserError {
public:
    TextParseError(
        const std::string& message,
        std::size_t start_position,
        std::size_t end_position,
        std::size_t line_number,
        std::size_t column_number
    )
        : ParserError(message),
          start_position_(start_position),
          end_position_(end_position),
          line_number_(line_number),
          column_number_(column_number) {}

    std::size_t start_position() const noexcept { return start_position_; }
    std::size_t end_position() const noexcept { return end_position_; }
    std::size_t line_number() const noexcept { return line_number_; }
    std::size_t column_number() const noexcept { return column_number_; }

private:
    std::size_t start_position_;
    std::size_t end_position_;
    std::size_t line_number_;
    std::size_t column_number_;
};

class DuplicateKeyError : public ParserError {
public:
    explicit DuplicateKeyError(const std::string& key)
        : ParserError("Duplicate key '" + key + "' specified in the translation file"), key_(key) {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

class ConfigError : public ParserError {
public:
    explicit ConfigError(const std::string& message) : ParserError(message) {}
};

}  // namespace transtree
