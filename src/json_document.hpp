#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace transtree {

// Decodes JSON text keeping member order. Throws TextParseError with the decoder's
// position on malformed text and DuplicateKeyError when an object repeats a member
// name (names are compared after trimming).
nlohmann::ordered_json decode_json_document(const std::string& content);

}  // namespace transtree
