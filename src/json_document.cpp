#include "json_document.hpp"

#include "parse_error.hpp"
#include "text_utils.hpp"

#include <unordered_set>
#include <vector>

namespace transtree {

nlohmann::ordered_json decode_json_document(const std::string& content) {
    using parse_event_t = nlohmann::ordered_json::parse_event_t;

    // one set of member names per object being decoded
    std::vector<std::unordered_set<std::string>> member_names;

    const nlohmann::ordered_json::parser_callback_t reject_duplicates =
        [&member_names](int /*depth*/, parse_event_t event, nlohmann::ordered_json& parsed) {
            switch (event) {
                case parse_event_t::object_start:
                    member_names.emplace_back();
                    break;
                case parse_event_t::key: {
                    std::string name = trim(parsed.get_ref<const std::string&>());
                    if (!member_names.back().insert(name).second) {
                        throw DuplicateKeyError(name);
                    }
                    break;
                }
                case parse_event_t::object_end:
                    member_names.pop_back();
                    break;
                default:
                    break;
            }
            return true;
        };

    try {
        return nlohmann::ordered_json::parse(content, reject_duplicates);
    } catch (const nlohmann::json::parse_error& ex) {
        const std::size_t offset = ex.byte > 0 ? ex.byte - 1 : 0;
        const TextPosition pos = position_at(content, offset);
        throw TextParseError(ex.what(), offset, offset, pos.line, pos.column);
    }
}

}  // namespace transtree
