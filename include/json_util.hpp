#pragma once

#include <map>
#include <string>
#include <vector>

namespace cen {

// Just enough JSON for token blobs and Google REST replies: a single
// top-level object whose interesting members are strings, numbers, booleans
// or arrays of strings. Anything nested is accepted and kept as kOther.
struct JsonField {
    enum class Kind { kString, kNumber, kBool, kNull, kStringArray, kOther };
    Kind kind{Kind::kNull};
    std::string text;                // string value or raw literal
    std::vector<std::string> items;  // kStringArray only
};

using JsonObject = std::map<std::string, JsonField>;

bool parse_json_object(const std::string& text, JsonObject& out, std::string* error = nullptr);

std::string json_escape(const std::string& s);

// Empty when missing or not a string.
std::string json_string(const JsonObject& obj, const std::string& key);

}  // namespace cen
