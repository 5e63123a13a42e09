#include "json_util.hpp"

#include <cctype>
#include <cstdio>
#include <sstream>

namespace cen {

namespace {

class Reader {
public:
    explicit Reader(const std::string& s) : s_(s) {}

    bool parse_object(JsonObject& out) {
        skip_ws();
        if (!consume('{')) return fail("expected '{'");
        skip_ws();
        if (consume('}')) return true;
        while (true) {
            skip_ws();
            std::string key;
            if (!parse_string(key)) return false;
            skip_ws();
            if (!consume(':')) return fail("expected ':' after key");
            JsonField field;
            if (!parse_value(field)) return false;
            out[key] = std::move(field);
            skip_ws();
            if (consume(',')) continue;
            if (consume('}')) break;
            return fail("expected ',' or '}'");
        }
        skip_ws();
        if (pos_ != s_.size()) return fail("trailing characters");
        return true;
    }

    const std::string& error() const { return error_; }

private:
    bool parse_value(JsonField& f) {
        skip_ws();
        if (pos_ >= s_.size()) return fail("unexpected end");
        char c = s_[pos_];
        if (c == '"') {
            f.kind = JsonField::Kind::kString;
            return parse_string(f.text);
        }
        if (c == '[') return parse_array(f);
        if (c == '{') {
            f.kind = JsonField::Kind::kOther;
            return skip_nested();
        }
        if (match_literal("true") || match_literal("false")) {
            f.kind = JsonField::Kind::kBool;
            f.text = s_[pos_] == 't' ? "true" : "false";
            pos_ += f.text.size();
            return true;
        }
        if (match_literal("null")) {
            f.kind = JsonField::Kind::kNull;
            pos_ += 4;
            return true;
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            size_t start = pos_;
            while (pos_ < s_.size() && (std::isdigit(static_cast<unsigned char>(s_[pos_])) ||
                                        s_[pos_] == '-' || s_[pos_] == '+' || s_[pos_] == '.' ||
                                        s_[pos_] == 'e' || s_[pos_] == 'E')) {
                pos_++;
            }
            f.kind = JsonField::Kind::kNumber;
            f.text = s_.substr(start, pos_ - start);
            return true;
        }
        return fail("unexpected character");
    }

    bool parse_array(JsonField& f) {
        size_t start = pos_;
        consume('[');
        f.kind = JsonField::Kind::kStringArray;
        skip_ws();
        if (consume(']')) return true;
        while (true) {
            skip_ws();
            if (pos_ < s_.size() && s_[pos_] == '"') {
                std::string item;
                if (!parse_string(item)) return false;
                f.items.push_back(std::move(item));
            } else {
                // Mixed or nested content: rewind and skip the whole array.
                pos_ = start;
                f.kind = JsonField::Kind::kOther;
                f.items.clear();
                return skip_nested();
            }
            skip_ws();
            if (consume(',')) continue;
            if (consume(']')) return true;
            return fail("expected ',' or ']'");
        }
    }

    // Skips a balanced {...} or [...] starting at pos_, respecting strings.
    bool skip_nested() {
        int depth = 0;
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (c == '"') {
                std::string ignored;
                if (!parse_string(ignored)) return false;
                continue;
            }
            if (c == '{' || c == '[') depth++;
            if (c == '}' || c == ']') {
                depth--;
                if (depth == 0) {
                    pos_++;
                    return true;
                }
            }
            pos_++;
        }
        return fail("unterminated container");
    }

    bool parse_string(std::string& out) {
        if (!consume('"')) return fail("expected string");
        out.clear();
        while (pos_ < s_.size()) {
            char c = s_[pos_++];
            if (c == '"') return true;
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= s_.size()) break;
            char e = s_[pos_++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned cp = 0;
                    if (!read_hex4(cp)) return fail("bad \\u escape");
                    if (cp >= 0xD800 && cp <= 0xDBFF && pos_ + 1 < s_.size() &&
                        s_[pos_] == '\\' && s_[pos_ + 1] == 'u') {
                        pos_ += 2;
                        unsigned lo = 0;
                        if (!read_hex4(lo)) return fail("bad \\u escape");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    return fail("bad escape");
            }
        }
        return fail("unterminated string");
    }

    bool read_hex4(unsigned& cp) {
        if (pos_ + 4 > s_.size()) return false;
        cp = 0;
        for (int i = 0; i < 4; ++i) {
            char h = s_[pos_++];
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned>(h - 'A' + 10);
            else return false;
        }
        return true;
    }

    static void append_utf8(std::string& out, unsigned cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    bool match_literal(const char* lit) const { return s_.compare(pos_, std::char_traits<char>::length(lit), lit) == 0; }

    void skip_ws() {
        while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) pos_++;
    }

    bool consume(char c) {
        if (pos_ < s_.size() && s_[pos_] == c) {
            pos_++;
            return true;
        }
        return false;
    }

    bool fail(const std::string& msg) {
        if (error_.empty()) error_ = msg + " at offset " + std::to_string(pos_);
        return false;
    }

    const std::string& s_;
    size_t pos_{0};
    std::string error_;
};

}  // namespace

bool parse_json_object(const std::string& text, JsonObject& out, std::string* error) {
    JsonObject parsed;
    Reader reader(text);
    if (!reader.parse_object(parsed)) {
        if (error) *error = reader.error();
        return false;
    }
    out = std::move(parsed);
    return true;
}

std::string json_escape(const std::string& s) {
    std::ostringstream oss;
    for (unsigned char c : s) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    oss << buf;
                } else {
                    oss << static_cast<char>(c);
                }
        }
    }
    return oss.str();
}

std::string json_string(const JsonObject& obj, const std::string& key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->second.kind != JsonField::Kind::kString) return {};
    return it->second.text;
}

}  // namespace cen
