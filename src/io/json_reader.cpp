/**
 * JSON Reader Implementation - Recursive descent parser
 */

#include "json_reader.hpp"
#include <fstream>
#include <sstream>
#include <cctype>
#include <cstdlib>

namespace skyshield {

// ═══════════════════════════════════════════════════════════════
// JsonValue
// ═══════════════════════════════════════════════════════════════

bool JsonValue::as_bool() const {
    if (type != JsonType::BOOL) throw std::runtime_error("JsonValue: not a bool");
    return bool_val_;
}

double JsonValue::as_number() const {
    if (type != JsonType::NUMBER) throw std::runtime_error("JsonValue: not a number");
    return num_val_;
}

const std::string& JsonValue::as_string() const {
    if (type != JsonType::STRING) throw std::runtime_error("JsonValue: not a string");
    return str_val_;
}

Vec3 JsonValue::get_vec3(const Vec3& def) const {
    if (type != JsonType::ARRAY || arr_val_.size() != 3) return def;
    for (const auto& v : arr_val_) {
        if (!v.is_number()) return def;
    }
    return Vec3{arr_val_[0].num_val_, arr_val_[1].num_val_, arr_val_[2].num_val_};
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    if (type != JsonType::OBJECT) return null_value();
    auto it = obj_map_.find(key);
    if (it == obj_map_.end()) return null_value();
    return it->second;
}

bool JsonValue::has(const std::string& key) const {
    return type == JsonType::OBJECT && obj_map_.count(key) > 0;
}

const JsonValue& JsonValue::require(const std::string& key) const {
    if (!has(key)) {
        throw std::runtime_error("JsonValue: missing required key '" + key + "'");
    }
    return obj_map_.at(key);
}

const JsonValue& JsonValue::operator[](size_t index) const {
    if (type != JsonType::ARRAY || index >= arr_val_.size()) return null_value();
    return arr_val_[index];
}

size_t JsonValue::size() const {
    if (type == JsonType::ARRAY) return arr_val_.size();
    if (type == JsonType::OBJECT) return obj_map_.size();
    return 0;
}

const JsonValue& JsonValue::null_value() {
    static JsonValue nil;
    return nil;
}

// ═══════════════════════════════════════════════════════════════
// Parser internals
// ═══════════════════════════════════════════════════════════════

namespace {

class Parser {
public:
    explicit Parser(const std::string& input) : src_(input) {}

    JsonValue parse_document() {
        JsonValue val = parse_value();
        skip_whitespace();
        if (pos_ < src_.size()) throw error("Trailing characters after document");
        return val;
    }

private:
    const std::string& src_;
    size_t pos_ = 0;

    char peek() const { return pos_ < src_.size() ? src_[pos_] : '\0'; }

    bool is_digit(char c) const { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

    char advance() {
        if (pos_ >= src_.size()) throw error("Unexpected end of input");
        return src_[pos_++];
    }

    void expect(char c) {
        char got = advance();
        if (got != c) throw error(std::string("Expected '") + c + "', got '" + got + "'");
    }

    void skip_whitespace() {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) pos_++;
    }

    // Errors carry line:column rather than a raw offset
    std::runtime_error error(const std::string& msg) const {
        size_t line = 1, col = 1;
        for (size_t i = 0; i < pos_ && i < src_.size(); ++i) {
            if (src_[i] == '\n') { line++; col = 1; } else { col++; }
        }
        return std::runtime_error("JSON parse error at " + std::to_string(line) + ":" +
                                  std::to_string(col) + ": " + msg);
    }

    JsonValue parse_value() {
        skip_whitespace();
        char c = peek();
        switch (c) {
            case '"': return JsonValue(parse_string());
            case '{': return parse_object();
            case '[': return parse_array();
            case 't': return parse_literal("true", JsonValue(true));
            case 'f': return parse_literal("false", JsonValue(false));
            case 'n': return parse_literal("null", JsonValue());
            default: break;
        }
        if (c == '-' || is_digit(c)) return parse_number();
        throw error(std::string("Unexpected character: '") + c + "'");
    }

    JsonValue parse_literal(const char* word, JsonValue result) {
        std::string w(word);
        if (src_.compare(pos_, w.size(), w) != 0) throw error("Expected '" + w + "'");
        pos_ += w.size();
        return result;
    }

    void append_utf8(std::string& out, unsigned long code) {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }

    std::string parse_string() {
        expect('"');
        std::string result;
        while (true) {
            char c = advance();
            if (c == '"') break;
            if (c != '\\') {
                result += c;
                continue;
            }
            char esc = advance();
            switch (esc) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    if (pos_ + 4 > src_.size()) throw error("Incomplete \\u escape");
                    std::string hex = src_.substr(pos_, 4);
                    pos_ += 4;
                    append_utf8(result, std::strtoul(hex.c_str(), nullptr, 16));
                    break;
                }
                default:
                    throw error(std::string("Unknown escape: \\") + esc);
            }
        }
        return result;
    }

    void consume_digits(const char* what) {
        if (!is_digit(peek())) throw error(std::string("Expected digit ") + what);
        while (is_digit(peek())) pos_++;
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (peek() == '-') pos_++;

        if (peek() == '0') {
            pos_++;
        } else {
            consume_digits("in number");
        }
        if (peek() == '.') {
            pos_++;
            consume_digits("after decimal point");
        }
        if (peek() == 'e' || peek() == 'E') {
            pos_++;
            if (peek() == '+' || peek() == '-') pos_++;
            consume_digits("in exponent");
        }

        std::string numstr = src_.substr(start, pos_ - start);
        return JsonValue(std::strtod(numstr.c_str(), nullptr));
    }

    JsonValue parse_object() {
        expect('{');
        JsonValue obj;
        obj.set_object();

        skip_whitespace();
        if (peek() == '}') {
            pos_++;
            return obj;
        }

        do {
            skip_whitespace();
            std::string key = parse_string();
            skip_whitespace();
            expect(':');
            obj.add_member(key, parse_value());
            skip_whitespace();
        } while (peek() == ',' && ++pos_);

        expect('}');
        return obj;
    }

    JsonValue parse_array() {
        expect('[');
        JsonValue arr;
        arr.set_array();

        skip_whitespace();
        if (peek() == ']') {
            pos_++;
            return arr;
        }

        do {
            arr.add_element(parse_value());
            skip_whitespace();
        } while (peek() == ',' && ++pos_);

        expect(']');
        return arr;
    }
};

}  // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════

JsonValue JsonReader::parse(const std::string& json) {
    Parser parser(json);
    return parser.parse_document();
}

JsonValue JsonReader::parse_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open JSON file: " + filename);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

}  // namespace skyshield
