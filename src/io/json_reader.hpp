/**
 * Lightweight JSON Reader
 *
 * Recursive-descent parser producing a tree of JsonValue nodes.
 * Used for scenario files and the "engine" tuning block. Handles objects,
 * arrays, strings, numbers, booleans and null.
 *
 * Usage:
 *   auto root = JsonReader::parse_file("scenario.json");
 *   double dt = root["engine"]["dt"].get_number(1.0 / 60.0);
 *   Vec3 pos = root["threats"][0]["position"].get_vec3();
 */

#ifndef SKYSHIELD_JSON_READER_HPP
#define SKYSHIELD_JSON_READER_HPP

#include "core/state_vector.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <stdexcept>

namespace skyshield {

enum class JsonType {
    NIL,
    BOOL,
    NUMBER,
    STRING,
    OBJECT,
    ARRAY
};

class JsonValue {
public:
    JsonType type = JsonType::NIL;

    JsonValue() = default;
    explicit JsonValue(bool v) : type(JsonType::BOOL), bool_val_(v) {}
    explicit JsonValue(double v) : type(JsonType::NUMBER), num_val_(v) {}
    explicit JsonValue(std::string v) : type(JsonType::STRING), str_val_(std::move(v)) {}

    bool is_null()   const { return type == JsonType::NIL; }
    bool is_bool()   const { return type == JsonType::BOOL; }
    bool is_number() const { return type == JsonType::NUMBER; }
    bool is_string() const { return type == JsonType::STRING; }
    bool is_object() const { return type == JsonType::OBJECT; }
    bool is_array()  const { return type == JsonType::ARRAY; }

    // Strict accessors (throw on type mismatch)
    bool as_bool() const;
    double as_number() const;
    int as_int() const { return static_cast<int>(as_number()); }
    const std::string& as_string() const;

    // Lenient accessors (return defaults on type mismatch)
    bool get_bool(bool def = false) const { return is_bool() ? bool_val_ : def; }
    double get_number(double def = 0.0) const { return is_number() ? num_val_ : def; }
    int get_int(int def = 0) const { return is_number() ? static_cast<int>(num_val_) : def; }
    std::string get_string(const std::string& def = "") const { return is_string() ? str_val_ : def; }

    /**
     * Read a 3-element numeric array [x, y, z].
     * Returns def when the value is not an array of three numbers.
     */
    Vec3 get_vec3(const Vec3& def = Vec3::Zero()) const;

    // Object access; missing keys resolve to a shared null value
    const JsonValue& operator[](const std::string& key) const;
    bool has(const std::string& key) const;

    /**
     * Member lookup that throws when the key is missing,
     * naming the key in the error.
     */
    const JsonValue& require(const std::string& key) const;

    const std::unordered_map<std::string, JsonValue>& as_object() const { return obj_map_; }

    // Array access; out-of-range indices resolve to null
    const JsonValue& operator[](size_t index) const;
    size_t size() const;
    const std::vector<JsonValue>& as_array() const { return arr_val_; }

    // Builders used by the parser
    void set_object() { type = JsonType::OBJECT; }
    void set_array()  { type = JsonType::ARRAY; }
    void add_member(const std::string& key, JsonValue&& val) { obj_map_[key] = std::move(val); }
    void add_element(JsonValue&& val) { arr_val_.push_back(std::move(val)); }

private:
    bool bool_val_ = false;
    double num_val_ = 0.0;
    std::string str_val_;
    std::unordered_map<std::string, JsonValue> obj_map_;
    std::vector<JsonValue> arr_val_;

    static const JsonValue& null_value();
};

class JsonReader {
public:
    /**
     * Parse a JSON document.
     * @throws std::runtime_error with line:column of the first error
     */
    static JsonValue parse(const std::string& json);

    /**
     * Parse a JSON file.
     * @throws std::runtime_error on file or parse errors
     */
    static JsonValue parse_file(const std::string& filename);
};

}  // namespace skyshield

#endif  // SKYSHIELD_JSON_READER_HPP
