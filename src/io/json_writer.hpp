/**
 * Lightweight JSON Writer (header-only)
 *
 * Streams well-formed, indented JSON to an ostream. Used for run reports.
 *
 * Usage:
 *   JsonWriter w(std::cout);
 *   w.begin_object();
 *     w.kv("seed", 42);
 *     w.kv("impactPoint", Vec3{10, 0, -3});
 *     w.key("kills").begin_array();
 *       w.value("T1"); w.value("T2");
 *     w.end_array();
 *   w.end_object();
 */

#ifndef SKYSHIELD_JSON_WRITER_HPP
#define SKYSHIELD_JSON_WRITER_HPP

#include "core/state_vector.hpp"
#include <ostream>
#include <string>
#include <vector>
#include <cmath>
#include <cstdio>
#include <iomanip>

namespace skyshield {

class JsonWriter {
public:
    explicit JsonWriter(std::ostream& os, int indent_size = 2)
        : os_(os), indent_size_(indent_size) {}

    // ── Structure ──

    JsonWriter& begin_object() { return open('{'); }
    JsonWriter& end_object()   { return close('}'); }
    JsonWriter& begin_array()  { return open('['); }
    JsonWriter& end_array()    { return close(']'); }

    // ── Keys (object members) ──

    JsonWriter& key(const std::string& k) {
        write_separator();
        os_ << '"';
        write_escaped(k);
        os_ << "\": ";
        expect_value_ = true;
        return *this;
    }

    // ── Values ──

    JsonWriter& value(const std::string& v) {
        begin_value();
        os_ << '"';
        write_escaped(v);
        os_ << '"';
        return *this;
    }

    JsonWriter& value(const char* v) { return value(std::string(v)); }

    JsonWriter& value(int v) {
        begin_value();
        os_ << v;
        return *this;
    }

    JsonWriter& value(size_t v) {
        begin_value();
        os_ << v;
        return *this;
    }

    JsonWriter& value(double v) {
        begin_value();
        if (std::isnan(v) || std::isinf(v)) {
            os_ << "null";
        } else {
            os_ << std::setprecision(12) << v;
        }
        return *this;
    }

    JsonWriter& value(bool v) {
        begin_value();
        os_ << (v ? "true" : "false");
        return *this;
    }

    // Vectors are written inline as [x, y, z]
    JsonWriter& value(const Vec3& v) {
        begin_value();
        os_ << std::setprecision(12) << '[' << v.x << ", " << v.y << ", " << v.z << ']';
        return *this;
    }

    JsonWriter& null_value() {
        begin_value();
        os_ << "null";
        return *this;
    }

    // ── Convenience: key-value pair ──

    template<typename T>
    JsonWriter& kv(const std::string& k, const T& v) {
        key(k);
        value(v);
        return *this;
    }

private:
    std::ostream& os_;
    int indent_size_;
    std::vector<int> counts_;   // items written per open scope
    bool expect_value_ = false;

    JsonWriter& open(char bracket) {
        begin_value();
        os_ << bracket;
        counts_.push_back(0);
        return *this;
    }

    JsonWriter& close(char bracket) {
        bool had_items = !counts_.empty() && counts_.back() > 0;
        if (!counts_.empty()) counts_.pop_back();
        if (had_items) newline();
        os_ << bracket;
        return *this;
    }

    void begin_value() {
        if (!expect_value_) write_separator();
        expect_value_ = false;
    }

    void write_separator() {
        if (expect_value_ || counts_.empty()) return;
        if (counts_.back() > 0) os_ << ',';
        newline();
        counts_.back()++;
    }

    void newline() {
        os_ << '\n' << std::string(counts_.size() * static_cast<size_t>(indent_size_), ' ');
    }

    void write_escaped(const std::string& s) {
        for (char c : s) {
            switch (c) {
                case '"':  os_ << "\\\""; break;
                case '\\': os_ << "\\\\"; break;
                case '\n': os_ << "\\n";  break;
                case '\r': os_ << "\\r";  break;
                case '\t': os_ << "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                        os_ << buf;
                    } else {
                        os_ << c;
                    }
                    break;
            }
        }
    }
};

}  // namespace skyshield

#endif  // SKYSHIELD_JSON_WRITER_HPP
