#pragma once

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace hemascan {

class Json {
public:
    using object_t = std::map<std::string, Json>;
    using array_t = std::vector<Json>;
    using value_t = std::variant<std::nullptr_t, bool, double, std::string, object_t, array_t>;

    Json() : value_(nullptr) {}
    Json(std::nullptr_t) : value_(nullptr) {}
    Json(bool v) : value_(v) {}
    Json(double v) : value_(v) {}
    Json(float v) : value_(static_cast<double>(v)) {}
    Json(int v) : value_(static_cast<double>(v)) {}
    Json(std::int64_t v) : value_(static_cast<double>(v)) {}
    Json(std::size_t v) : value_(static_cast<double>(v)) {}
    Json(const char *v) : value_(std::string(v)) {}
    Json(std::string v) : value_(std::move(v)) {}
    Json(object_t v) : value_(std::move(v)) {}
    Json(array_t v) : value_(std::move(v)) {}

    bool is_null() const { return std::holds_alternative<std::nullptr_t>(value_); }
    bool is_boolean() const { return std::holds_alternative<bool>(value_); }
    bool is_number() const { return std::holds_alternative<double>(value_); }
    bool is_string() const { return std::holds_alternative<std::string>(value_); }
    bool is_object() const { return std::holds_alternative<object_t>(value_); }
    bool is_array() const { return std::holds_alternative<array_t>(value_); }

    const object_t &as_object() const { return get<object_t>("object"); }
    object_t &as_object() { return get<object_t>("object"); }

    const array_t &as_array() const { return get<array_t>("array"); }
    array_t &as_array() { return get<array_t>("array"); }

    const std::string &as_string() const { return get<std::string>("string"); }

    double as_number() const { return get<double>("number"); }

    bool as_bool() const { return get<bool>("boolean"); }

    const Json &operator[](const std::string &key) const {
        const auto &obj = as_object();
        auto it = obj.find(key);
        if (it == obj.end()) {
            throw std::out_of_range("key not found: " + key);
        }
        return it->second;
    }

    Json &operator[](const std::string &key) {
        if (is_null()) {
            value_ = object_t{};
        }
        return as_object()[key];
    }

    bool contains(const std::string &key) const {
        if (!is_object()) {
            return false;
        }
        const auto &obj = as_object();
        return obj.find(key) != obj.end();
    }

    void push_back(Json value) {
        if (is_null()) {
            value_ = array_t{};
        }
        as_array().push_back(std::move(value));
    }

    // Typed lookups with defaults, for optional configuration keys.
    std::string get_string(const std::string &key, const std::string &fallback = {}) const {
        return contains(key) && (*this)[key].is_string() ? (*this)[key].as_string() : fallback;
    }

    double get_number(const std::string &key, double fallback = 0.0) const {
        return contains(key) && (*this)[key].is_number() ? (*this)[key].as_number() : fallback;
    }

    bool get_bool(const std::string &key, bool fallback = false) const {
        return contains(key) && (*this)[key].is_boolean() ? (*this)[key].as_bool() : fallback;
    }

    std::string dump(int indent = -1) const {
        std::string out;
        dump_impl(out, indent, 0);
        return out;
    }

    static Json parse(const std::string &text);
    static Json parse_file(const std::string &path);

private:
    template <typename T>
    const T &get(const char *what) const {
        if (const T *v = std::get_if<T>(&value_)) {
            return *v;
        }
        throw std::runtime_error(std::string("JSON value is not a ") + what);
    }

    template <typename T>
    T &get(const char *what) {
        if (T *v = std::get_if<T>(&value_)) {
            return *v;
        }
        throw std::runtime_error(std::string("JSON value is not a ") + what);
    }

    value_t value_;

    void dump_impl(std::string &out, int indent, int depth) const;
    static void dump_string(std::string &out, const std::string &s);
};

inline Json makeObject() { return Json(Json::object_t{}); }
inline Json makeArray() { return Json(Json::array_t{}); }

class JsonParser {
public:
    explicit JsonParser(const std::string &text) : s_(text) {}

    Json parse();

private:
    const std::string &s_;
    std::size_t pos_{0};

    void skip_ws();
    char peek() const;
    bool consume(char expected);

    Json parse_value();
    Json parse_object();
    Json parse_array();
    Json parse_string();
    Json parse_bool();
    Json parse_null();
    Json parse_number();
};

inline Json Json::parse(const std::string &text) {
    JsonParser parser(text);
    return parser.parse();
}

inline Json Json::parse_file(const std::string &path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    return parse(content);
}

inline void Json::dump_string(std::string &out, const std::string &s) {
    out.push_back('"');
    for (char c : s) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '"': out += "\\\""; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                out += buf;
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    out.push_back('"');
}

inline void Json::dump_impl(std::string &out, int indent, int depth) const {
    if (is_null()) {
        out += "null";
        return;
    }
    if (is_boolean()) {
        out += as_bool() ? "true" : "false";
        return;
    }
    if (is_number()) {
        const double v = as_number();
        if (!std::isfinite(v)) {
            out += "null";
            return;
        }
        char buf[32];
        if (v == std::floor(v) && std::fabs(v) < 9.0e15) {
            std::snprintf(buf, sizeof(buf), "%.0f", v);
        } else {
            std::snprintf(buf, sizeof(buf), "%.17g", v);
        }
        out += buf;
        return;
    }
    if (is_string()) {
        dump_string(out, as_string());
        return;
    }
    if (is_array()) {
        out.push_back('[');
        const auto &arr = as_array();
        for (std::size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out.push_back(',');
            }
            if (indent >= 0) {
                out.push_back('\n');
                out.append((depth + 1) * indent, ' ');
            }
            arr[i].dump_impl(out, indent, depth + 1);
        }
        if (!arr.empty() && indent >= 0) {
            out.push_back('\n');
            out.append(depth * indent, ' ');
        }
        out.push_back(']');
        return;
    }
    out.push_back('{');
    const auto &obj = as_object();
    std::size_t count = 0;
    for (const auto &kv : obj) {
        if (count++ > 0) {
            out.push_back(',');
        }
        if (indent >= 0) {
            out.push_back('\n');
            out.append((depth + 1) * indent, ' ');
        }
        dump_string(out, kv.first);
        out.push_back(':');
        if (indent >= 0) {
            out.push_back(' ');
        }
        kv.second.dump_impl(out, indent, depth + 1);
    }
    if (!obj.empty() && indent >= 0) {
        out.push_back('\n');
        out.append(depth * indent, ' ');
    }
    out.push_back('}');
}

inline void JsonParser::skip_ws() {
    while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) {
        ++pos_;
    }
}

inline char JsonParser::peek() const {
    if (pos_ >= s_.size()) {
        return '\0';
    }
    return s_[pos_];
}

inline bool JsonParser::consume(char expected) {
    skip_ws();
    if (peek() != expected) {
        return false;
    }
    ++pos_;
    return true;
}

inline Json JsonParser::parse() {
    Json value = parse_value();
    skip_ws();
    if (pos_ != s_.size()) {
        throw std::runtime_error("unexpected trailing characters in JSON");
    }
    return value;
}

inline Json JsonParser::parse_value() {
    skip_ws();
    char c = peek();
    if (c == '"') {
        return parse_string();
    }
    if (c == '{') {
        return parse_object();
    }
    if (c == '[') {
        return parse_array();
    }
    if (c == 't' || c == 'f') {
        return parse_bool();
    }
    if (c == 'n') {
        return parse_null();
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
        return parse_number();
    }
    throw std::runtime_error("invalid JSON value at offset " + std::to_string(pos_));
}

inline Json JsonParser::parse_object() {
    if (!consume('{')) {
        throw std::runtime_error("expected '{'");
    }
    Json::object_t obj;
    if (consume('}')) {
        return Json(std::move(obj));
    }
    while (true) {
        skip_ws();
        if (peek() != '"') {
            throw std::runtime_error("expected string key");
        }
        std::string key = parse_string().as_string();
        if (!consume(':')) {
            throw std::runtime_error("expected ':' after key");
        }
        obj[std::move(key)] = parse_value();
        if (consume('}')) {
            break;
        }
        if (!consume(',')) {
            throw std::runtime_error("expected ',' in object");
        }
    }
    return Json(std::move(obj));
}

inline Json JsonParser::parse_array() {
    if (!consume('[')) {
        throw std::runtime_error("expected '['");
    }
    Json::array_t arr;
    if (consume(']')) {
        return Json(std::move(arr));
    }
    while (true) {
        arr.emplace_back(parse_value());
        if (consume(']')) {
            break;
        }
        if (!consume(',')) {
            throw std::runtime_error("expected ',' in array");
        }
    }
    return Json(std::move(arr));
}

inline Json JsonParser::parse_string() {
    if (!consume('"')) {
        throw std::runtime_error("expected string opening quote");
    }
    std::string out;
    bool closed = false;
    while (pos_ < s_.size()) {
        char c = s_[pos_++];
        if (c == '"') {
            closed = true;
            break;
        }
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (pos_ >= s_.size()) {
            throw std::runtime_error("invalid escape sequence");
        }
        char esc = s_[pos_++];
        switch (esc) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
            if (pos_ + 4 > s_.size()) {
                throw std::runtime_error("truncated unicode escape");
            }
            unsigned code = static_cast<unsigned>(std::stoul(s_.substr(pos_, 4), nullptr, 16));
            pos_ += 4;
            // Basic multilingual plane only, encoded as UTF-8.
            if (code < 0x80) {
                out.push_back(static_cast<char>(code));
            } else if (code < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (code >> 6)));
                out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xE0 | (code >> 12)));
                out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
            }
            break;
        }
        default:
            throw std::runtime_error("unsupported escape sequence");
        }
    }
    if (!closed) {
        throw std::runtime_error("unterminated string");
    }
    return Json(std::move(out));
}

inline Json JsonParser::parse_bool() {
    if (s_.compare(pos_, 4, "true") == 0) {
        pos_ += 4;
        return Json(true);
    }
    if (s_.compare(pos_, 5, "false") == 0) {
        pos_ += 5;
        return Json(false);
    }
    throw std::runtime_error("invalid boolean literal");
}

inline Json JsonParser::parse_null() {
    if (s_.compare(pos_, 4, "null") != 0) {
        throw std::runtime_error("invalid null literal");
    }
    pos_ += 4;
    return Json(nullptr);
}

inline Json JsonParser::parse_number() {
    std::size_t start = pos_;
    if (s_[pos_] == '-') {
        ++pos_;
    }
    while (pos_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_]))) {
        ++pos_;
    }
    if (pos_ < s_.size() && s_[pos_] == '.') {
        ++pos_;
        while (pos_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_]))) {
            ++pos_;
        }
    }
    if (pos_ < s_.size() && (s_[pos_] == 'e' || s_[pos_] == 'E')) {
        ++pos_;
        if (pos_ < s_.size() && (s_[pos_] == '+' || s_[pos_] == '-')) {
            ++pos_;
        }
        while (pos_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_]))) {
            ++pos_;
        }
    }
    return Json(std::stod(s_.substr(start, pos_ - start)));
}

} // namespace hemascan
