#pragma once
// Small JSON helper for session metadata, manifests and config files.
// Objects keep insertion order so manifests are processed in file order.
// Numbers are held as double; strings understand the standard escapes
// including \uXXXX (encoded back to UTF-8).

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace mini {

struct Value;

class Object {
public:
    using Entry = std::pair<std::string, Value>;
    using iterator = std::vector<Entry>::iterator;
    using const_iterator = std::vector<Entry>::const_iterator;

    iterator begin();
    iterator end();
    const_iterator begin() const;
    const_iterator end() const;

    iterator find(const std::string& key);
    const_iterator find(const std::string& key) const;

    // Inserts a Null value when the key is missing; keeps the original position otherwise.
    Value& operator[](const std::string& key);

    size_t size() const;
    bool empty() const;

private:
    std::vector<Entry> entries_;
};

using Array = std::vector<Value>;

struct Value {
    enum class Type { String, Number, Bool, Null, Object, Array } type{Type::Null};
    std::string str;
    double number{0.0};
    bool boolean{false};
    Object object;
    Array array;

    static Value makeString(std::string s) {
        Value v;
        v.type = Type::String;
        v.str = std::move(s);
        return v;
    }
    static Value makeNumber(double n) {
        Value v;
        v.type = Type::Number;
        v.number = n;
        return v;
    }
    static Value makeBool(bool b) {
        Value v;
        v.type = Type::Bool;
        v.boolean = b;
        return v;
    }
};

inline size_t Object::size() const { return entries_.size(); }
inline bool Object::empty() const { return entries_.empty(); }
inline Object::iterator Object::begin() { return entries_.begin(); }
inline Object::iterator Object::end() { return entries_.end(); }
inline Object::const_iterator Object::begin() const { return entries_.begin(); }
inline Object::const_iterator Object::end() const { return entries_.end(); }

inline Object::iterator Object::find(const std::string& key) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->first == key) return it;
    }
    return entries_.end();
}

inline Object::const_iterator Object::find(const std::string& key) const {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->first == key) return it;
    }
    return entries_.end();
}

inline Value& Object::operator[](const std::string& key) {
    auto it = find(key);
    if (it != entries_.end()) return it->second;
    entries_.emplace_back(key, Value{});
    return entries_.back().second;
}

inline void skip_ws(const std::string& s, size_t& i) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) i++;
}

inline void append_utf8(std::string& out, uint32_t cp) {
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

inline bool parse_hex4(const std::string& s, size_t& i, uint32_t& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
        char c = s[i++];
        out <<= 4;
        if (c >= '0' && c <= '9') out |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') out |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') out |= static_cast<uint32_t>(c - 'A' + 10);
        else return false;
    }
    return true;
}

inline bool parse_string(const std::string& s, size_t& i, std::string& out) {
    if (i >= s.size() || s[i] != '"') return false;
    i++; out.clear();
    while (i < s.size()) {
        char c = s[i++];
        if (c == '\\') {
            if (i >= s.size()) return false;
            char esc = s[i++];
            switch (esc) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    uint32_t cp = 0;
                    if (!parse_hex4(s, i, cp)) return false;
                    // Surrogate pair.
                    if (cp >= 0xD800 && cp <= 0xDBFF && i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                        size_t j = i + 2;
                        uint32_t lo = 0;
                        if (parse_hex4(s, j, lo) && lo >= 0xDC00 && lo <= 0xDFFF) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                            i = j;
                        }
                    }
                    append_utf8(out, cp);
                    break;
                }
                default: out.push_back(esc); break;
            }
        } else if (c == '"') {
            return true;
        } else {
            out.push_back(c);
        }
    }
    return false;
}

inline bool parse_object(const std::string& s, size_t& i, Object& out); // fwd
inline bool parse_array(const std::string& s, size_t& i, Array& out);

inline bool parse_value(const std::string& s, size_t& i, Value& out) {
    skip_ws(s, i);
    if (i >= s.size()) return false;
    if (s[i] == '"') {
        out.type = Value::Type::String;
        return parse_string(s, i, out.str);
    }
    if (std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == '-') {
        size_t start = i;
        while (i < s.size()) {
            char c = s[i];
            if (std::isdigit(static_cast<unsigned char>(c)) || c=='-' || c=='+' || c=='.' || c=='e' || c=='E') {
                i++;
            } else break;
        }
        const std::string tok = s.substr(start, i - start);
        char* endp = nullptr;
        out.type = Value::Type::Number;
        out.number = std::strtod(tok.c_str(), &endp);
        return endp != tok.c_str();
    }
    if (s.compare(i, 4, "true") == 0) {
        out.type = Value::Type::Bool; out.boolean = true; i += 4; return true;
    }
    if (s.compare(i, 5, "false") == 0) {
        out.type = Value::Type::Bool; out.boolean = false; i += 5; return true;
    }
    if (s.compare(i, 4, "null") == 0) {
        out.type = Value::Type::Null; i += 4; return true;
    }
    if (s[i] == '{') {
        out.type = Value::Type::Object;
        return parse_object(s, i, out.object);
    }
    if (s[i] == '[') {
        out.type = Value::Type::Array;
        return parse_array(s, i, out.array);
    }
    return false;
}

inline bool parse_object(const std::string& s, size_t& i, Object& out) {
    skip_ws(s, i);
    if (i >= s.size() || s[i] != '{') return false;
    i++;
    skip_ws(s, i);
    while (i < s.size() && s[i] != '}') {
        std::string key;
        if (!parse_string(s, i, key)) return false;
        skip_ws(s, i);
        if (i >= s.size() || s[i] != ':') return false;
        i++;
        Value v;
        if (!parse_value(s, i, v)) return false;
        out[key] = std::move(v);
        skip_ws(s, i);
        if (i < s.size() && s[i] == ',') { i++; skip_ws(s, i); }
        else if (i < s.size() && s[i] != '}') return false;
    }
    if (i < s.size() && s[i] == '}') { i++; return true; }
    return false;
}

inline bool parse_array(const std::string& s, size_t& i, Array& out) {
    skip_ws(s, i);
    if (i >= s.size() || s[i] != '[') return false;
    i++;
    skip_ws(s, i);
    while (i < s.size() && s[i] != ']') {
        Value v;
        if (!parse_value(s, i, v)) return false;
        out.push_back(std::move(v));
        skip_ws(s, i);
        if (i < s.size() && s[i] == ',') { i++; skip_ws(s, i); }
        else if (i < s.size() && s[i] != ']') return false;
    }
    if (i < s.size() && s[i] == ']') { i++; return true; }
    return false;
}

// Top-level parsers reject trailing garbage so a half-written file reads as corrupt.
inline bool parse(const std::string& s, Object& out) {
    size_t i = 0;
    if (!parse_object(s, i, out)) return false;
    skip_ws(s, i);
    return i == s.size();
}

inline bool parse(const std::string& s, Array& out) {
    size_t i = 0;
    if (!parse_array(s, i, out)) return false;
    skip_ws(s, i);
    return i == s.size();
}

inline bool parse(const std::string& s, Value& out) {
    size_t i = 0;
    if (!parse_value(s, i, out)) return false;
    skip_ws(s, i);
    return i == s.size();
}

inline std::string escape(const std::string& in) {
    std::string out;
    out.reserve(in.size() + 2);
    for (unsigned char c : in) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out.push_back(hex[c >> 4]);
                    out.push_back(hex[c & 0x0F]);
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

inline void dump_value(const Value& v, std::ostringstream& oss, int indent, int depth);

inline void dump_newline(std::ostringstream& oss, int indent, int depth) {
    if (indent <= 0) return;
    oss << '\n' << std::string(static_cast<size_t>(indent * depth), ' ');
}

inline void dump_object(const Object& o, std::ostringstream& oss, int indent, int depth) {
    if (o.empty()) { oss << "{}"; return; }
    oss << '{';
    bool first = true;
    for (const auto& kv : o) {
        if (!first) oss << ',';
        first = false;
        dump_newline(oss, indent, depth + 1);
        oss << '"' << escape(kv.first) << "\":";
        if (indent > 0) oss << ' ';
        dump_value(kv.second, oss, indent, depth + 1);
    }
    dump_newline(oss, indent, depth);
    oss << '}';
}

inline void dump_value(const Value& v, std::ostringstream& oss, int indent, int depth) {
    switch (v.type) {
        case Value::Type::String: oss << '"' << escape(v.str) << '"'; break;
        case Value::Type::Number: {
            if (!std::isfinite(v.number)) { oss << "null"; break; }
            const double r = std::round(v.number);
            if (std::fabs(v.number - r) < 1e-9 && std::fabs(r) <= 9e15) {
                oss << static_cast<int64_t>(r);
            } else {
                oss << v.number;
            }
            break;
        }
        case Value::Type::Bool: oss << (v.boolean ? "true" : "false"); break;
        case Value::Type::Null: oss << "null"; break;
        case Value::Type::Object: dump_object(v.object, oss, indent, depth); break;
        case Value::Type::Array: {
            if (v.array.empty()) { oss << "[]"; break; }
            oss << '[';
            for (size_t i = 0; i < v.array.size(); ++i) {
                if (i > 0) oss << ',';
                dump_newline(oss, indent, depth + 1);
                dump_value(v.array[i], oss, indent, depth + 1);
            }
            dump_newline(oss, indent, depth);
            oss << ']';
            break;
        }
    }
}

inline std::string dump(const Object& o, int indent = 2) {
    std::ostringstream oss;
    dump_object(o, oss, indent, 0);
    return oss.str();
}

} // namespace mini
