//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, serializer and field accessors
//==========================================================================================================

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <fmt/format.h>
#include "monzo/JSONValue.h"
#include "monzo/errors/Errors.h"
#include "logging/Logger.h"

namespace monzo {

using errors::ErrorKind;
using errors::MonzoError;

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

// -------------------------------
// Minimal recursive JSON parser
// -------------------------------
namespace {

constexpr int kMaxDepth = 128;

[[noreturn]] void fail(const std::string& what, std::size_t at) {
    throw MonzoError(ErrorKind::Decode, fmt::format("Invalid JSON: {} at offset {}", what, at));
}

void appendUtf8(std::string& out, unsigned int code) {
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("truncated unicode escape", i);
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("invalid hex digit in unicode escape", i - 1);
        }
        return code;
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("expected string", i);
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) fail("unterminated string", i);
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("control character in string", i - 1);
            if (c != '\\') { out.push_back(c); continue; }
            if (i >= s.size()) fail("invalid escape", i);
            char e = s[i++];
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
                    unsigned int code = parseHex4();
                    // Surrogate pair
                    if (code >= 0xD800 && code <= 0xDBFF && i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("invalid surrogate pair", i);
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("unknown escape", i - 1);
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t digitsStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == digitsStart) fail("unexpected character", start);
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        std::string num = s.substr(start, i - start);
        try {
            if (!isFloat) {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            }
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            // Integers beyond int64 degrade to double
            return JSONValue(std::stod(num));
        } catch (const std::invalid_argument&) {
            fail("invalid number", start);
        }
    }

    JSONValue parseArray() {
        if (!match('[')) fail("expected '['", i);
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("expected ',' in array", i);
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("expected '{'", i);
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("expected ':' after key", i);
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("expected ',' in object", i);
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("unexpected end of input", i);
        if (++depth > kMaxDepth) fail("nesting too deep", i);
        JSONValue result;
        char c = s[i];
        if (c == '"') {
            result = JSONValue(parseString());
        } else if (c == '{') {
            result = parseObject();
        } else if (c == '[') {
            result = parseArray();
        } else if (s.compare(i, 4, "true") == 0) {
            i += 4; result = JSONValue(true);
        } else if (s.compare(i, 5, "false") == 0) {
            i += 5; result = JSONValue(false);
        } else if (s.compare(i, 4, "null") == 0) {
            i += 4; result = JSONValue(nullptr);
        } else {
            result = parseNumber();
        }
        --depth;
        return result;
    }
};

void writeEscaped(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

std::string typeName(const JSONValue& v) {
    switch (v.value.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "integer";
        case 3: return "number";
        case 4: return "string";
        case 5: return "array";
        default: return "object";
    }
}

[[noreturn]] void fieldError(const std::string& key, const std::string& expected, const JSONValue* got) {
    if (got == nullptr) {
        throw MonzoError(ErrorKind::Decode, fmt::format("Missing field '{}'", key));
    }
    throw MonzoError(ErrorKind::Decode,
                     fmt::format("Field '{}' expected {} but was {}", key, expected, typeName(*got)));
}

} // namespace

JSONValue parseJSON(const std::string& text) {
    FUNC_SCOPE();
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        fail("trailing characters", p.i);
    }
    return v;
}

std::string serializeJSONValue(const JSONValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) return "null";
            return fmt::format("{}", v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            std::ostringstream oss;
            writeEscaped(oss, v);
            return oss.str();
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            std::ostringstream oss;
            oss << '[';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) oss << ',';
                oss << (v[i] ? serializeJSONValue(*v[i]) : std::string("null"));
            }
            oss << ']';
            return oss.str();
        } else {
            std::ostringstream oss;
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeEscaped(oss, key);
                oss << ':' << (val ? serializeJSONValue(*val) : std::string("null"));
            }
            oss << '}';
            return oss.str();
        }
    }, value.get());
}

const JSONValue* findMember(const JSONValue& object, const std::string& key) {
    const auto* obj = std::get_if<JSONValue::Object>(&object.value);
    if (!obj) return nullptr;
    auto it = obj->find(key);
    if (it == obj->end() || !it->second) return nullptr;
    return it->second.get();
}

const JSONValue::Object& requireObject(const JSONValue& value, const std::string& what) {
    const auto* obj = std::get_if<JSONValue::Object>(&value.value);
    if (!obj) fieldError(what, "object", &value);
    return *obj;
}

const JSONValue::Array& requireArray(const JSONValue& object, const std::string& key) {
    const JSONValue* m = findMember(object, key);
    const auto* arr = m ? std::get_if<JSONValue::Array>(&m->value) : nullptr;
    if (!arr) fieldError(key, "array", m);
    return *arr;
}

std::string requireString(const JSONValue& object, const std::string& key) {
    const JSONValue* m = findMember(object, key);
    const auto* str = m ? std::get_if<std::string>(&m->value) : nullptr;
    if (!str) fieldError(key, "string", m);
    return *str;
}

int64_t requireInt(const JSONValue& object, const std::string& key) {
    const JSONValue* m = findMember(object, key);
    if (m) {
        if (const auto* n = std::get_if<int64_t>(&m->value)) return *n;
        if (const auto* d = std::get_if<double>(&m->value)) {
            if (std::isfinite(*d) && std::trunc(*d) == *d) return static_cast<int64_t>(*d);
        }
    }
    fieldError(key, "integer", m);
}

bool requireBool(const JSONValue& object, const std::string& key) {
    const JSONValue* m = findMember(object, key);
    const auto* b = m ? std::get_if<bool>(&m->value) : nullptr;
    if (!b) fieldError(key, "bool", m);
    return *b;
}

std::optional<std::string> optionalString(const JSONValue& object, const std::string& key) {
    const JSONValue* m = findMember(object, key);
    if (!m || m->isNull()) return std::nullopt;
    return requireString(object, key);
}

std::optional<int64_t> optionalInt(const JSONValue& object, const std::string& key) {
    const JSONValue* m = findMember(object, key);
    if (!m || m->isNull()) return std::nullopt;
    return requireInt(object, key);
}

std::optional<bool> optionalBool(const JSONValue& object, const std::string& key) {
    const JSONValue* m = findMember(object, key);
    if (!m || m->isNull()) return std::nullopt;
    return requireBool(object, key);
}

} // namespace monzo
