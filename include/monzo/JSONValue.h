//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: JSON value model, parser, serializer and typed field accessors for Monzo API payloads
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace monzo {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
};

//==========================================================================================================
// parseJSON
// Purpose: Parses a complete JSON document.
// Args:
//   text: JSON text. Leading and trailing whitespace is allowed; anything else after the value is not.
// Returns:
//   The parsed JSONValue.
// Throws:
//   errors::MonzoError(Decode) on malformed input.
//==========================================================================================================
JSONValue parseJSON(const std::string& text);

// Compact JSON serialization.
std::string serializeJSONValue(const JSONValue& value);

//----------------------------------------------------------------------------------------------------------
// Field accessors. The require* family throws errors::MonzoError(Decode) naming the field when it is
// missing or has the wrong type; the optional* family returns nullopt for missing or null members.
//----------------------------------------------------------------------------------------------------------
const JSONValue* findMember(const JSONValue& object, const std::string& key);
const JSONValue::Object& requireObject(const JSONValue& value, const std::string& what);
const JSONValue::Array& requireArray(const JSONValue& object, const std::string& key);
std::string requireString(const JSONValue& object, const std::string& key);
int64_t requireInt(const JSONValue& object, const std::string& key);
bool requireBool(const JSONValue& object, const std::string& key);
std::optional<std::string> optionalString(const JSONValue& object, const std::string& key);
std::optional<int64_t> optionalInt(const JSONValue& object, const std::string& key);
std::optional<bool> optionalBool(const JSONValue& object, const std::string& key);

} // namespace monzo
