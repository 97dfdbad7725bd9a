// DOGEPROV - JSON Value
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// JSON document model for the generic request({method, params}) surface.
// Pages send parameters as JSON and receive results as JSON.

#ifndef DOGEPROV_RPC_JSON_H
#define DOGEPROV_RPC_JSON_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dogeprov {
namespace rpc {

/**
 * Represents a JSON value.
 * Supports: null, bool, int64, double, string, array, object
 */
class JSONValue {
public:
    enum class Type {
        Null,
        Bool,
        Int,
        Double,
        String,
        Array,
        Object
    };

    using Array = std::vector<JSONValue>;
    using Object = std::map<std::string, JSONValue>;

    JSONValue() : type_(Type::Null) {}
    JSONValue(std::nullptr_t) : type_(Type::Null) {}
    JSONValue(bool value) : type_(Type::Bool), boolValue_(value) {}
    JSONValue(int value) : type_(Type::Int), intValue_(value) {}
    JSONValue(unsigned value) : type_(Type::Int), intValue_(value) {}
    JSONValue(int64_t value) : type_(Type::Int), intValue_(value) {}
    JSONValue(uint64_t value) : type_(Type::Int), intValue_(static_cast<int64_t>(value)) {}
    JSONValue(double value) : type_(Type::Double), doubleValue_(value) {}
    JSONValue(const char* value) : type_(Type::String), stringValue_(value) {}
    JSONValue(const std::string& value) : type_(Type::String), stringValue_(value) {}
    JSONValue(std::string&& value) : type_(Type::String), stringValue_(std::move(value)) {}
    JSONValue(const Array& value) : type_(Type::Array), arrayValue_(value) {}
    JSONValue(Array&& value) : type_(Type::Array), arrayValue_(std::move(value)) {}
    JSONValue(const Object& value) : type_(Type::Object), objectValue_(value) {}
    JSONValue(Object&& value) : type_(Type::Object), objectValue_(std::move(value)) {}

    static JSONValue MakeArray() { return JSONValue(Array{}); }
    static JSONValue MakeObject() { return JSONValue(Object{}); }

    Type GetType() const { return type_; }
    bool IsNull() const { return type_ == Type::Null; }
    bool IsBool() const { return type_ == Type::Bool; }
    bool IsInt() const { return type_ == Type::Int; }
    bool IsDouble() const { return type_ == Type::Double; }
    bool IsNumber() const { return type_ == Type::Int || type_ == Type::Double; }
    bool IsString() const { return type_ == Type::String; }
    bool IsArray() const { return type_ == Type::Array; }
    bool IsObject() const { return type_ == Type::Object; }

    bool GetBool(bool defaultValue = false) const;
    int64_t GetInt(int64_t defaultValue = 0) const;
    double GetDouble(double defaultValue = 0.0) const;
    const std::string& GetString() const;
    const Array& GetArray() const;
    const Object& GetObject() const;

    bool HasKey(const std::string& key) const;
    /// Null for missing keys or non-objects
    const JSONValue& operator[](const std::string& key) const;
    /// Turns a non-object into an empty object first
    JSONValue& operator[](const std::string& key);

    size_t Size() const;
    const JSONValue& operator[](size_t index) const;
    void Push(JSONValue value);

    std::string ToJSON() const;

    /// nullopt on malformed input or trailing characters
    static std::optional<JSONValue> TryParse(const std::string& json);

    static const JSONValue& Null();

    friend bool operator==(const JSONValue& a, const JSONValue& b);
    friend bool operator!=(const JSONValue& a, const JSONValue& b) { return !(a == b); }

private:
    Type type_;
    bool boolValue_{false};
    int64_t intValue_{0};
    double doubleValue_{0.0};
    std::string stringValue_;
    Array arrayValue_;
    Object objectValue_;
};

} // namespace rpc
} // namespace dogeprov

#endif // DOGEPROV_RPC_JSON_H
