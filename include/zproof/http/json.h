// ZPROOF - JSON Values
// Copyright (c) 2024 ZPROOF Developers
// MIT License
//
// Small JSON document model for request and response bodies.
// Integers keep full 64-bit range: negative values are Int, non-negative
// values above INT64_MAX are UInt, anything beyond uint64 becomes Double.

#ifndef ZPROOF_HTTP_JSON_H
#define ZPROOF_HTTP_JSON_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace zproof {
namespace http {

/**
 * Represents a JSON value.
 * Supports: null, bool, int64, uint64, double, string, array, object
 */
class JSONValue {
public:
    enum class Type {
        Null,
        Bool,
        Int,
        UInt,
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
    JSONValue(int64_t value) : type_(Type::Int), intValue_(value) {}
    JSONValue(uint64_t value);
    JSONValue(double value) : type_(Type::Double), doubleValue_(value) {}
    JSONValue(const char* value) : type_(Type::String), stringValue_(value) {}
    JSONValue(const std::string& value) : type_(Type::String), stringValue_(value) {}
    JSONValue(std::string&& value) : type_(Type::String), stringValue_(std::move(value)) {}
    JSONValue(const Array& value) : type_(Type::Array), arrayValue_(value) {}
    JSONValue(Array&& value) : type_(Type::Array), arrayValue_(std::move(value)) {}
    JSONValue(const Object& value) : type_(Type::Object), objectValue_(value) {}
    JSONValue(Object&& value) : type_(Type::Object), objectValue_(std::move(value)) {}
    
    // Type checking
    Type GetType() const { return type_; }
    bool IsNull() const { return type_ == Type::Null; }
    bool IsBool() const { return type_ == Type::Bool; }
    bool IsInt() const { return type_ == Type::Int; }
    bool IsUInt() const { return type_ == Type::UInt; }
    bool IsInteger() const { return type_ == Type::Int || type_ == Type::UInt; }
    bool IsDouble() const { return type_ == Type::Double; }
    bool IsNumber() const { return IsInteger() || type_ == Type::Double; }
    bool IsString() const { return type_ == Type::String; }
    bool IsArray() const { return type_ == Type::Array; }
    bool IsObject() const { return type_ == Type::Object; }
    
    // Value getters (with defaults)
    bool GetBool(bool defaultValue = false) const;
    int64_t GetInt(int64_t defaultValue = 0) const;
    uint64_t GetUInt(uint64_t defaultValue = 0) const;
    double GetDouble(double defaultValue = 0.0) const;
    const std::string& GetString() const;
    const Array& GetArray() const;
    const Object& GetObject() const;
    
    // Object access
    bool HasKey(const std::string& key) const;
    const JSONValue& operator[](const std::string& key) const;
    JSONValue& operator[](const std::string& key);
    
    // Array access
    size_t Size() const;
    const JSONValue& operator[](size_t index) const;
    void Push(JSONValue value);
    
    bool operator==(const JSONValue& other) const;
    bool operator!=(const JSONValue& other) const { return !(*this == other); }
    
    // Serialization
    std::string ToJSON() const;
    
    /// @throws std::runtime_error on malformed input
    static JSONValue Parse(const std::string& json);
    static std::optional<JSONValue> TryParse(const std::string& json);
    
    static const JSONValue& Null();

private:
    Type type_;
    bool boolValue_{false};
    int64_t intValue_{0};
    uint64_t uintValue_{0};
    double doubleValue_{0.0};
    std::string stringValue_;
    Array arrayValue_;
    Object objectValue_;
    
    void Write(std::string& out) const;
};

/// Quote and escape a string as a JSON string literal
std::string QuoteJSONString(const std::string& value);

} // namespace http
} // namespace zproof

#endif // ZPROOF_HTTP_JSON_H
