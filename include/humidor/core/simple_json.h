#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace humidor::json {

struct Value {
    enum class Type {
        kNull,
        kBool,
        kNumber,
        kString,
        kObject,
        kArray,
    };

    Type type{Type::kNull};
    bool bool_value{false};
    double number_value{0.0};
    std::string string_value;
    std::map<std::string, Value> object_value;
    std::vector<Value> array_value;

    static Value Null();
    static Value Bool(bool value);
    static Value Number(double value);
    static Value String(std::string value);
    static Value Object();
    static Value Array();

    bool IsNull() const { return type == Type::kNull; }
    bool IsBool() const { return type == Type::kBool; }
    bool IsNumber() const { return type == Type::kNumber; }
    bool IsString() const { return type == Type::kString; }
    bool IsObject() const { return type == Type::kObject; }
    bool IsArray() const { return type == Type::kArray; }

    const Value* Find(const std::string& key) const;

    // Object builder; a non-object value is turned into an empty object first.
    Value& Set(const std::string& key, Value value);
    // Array builder; a non-array value is turned into an empty array first.
    Value& Append(Value value);
};

// Lenient field readers for persisted records. A missing or mistyped field
// yields the fallback.
std::string GetString(const Value& object, const std::string& key, const std::string& fallback = "");
double GetNumber(const Value& object, const std::string& key, double fallback = 0.0);
std::int64_t GetInteger(const Value& object, const std::string& key, std::int64_t fallback = 0);
bool HasNumber(const Value& object, const std::string& key);

bool Parse(const std::string& text, Value* out, std::string* error);

// indent <= 0 writes a single line.
std::string Dump(const Value& value, int indent = 0);

std::string Escape(const std::string& text);

}  // namespace humidor::json
