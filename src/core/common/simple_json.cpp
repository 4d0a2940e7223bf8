#include "humidor/core/simple_json.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <utility>

namespace humidor::json {
namespace {

void SetError(std::string* error, const std::string& message, std::size_t pos) {
    if (error != nullptr) {
        *error = message + " at offset " + std::to_string(pos);
    }
}

void AppendUtf8(std::uint32_t code_point, std::string* out) {
    if (code_point < 0x80) {
        out->push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        out->push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
        out->push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        out->push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        out->push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

class Reader {
public:
    explicit Reader(const std::string& text) : text_(text) {}

    bool ReadDocument(Value* out, std::string* error) {
        SkipSpace();
        if (!ReadValue(out, error, 0)) {
            return false;
        }
        SkipSpace();
        if (pos_ != text_.size()) {
            SetError(error, "trailing characters after json document", pos_);
            return false;
        }
        return true;
    }

private:
    static constexpr int kMaxDepth = 64;

    bool AtEnd() const { return pos_ >= text_.size(); }
    char Peek() const { return AtEnd() ? '\0' : text_[pos_]; }

    void SkipSpace() {
        while (!AtEnd() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
            ++pos_;
        }
    }

    bool Expect(char ch, std::string* error) {
        SkipSpace();
        if (Peek() != ch) {
            SetError(error, std::string("expected '") + ch + "'", pos_);
            return false;
        }
        ++pos_;
        return true;
    }

    bool ReadValue(Value* out, std::string* error, int depth) {
        if (depth > kMaxDepth) {
            SetError(error, "json nesting too deep", pos_);
            return false;
        }
        SkipSpace();
        switch (Peek()) {
            case '{':
                return ReadObject(out, error, depth);
            case '[':
                return ReadArray(out, error, depth);
            case '"':
                *out = Value::String("");
                return ReadString(&out->string_value, error);
            case 't':
                return ReadLiteral("true", Value::Bool(true), out, error);
            case 'f':
                return ReadLiteral("false", Value::Bool(false), out, error);
            case 'n':
                return ReadLiteral("null", Value::Null(), out, error);
            case '\0':
                SetError(error, "unexpected end of json", pos_);
                return false;
            default:
                return ReadNumber(out, error);
        }
    }

    bool ReadLiteral(const char* token, Value literal, Value* out, std::string* error) {
        const std::string expected(token);
        if (text_.compare(pos_, expected.size(), expected) != 0) {
            SetError(error, "invalid literal", pos_);
            return false;
        }
        pos_ += expected.size();
        *out = std::move(literal);
        return true;
    }

    bool ReadObject(Value* out, std::string* error, int depth) {
        ++pos_;
        *out = Value::Object();
        SkipSpace();
        if (Peek() == '}') {
            ++pos_;
            return true;
        }
        while (true) {
            SkipSpace();
            if (Peek() != '"') {
                SetError(error, "expected object key", pos_);
                return false;
            }
            std::string key;
            if (!ReadString(&key, error) || !Expect(':', error)) {
                return false;
            }
            Value member;
            if (!ReadValue(&member, error, depth + 1)) {
                return false;
            }
            out->object_value[key] = std::move(member);
            SkipSpace();
            if (Peek() == ',') {
                ++pos_;
                continue;
            }
            if (Peek() == '}') {
                ++pos_;
                return true;
            }
            SetError(error, "expected ',' or '}' in object", pos_);
            return false;
        }
    }

    bool ReadArray(Value* out, std::string* error, int depth) {
        ++pos_;
        *out = Value::Array();
        SkipSpace();
        if (Peek() == ']') {
            ++pos_;
            return true;
        }
        while (true) {
            Value item;
            if (!ReadValue(&item, error, depth + 1)) {
                return false;
            }
            out->array_value.push_back(std::move(item));
            SkipSpace();
            if (Peek() == ',') {
                ++pos_;
                continue;
            }
            if (Peek() == ']') {
                ++pos_;
                return true;
            }
            SetError(error, "expected ',' or ']' in array", pos_);
            return false;
        }
    }

    bool ReadHex4(std::uint32_t* out, std::string* error) {
        if (pos_ + 4 > text_.size()) {
            SetError(error, "truncated unicode escape", pos_);
            return false;
        }
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            const char ch = text_[pos_++];
            value <<= 4;
            if (ch >= '0' && ch <= '9') {
                value |= static_cast<std::uint32_t>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                value |= static_cast<std::uint32_t>(ch - 'a' + 10);
            } else if (ch >= 'A' && ch <= 'F') {
                value |= static_cast<std::uint32_t>(ch - 'A' + 10);
            } else {
                SetError(error, "invalid unicode escape", pos_ - 1);
                return false;
            }
        }
        *out = value;
        return true;
    }

    bool ReadString(std::string* out, std::string* error) {
        ++pos_;
        out->clear();
        while (!AtEnd()) {
            const char ch = text_[pos_++];
            if (ch == '"') {
                return true;
            }
            if (ch != '\\') {
                out->push_back(ch);
                continue;
            }
            if (AtEnd()) {
                break;
            }
            const char escaped = text_[pos_++];
            switch (escaped) {
                case '"':
                case '\\':
                case '/':
                    out->push_back(escaped);
                    break;
                case 'b':
                    out->push_back('\b');
                    break;
                case 'f':
                    out->push_back('\f');
                    break;
                case 'n':
                    out->push_back('\n');
                    break;
                case 'r':
                    out->push_back('\r');
                    break;
                case 't':
                    out->push_back('\t');
                    break;
                case 'u': {
                    std::uint32_t code_point = 0;
                    if (!ReadHex4(&code_point, error)) {
                        return false;
                    }
                    // Surrogate pairs arrive as two consecutive escapes.
                    if (code_point >= 0xD800 && code_point <= 0xDBFF &&
                        text_.compare(pos_, 2, "\\u") == 0) {
                        pos_ += 2;
                        std::uint32_t low = 0;
                        if (!ReadHex4(&low, error)) {
                            return false;
                        }
                        code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
                    }
                    AppendUtf8(code_point, out);
                    break;
                }
                default:
                    SetError(error, "unsupported escape sequence", pos_ - 1);
                    return false;
            }
        }
        SetError(error, "unterminated string", pos_);
        return false;
    }

    bool ReadNumber(Value* out, std::string* error) {
        const std::size_t begin = pos_;
        if (Peek() == '-') {
            ++pos_;
        }
        while (!AtEnd() && (std::isdigit(static_cast<unsigned char>(Peek())) != 0 ||
                            Peek() == '.' || Peek() == 'e' || Peek() == 'E' || Peek() == '+' ||
                            Peek() == '-')) {
            ++pos_;
        }
        const std::string token = text_.substr(begin, pos_ - begin);
        if (token.empty() || token == "-") {
            SetError(error, "invalid number token", begin);
            return false;
        }
        char* end = nullptr;
        const double parsed = std::strtod(token.c_str(), &end);
        if (end == nullptr || *end != '\0' || !std::isfinite(parsed)) {
            SetError(error, "invalid number token", begin);
            return false;
        }
        *out = Value::Number(parsed);
        return true;
    }

    const std::string& text_;
    std::size_t pos_{0};
};

std::string FormatNumber(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    if (std::floor(value) == value && std::fabs(value) < 9.0e15) {
        std::ostringstream oss;
        oss << static_cast<std::int64_t>(value);
        return oss.str();
    }
    // Shortest form that reads back to the same double.
    char buffer[32];
    for (int precision = 6; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }
    return buffer;
}

void Write(const Value& value, int indent, int level, std::string* out) {
    const auto newline = [&](int depth) {
        if (indent > 0) {
            out->push_back('\n');
            out->append(static_cast<std::size_t>(indent * depth), ' ');
        }
    };

    switch (value.type) {
        case Value::Type::kNull:
            out->append("null");
            return;
        case Value::Type::kBool:
            out->append(value.bool_value ? "true" : "false");
            return;
        case Value::Type::kNumber:
            out->append(FormatNumber(value.number_value));
            return;
        case Value::Type::kString:
            out->push_back('"');
            out->append(Escape(value.string_value));
            out->push_back('"');
            return;
        case Value::Type::kObject: {
            if (value.object_value.empty()) {
                out->append("{}");
                return;
            }
            out->push_back('{');
            bool first = true;
            for (const auto& [key, member] : value.object_value) {
                if (!first) {
                    out->push_back(',');
                }
                first = false;
                newline(level + 1);
                out->push_back('"');
                out->append(Escape(key));
                out->append(indent > 0 ? "\": " : "\":");
                Write(member, indent, level + 1, out);
            }
            newline(level);
            out->push_back('}');
            return;
        }
        case Value::Type::kArray: {
            if (value.array_value.empty()) {
                out->append("[]");
                return;
            }
            out->push_back('[');
            for (std::size_t i = 0; i < value.array_value.size(); ++i) {
                if (i > 0) {
                    out->push_back(',');
                }
                newline(level + 1);
                Write(value.array_value[i], indent, level + 1, out);
            }
            newline(level);
            out->push_back(']');
            return;
        }
    }
}

}  // namespace

Value Value::Null() {
    return Value{};
}

Value Value::Bool(bool value) {
    Value out;
    out.type = Type::kBool;
    out.bool_value = value;
    return out;
}

Value Value::Number(double value) {
    Value out;
    out.type = Type::kNumber;
    out.number_value = value;
    return out;
}

Value Value::String(std::string value) {
    Value out;
    out.type = Type::kString;
    out.string_value = std::move(value);
    return out;
}

Value Value::Object() {
    Value out;
    out.type = Type::kObject;
    return out;
}

Value Value::Array() {
    Value out;
    out.type = Type::kArray;
    return out;
}

const Value* Value::Find(const std::string& key) const {
    if (!IsObject()) {
        return nullptr;
    }
    const auto it = object_value.find(key);
    return it == object_value.end() ? nullptr : &it->second;
}

Value& Value::Set(const std::string& key, Value value) {
    if (!IsObject()) {
        *this = Object();
    }
    object_value[key] = std::move(value);
    return *this;
}

Value& Value::Append(Value value) {
    if (!IsArray()) {
        *this = Array();
    }
    array_value.push_back(std::move(value));
    return *this;
}

std::string GetString(const Value& object, const std::string& key, const std::string& fallback) {
    const auto* field = object.Find(key);
    return field != nullptr && field->IsString() ? field->string_value : fallback;
}

double GetNumber(const Value& object, const std::string& key, double fallback) {
    const auto* field = object.Find(key);
    return field != nullptr && field->IsNumber() ? field->number_value : fallback;
}

std::int64_t GetInteger(const Value& object, const std::string& key, std::int64_t fallback) {
    const auto* field = object.Find(key);
    if (field == nullptr || !field->IsNumber()) {
        return fallback;
    }
    const double rounded = std::round(field->number_value);
    if (rounded > static_cast<double>(std::numeric_limits<std::int64_t>::max()) ||
        rounded < static_cast<double>(std::numeric_limits<std::int64_t>::min())) {
        return fallback;
    }
    return static_cast<std::int64_t>(rounded);
}

bool HasNumber(const Value& object, const std::string& key) {
    const auto* field = object.Find(key);
    return field != nullptr && field->IsNumber();
}

bool Parse(const std::string& text, Value* out, std::string* error) {
    if (out == nullptr) {
        if (error != nullptr) {
            *error = "json output is null";
        }
        return false;
    }
    Value parsed;
    Reader reader(text);
    if (!reader.ReadDocument(&parsed, error)) {
        return false;
    }
    *out = std::move(parsed);
    return true;
}

std::string Dump(const Value& value, int indent) {
    std::string out;
    Write(value, indent, 0, &out);
    return out;
}

std::string Escape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (const char ch : text) {
        switch (ch) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            case '\b':
                escaped += "\\b";
                break;
            case '\f':
                escaped += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
                    escaped += buffer;
                } else {
                    escaped.push_back(ch);
                }
        }
    }
    return escaped;
}

}  // namespace humidor::json
