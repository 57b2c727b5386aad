// ZPROOF - JSON Values Implementation
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#include <zproof/http/json.h>

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace zproof {
namespace http {

namespace {

const JSONValue kNullValue;
const JSONValue::Array kEmptyArray;
const JSONValue::Object kEmptyObject;
const std::string kEmptyString;

constexpr int MAX_NESTING_DEPTH = 64;

void AppendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool IsDigit(char c) {
    return c >= '0' && c <= '9';
}

// ============================================================================
// Parser
// ============================================================================

class Parser {
public:
    explicit Parser(const std::string& text) : text_(text) {}
    
    std::optional<JSONValue> ParseDocument() {
        auto value = ParseValue(0);
        if (!value) {
            return std::nullopt;
        }
        SkipWhitespace();
        if (pos_ != text_.size()) {
            return std::nullopt;
        }
        return value;
    }

private:
    const std::string& text_;
    size_t pos_{0};
    
    void SkipWhitespace() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' ||
                text_[pos_] == '\n' || text_[pos_] == '\r')) {
            ++pos_;
        }
    }
    
    bool Consume(const char* literal) {
        size_t i = 0;
        while (literal[i] != '\0') {
            if (pos_ + i >= text_.size() || text_[pos_ + i] != literal[i]) {
                return false;
            }
            ++i;
        }
        pos_ += i;
        return true;
    }
    
    std::optional<JSONValue> ParseValue(int depth) {
        if (depth > MAX_NESTING_DEPTH) {
            return std::nullopt;
        }
        SkipWhitespace();
        if (pos_ >= text_.size()) {
            return std::nullopt;
        }
        
        char c = text_[pos_];
        switch (c) {
            case 'n': if (Consume("null")) return JSONValue(); return std::nullopt;
            case 't': if (Consume("true")) return JSONValue(true); return std::nullopt;
            case 'f': if (Consume("false")) return JSONValue(false); return std::nullopt;
            case '"': {
                auto str = ParseString();
                if (!str) return std::nullopt;
                return JSONValue(std::move(*str));
            }
            case '[': return ParseArray(depth);
            case '{': return ParseObject(depth);
            default:
                if (c == '-' || IsDigit(c)) {
                    return ParseNumber();
                }
                return std::nullopt;
        }
    }
    
    std::optional<uint32_t> ParseHex4() {
        if (pos_ + 4 > text_.size()) {
            return std::nullopt;
        }
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char h = text_[pos_++];
            value <<= 4;
            if (h >= '0' && h <= '9') value |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') value |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') value |= static_cast<uint32_t>(h - 'A' + 10);
            else return std::nullopt;
        }
        return value;
    }
    
    std::optional<std::string> ParseString() {
        if (pos_ >= text_.size() || text_[pos_] != '"') {
            return std::nullopt;
        }
        ++pos_;
        
        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return std::nullopt;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) {
                return std::nullopt;
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    auto cp = ParseHex4();
                    if (!cp) return std::nullopt;
                    uint32_t code = *cp;
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by a low surrogate
                        if (!Consume("\\u")) return std::nullopt;
                        auto low = ParseHex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF) return std::nullopt;
                        code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        return std::nullopt;
                    }
                    AppendUtf8(out, code);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;
    }
    
    std::optional<JSONValue> ParseNumber() {
        size_t start = pos_;
        bool negative = false;
        bool integral = true;
        
        if (text_[pos_] == '-') {
            negative = true;
            ++pos_;
        }
        if (pos_ >= text_.size() || !IsDigit(text_[pos_])) {
            return std::nullopt;
        }
        if (text_[pos_] == '0') {
            ++pos_;
        } else {
            while (pos_ < text_.size() && IsDigit(text_[pos_])) ++pos_;
        }
        if (pos_ < text_.size() && text_[pos_] == '.') {
            integral = false;
            ++pos_;
            if (pos_ >= text_.size() || !IsDigit(text_[pos_])) return std::nullopt;
            while (pos_ < text_.size() && IsDigit(text_[pos_])) ++pos_;
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            integral = false;
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
            if (pos_ >= text_.size() || !IsDigit(text_[pos_])) return std::nullopt;
            while (pos_ < text_.size() && IsDigit(text_[pos_])) ++pos_;
        }
        
        std::string literal = text_.substr(start, pos_ - start);
        
        if (integral) {
            errno = 0;
            if (negative) {
                long long v = std::strtoll(literal.c_str(), nullptr, 10);
                if (errno == 0) {
                    return JSONValue(static_cast<int64_t>(v));
                }
            } else {
                unsigned long long v = std::strtoull(literal.c_str(), nullptr, 10);
                if (errno == 0) {
                    return JSONValue(static_cast<uint64_t>(v));
                }
            }
            // Out of 64-bit range: fall through to double
        }
        
        errno = 0;
        double d = std::strtod(literal.c_str(), nullptr);
        if (errno == ERANGE && std::isinf(d)) {
            return std::nullopt;
        }
        return JSONValue(d);
    }
    
    std::optional<JSONValue> ParseArray(int depth) {
        ++pos_;  // '['
        JSONValue::Array items;
        
        SkipWhitespace();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            ++pos_;
            return JSONValue(std::move(items));
        }
        
        while (true) {
            auto item = ParseValue(depth + 1);
            if (!item) return std::nullopt;
            items.push_back(std::move(*item));
            
            SkipWhitespace();
            if (pos_ >= text_.size()) return std::nullopt;
            char c = text_[pos_++];
            if (c == ']') return JSONValue(std::move(items));
            if (c != ',') return std::nullopt;
        }
    }
    
    std::optional<JSONValue> ParseObject(int depth) {
        ++pos_;  // '{'
        JSONValue::Object members;
        
        SkipWhitespace();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            ++pos_;
            return JSONValue(std::move(members));
        }
        
        while (true) {
            SkipWhitespace();
            auto key = ParseString();
            if (!key) return std::nullopt;
            
            SkipWhitespace();
            if (pos_ >= text_.size() || text_[pos_] != ':') return std::nullopt;
            ++pos_;
            
            auto value = ParseValue(depth + 1);
            if (!value) return std::nullopt;
            members[*key] = std::move(*value);
            
            SkipWhitespace();
            if (pos_ >= text_.size()) return std::nullopt;
            char c = text_[pos_++];
            if (c == '}') return JSONValue(std::move(members));
            if (c != ',') return std::nullopt;
        }
    }
};

} // namespace

// ============================================================================
// JSONValue Implementation
// ============================================================================

JSONValue::JSONValue(uint64_t value) {
    if (value <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        type_ = Type::Int;
        intValue_ = static_cast<int64_t>(value);
    } else {
        type_ = Type::UInt;
        uintValue_ = value;
    }
}

const JSONValue& JSONValue::Null() {
    return kNullValue;
}

bool JSONValue::GetBool(bool defaultValue) const {
    return type_ == Type::Bool ? boolValue_ : defaultValue;
}

int64_t JSONValue::GetInt(int64_t defaultValue) const {
    return type_ == Type::Int ? intValue_ : defaultValue;
}

uint64_t JSONValue::GetUInt(uint64_t defaultValue) const {
    if (type_ == Type::UInt) return uintValue_;
    if (type_ == Type::Int && intValue_ >= 0) return static_cast<uint64_t>(intValue_);
    return defaultValue;
}

double JSONValue::GetDouble(double defaultValue) const {
    switch (type_) {
        case Type::Double: return doubleValue_;
        case Type::Int: return static_cast<double>(intValue_);
        case Type::UInt: return static_cast<double>(uintValue_);
        default: return defaultValue;
    }
}

const std::string& JSONValue::GetString() const {
    return type_ == Type::String ? stringValue_ : kEmptyString;
}

const JSONValue::Array& JSONValue::GetArray() const {
    return type_ == Type::Array ? arrayValue_ : kEmptyArray;
}

const JSONValue::Object& JSONValue::GetObject() const {
    return type_ == Type::Object ? objectValue_ : kEmptyObject;
}

bool JSONValue::HasKey(const std::string& key) const {
    return type_ == Type::Object && objectValue_.count(key) > 0;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    if (type_ != Type::Object) return kNullValue;
    auto it = objectValue_.find(key);
    return it == objectValue_.end() ? kNullValue : it->second;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    if (type_ != Type::Object) {
        *this = JSONValue(Object{});
    }
    return objectValue_[key];
}

size_t JSONValue::Size() const {
    if (type_ == Type::Array) return arrayValue_.size();
    if (type_ == Type::Object) return objectValue_.size();
    return 0;
}

const JSONValue& JSONValue::operator[](size_t index) const {
    if (type_ != Type::Array || index >= arrayValue_.size()) return kNullValue;
    return arrayValue_[index];
}

void JSONValue::Push(JSONValue value) {
    if (type_ != Type::Array) {
        *this = JSONValue(Array{});
    }
    arrayValue_.push_back(std::move(value));
}

bool JSONValue::operator==(const JSONValue& other) const {
    if (type_ != other.type_) return false;
    switch (type_) {
        case Type::Null: return true;
        case Type::Bool: return boolValue_ == other.boolValue_;
        case Type::Int: return intValue_ == other.intValue_;
        case Type::UInt: return uintValue_ == other.uintValue_;
        case Type::Double: return doubleValue_ == other.doubleValue_;
        case Type::String: return stringValue_ == other.stringValue_;
        case Type::Array: return arrayValue_ == other.arrayValue_;
        case Type::Object: return objectValue_ == other.objectValue_;
    }
    return false;
}

// ============================================================================
// Serialization
// ============================================================================

std::string QuoteJSONString(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

void JSONValue::Write(std::string& out) const {
    switch (type_) {
        case Type::Null:
            out += "null";
            break;
        case Type::Bool:
            out += boolValue_ ? "true" : "false";
            break;
        case Type::Int:
            out += std::to_string(intValue_);
            break;
        case Type::UInt:
            out += std::to_string(uintValue_);
            break;
        case Type::Double: {
            if (!std::isfinite(doubleValue_)) {
                out += "null";
                break;
            }
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.17g", doubleValue_);
            out += buf;
            break;
        }
        case Type::String:
            out += QuoteJSONString(stringValue_);
            break;
        case Type::Array: {
            out += '[';
            for (size_t i = 0; i < arrayValue_.size(); ++i) {
                if (i > 0) out += ',';
                arrayValue_[i].Write(out);
            }
            out += ']';
            break;
        }
        case Type::Object: {
            out += '{';
            bool first = true;
            for (const auto& [key, value] : objectValue_) {
                if (!first) out += ',';
                first = false;
                out += QuoteJSONString(key);
                out += ':';
                value.Write(out);
            }
            out += '}';
            break;
        }
    }
}

std::string JSONValue::ToJSON() const {
    std::string out;
    Write(out);
    return out;
}

JSONValue JSONValue::Parse(const std::string& json) {
    auto result = TryParse(json);
    if (!result) {
        throw std::runtime_error("JSON parse error");
    }
    return std::move(*result);
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    Parser parser(json);
    return parser.ParseDocument();
}

} // namespace http
} // namespace zproof
