// DOGEPROV - JSON Value Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/rpc/json.h"

#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace dogeprov {
namespace rpc {

namespace {

const JSONValue::Array kEmptyArray;
const JSONValue::Object kEmptyObject;
const std::string kEmptyString;

/// Nesting limit for untrusted page input
constexpr int MAX_DEPTH = 64;

void WriteEscaped(std::ostringstream& ss, const std::string& str) {
    ss << '"';
    for (char c : str) {
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    ss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec;
                } else {
                    ss << c;
                }
        }
    }
    ss << '"';
}

void WriteValue(std::ostringstream& ss, const JSONValue& v) {
    switch (v.GetType()) {
        case JSONValue::Type::Null:
            ss << "null";
            break;
        case JSONValue::Type::Bool:
            ss << (v.GetBool() ? "true" : "false");
            break;
        case JSONValue::Type::Int:
            ss << v.GetInt();
            break;
        case JSONValue::Type::Double:
            ss << std::setprecision(15) << v.GetDouble();
            break;
        case JSONValue::Type::String:
            WriteEscaped(ss, v.GetString());
            break;
        case JSONValue::Type::Array: {
            ss << '[';
            bool first = true;
            for (const auto& item : v.GetArray()) {
                if (!first) ss << ',';
                first = false;
                WriteValue(ss, item);
            }
            ss << ']';
            break;
        }
        case JSONValue::Type::Object: {
            ss << '{';
            bool first = true;
            for (const auto& [key, item] : v.GetObject()) {
                if (!first) ss << ',';
                first = false;
                WriteEscaped(ss, key);
                ss << ':';
                WriteValue(ss, item);
            }
            ss << '}';
            break;
        }
    }
}

void AppendUtf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

/// Recursive-descent parser over a string
class Parser {
public:
    explicit Parser(const std::string& json) : json_(json) {}

    std::optional<JSONValue> ParseDocument() {
        auto value = ParseValue(0);
        if (!value) return std::nullopt;
        SkipWhitespace();
        if (pos_ != json_.size()) return std::nullopt;
        return value;
    }

private:
    const std::string& json_;
    size_t pos_{0};

    void SkipWhitespace() {
        while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
            ++pos_;
        }
    }

    bool Consume(const char* literal) {
        size_t len = std::char_traits<char>::length(literal);
        if (json_.compare(pos_, len, literal) != 0) return false;
        pos_ += len;
        return true;
    }

    std::optional<JSONValue> ParseValue(int depth) {
        if (depth > MAX_DEPTH) return std::nullopt;
        SkipWhitespace();
        if (pos_ >= json_.size()) return std::nullopt;

        char c = json_[pos_];
        if (c == 'n') return Consume("null") ? std::optional<JSONValue>(JSONValue()) : std::nullopt;
        if (c == 't') return Consume("true") ? std::optional<JSONValue>(JSONValue(true)) : std::nullopt;
        if (c == 'f') return Consume("false") ? std::optional<JSONValue>(JSONValue(false)) : std::nullopt;
        if (c == '"') {
            auto str = ParseString();
            if (!str) return std::nullopt;
            return JSONValue(std::move(*str));
        }
        if (c == '[') return ParseArray(depth);
        if (c == '{') return ParseObject(depth);
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return ParseNumber();
        return std::nullopt;
    }

    std::optional<std::string> ParseString() {
        ++pos_;  // opening quote
        std::string out;
        while (pos_ < json_.size() && json_[pos_] != '"') {
            char c = json_[pos_++];
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= json_.size()) return std::nullopt;
            char esc = json_[pos_++];
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
                    if (pos_ + 4 > json_.size()) return std::nullopt;
                    unsigned cp = 0;
                    for (int i = 0; i < 4; ++i) {
                        char h = json_[pos_++];
                        cp <<= 4;
                        if (h >= '0' && h <= '9') cp |= static_cast<unsigned>(h - '0');
                        else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned>(h - 'a' + 10);
                        else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned>(h - 'A' + 10);
                        else return std::nullopt;
                    }
                    AppendUtf8(out, cp);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        if (pos_ >= json_.size()) return std::nullopt;
        ++pos_;  // closing quote
        return out;
    }

    std::optional<JSONValue> ParseNumber() {
        size_t start = pos_;
        bool isFloat = false;

        if (json_[pos_] == '-') ++pos_;
        size_t digits = pos_;
        while (pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
        if (pos_ == digits) return std::nullopt;

        if (pos_ < json_.size() && json_[pos_] == '.') {
            isFloat = true;
            ++pos_;
            while (pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
        }
        if (pos_ < json_.size() && (json_[pos_] == 'e' || json_[pos_] == 'E')) {
            isFloat = true;
            ++pos_;
            if (pos_ < json_.size() && (json_[pos_] == '+' || json_[pos_] == '-')) ++pos_;
            while (pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]))) ++pos_;
        }

        std::string text = json_.substr(start, pos_ - start);
        try {
            if (isFloat) {
                return JSONValue(std::stod(text));
            }
            return JSONValue(static_cast<int64_t>(std::stoll(text)));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    std::optional<JSONValue> ParseArray(int depth) {
        ++pos_;
        JSONValue::Array arr;
        SkipWhitespace();
        if (pos_ < json_.size() && json_[pos_] == ']') {
            ++pos_;
            return JSONValue(std::move(arr));
        }
        while (true) {
            auto item = ParseValue(depth + 1);
            if (!item) return std::nullopt;
            arr.push_back(std::move(*item));

            SkipWhitespace();
            if (pos_ >= json_.size()) return std::nullopt;
            if (json_[pos_] == ']') {
                ++pos_;
                return JSONValue(std::move(arr));
            }
            if (json_[pos_++] != ',') return std::nullopt;
        }
    }

    std::optional<JSONValue> ParseObject(int depth) {
        ++pos_;
        JSONValue::Object obj;
        SkipWhitespace();
        if (pos_ < json_.size() && json_[pos_] == '}') {
            ++pos_;
            return JSONValue(std::move(obj));
        }
        while (true) {
            SkipWhitespace();
            if (pos_ >= json_.size() || json_[pos_] != '"') return std::nullopt;
            auto key = ParseString();
            if (!key) return std::nullopt;

            SkipWhitespace();
            if (pos_ >= json_.size() || json_[pos_++] != ':') return std::nullopt;

            auto item = ParseValue(depth + 1);
            if (!item) return std::nullopt;
            obj[*key] = std::move(*item);

            SkipWhitespace();
            if (pos_ >= json_.size()) return std::nullopt;
            if (json_[pos_] == '}') {
                ++pos_;
                return JSONValue(std::move(obj));
            }
            if (json_[pos_++] != ',') return std::nullopt;
        }
    }
};

} // namespace

// ============================================================================
// JSONValue Implementation
// ============================================================================

const JSONValue& JSONValue::Null() {
    static const JSONValue null;
    return null;
}

bool JSONValue::GetBool(bool defaultValue) const {
    return type_ == Type::Bool ? boolValue_ : defaultValue;
}

int64_t JSONValue::GetInt(int64_t defaultValue) const {
    if (type_ == Type::Int) return intValue_;
    if (type_ == Type::Double) return static_cast<int64_t>(doubleValue_);
    return defaultValue;
}

double JSONValue::GetDouble(double defaultValue) const {
    if (type_ == Type::Double) return doubleValue_;
    if (type_ == Type::Int) return static_cast<double>(intValue_);
    return defaultValue;
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
    if (type_ != Type::Object) return Null();
    auto it = objectValue_.find(key);
    return it == objectValue_.end() ? Null() : it->second;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    if (type_ != Type::Object) {
        type_ = Type::Object;
        objectValue_.clear();
    }
    return objectValue_[key];
}

size_t JSONValue::Size() const {
    if (type_ == Type::Array) return arrayValue_.size();
    if (type_ == Type::Object) return objectValue_.size();
    return 0;
}

const JSONValue& JSONValue::operator[](size_t index) const {
    if (type_ != Type::Array || index >= arrayValue_.size()) return Null();
    return arrayValue_[index];
}

void JSONValue::Push(JSONValue value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(std::move(value));
}

std::string JSONValue::ToJSON() const {
    std::ostringstream ss;
    WriteValue(ss, *this);
    return ss.str();
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    Parser parser(json);
    return parser.ParseDocument();
}

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.type_ != b.type_) return false;
    switch (a.type_) {
        case JSONValue::Type::Null: return true;
        case JSONValue::Type::Bool: return a.boolValue_ == b.boolValue_;
        case JSONValue::Type::Int: return a.intValue_ == b.intValue_;
        case JSONValue::Type::Double: return a.doubleValue_ == b.doubleValue_;
        case JSONValue::Type::String: return a.stringValue_ == b.stringValue_;
        case JSONValue::Type::Array: return a.arrayValue_ == b.arrayValue_;
        case JSONValue::Type::Object: return a.objectValue_ == b.objectValue_;
    }
    return false;
}

} // namespace rpc
} // namespace dogeprov
