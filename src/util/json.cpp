// CONCORD - JSON Value Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/util/json.h>

#include <cctype>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace concord {
namespace util {

namespace {

const JSONValue kNull;
const JSONValue::Array kEmptyArray;
const JSONValue::Object kEmptyObject;
const std::string kEmptyString;

/// Nesting limit for parsed documents
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
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    ss << buf;
                } else {
                    ss << c;
                }
        }
    }
    ss << '"';
}

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

// Recursive-descent parser. Every Parse* method leaves pos_ just past the
// value it consumed and returns nullopt on malformed input.
class Parser {
public:
    explicit Parser(const std::string& text) : text_(text) {}

    std::optional<JSONValue> ParseDocument() {
        auto value = ParseValue(0);
        if (!value) return std::nullopt;
        SkipWhitespace();
        if (pos_ != text_.size()) return std::nullopt;
        return value;
    }

    size_t Position() const { return pos_; }

private:
    void SkipWhitespace() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool Consume(const char* literal) {
        size_t len = std::char_traits<char>::length(literal);
        if (text_.compare(pos_, len, literal) != 0) return false;
        pos_ += len;
        return true;
    }

    std::optional<JSONValue> ParseValue(int depth) {
        if (depth > MAX_DEPTH) return std::nullopt;
        SkipWhitespace();
        if (pos_ >= text_.size()) return std::nullopt;

        char c = text_[pos_];
        if (c == '{') return ParseObject(depth);
        if (c == '[') return ParseArray(depth);
        if (c == '"') {
            auto str = ParseString();
            if (!str) return std::nullopt;
            return JSONValue(std::move(*str));
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return ParseNumber();
        if (Consume("true")) return JSONValue(true);
        if (Consume("false")) return JSONValue(false);
        if (Consume("null")) return JSONValue();
        return std::nullopt;
    }

    std::optional<uint32_t> ParseHex4() {
        if (pos_ + 4 > text_.size()) return std::nullopt;
        uint32_t cp = 0;
        for (int i = 0; i < 4; ++i) {
            char h = text_[pos_++];
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<uint32_t>(h - 'A' + 10);
            else return std::nullopt;
        }
        return cp;
    }

    std::optional<std::string> ParseString() {
        ++pos_;  // opening quote
        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) return std::nullopt;
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) return std::nullopt;
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
                    if (*cp >= 0xD800 && *cp <= 0xDBFF) {
                        if (!Consume("\\u")) return std::nullopt;
                        auto low = ParseHex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF) return std::nullopt;
                        *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                    }
                    AppendUtf8(out, *cp);
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
        bool isFloat = false;

        if (text_[pos_] == '-') ++pos_;
        if (pos_ >= text_.size() || !std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            return std::nullopt;
        }
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        if (pos_ < text_.size() && text_[pos_] == '.') {
            isFloat = true;
            ++pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            isFloat = true;
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        }

        std::string num = text_.substr(start, pos_ - start);
        try {
            if (isFloat) {
                return JSONValue(std::stod(num));
            }
            return JSONValue(static_cast<int64_t>(std::stoll(num)));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    std::optional<JSONValue> ParseArray(int depth) {
        ++pos_;  // '['
        JSONValue::Array arr;
        SkipWhitespace();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            ++pos_;
            return JSONValue(std::move(arr));
        }
        while (true) {
            auto value = ParseValue(depth + 1);
            if (!value) return std::nullopt;
            arr.push_back(std::move(*value));

            SkipWhitespace();
            if (pos_ >= text_.size()) return std::nullopt;
            char c = text_[pos_++];
            if (c == ']') return JSONValue(std::move(arr));
            if (c != ',') return std::nullopt;
        }
    }

    std::optional<JSONValue> ParseObject(int depth) {
        ++pos_;  // '{'
        JSONValue::Object obj;
        SkipWhitespace();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            ++pos_;
            return JSONValue(std::move(obj));
        }
        while (true) {
            SkipWhitespace();
            if (pos_ >= text_.size() || text_[pos_] != '"') return std::nullopt;
            auto key = ParseString();
            if (!key) return std::nullopt;

            SkipWhitespace();
            if (pos_ >= text_.size() || text_[pos_] != ':') return std::nullopt;
            ++pos_;

            auto value = ParseValue(depth + 1);
            if (!value) return std::nullopt;
            obj[*key] = std::move(*value);

            SkipWhitespace();
            if (pos_ >= text_.size()) return std::nullopt;
            char c = text_[pos_++];
            if (c == '}') return JSONValue(std::move(obj));
            if (c != ',') return std::nullopt;
        }
    }

    const std::string& text_;
    size_t pos_{0};
};

} // namespace

// ============================================================================
// Accessors
// ============================================================================

JSONValue JSONValue::FromStrings(const std::vector<std::string>& items) {
    Array arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.emplace_back(item);
    }
    return JSONValue(std::move(arr));
}

const JSONValue& JSONValue::Null() {
    return kNull;
}

bool JSONValue::GetBool(bool defaultValue) const {
    return type_ == Type::Bool ? boolValue_ : defaultValue;
}

int64_t JSONValue::GetInt(int64_t defaultValue) const {
    if (type_ == Type::Int) return intValue_;
    if (type_ == Type::Double && std::isfinite(doubleValue_)) {
        return static_cast<int64_t>(doubleValue_);
    }
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

std::string JSONValue::GetString(const std::string& defaultValue) const {
    return type_ == Type::String ? stringValue_ : defaultValue;
}

const JSONValue::Array& JSONValue::GetArray() const {
    return type_ == Type::Array ? arrayValue_ : kEmptyArray;
}

const JSONValue::Object& JSONValue::GetObject() const {
    return type_ == Type::Object ? objectValue_ : kEmptyObject;
}

std::vector<std::string> JSONValue::GetStrings() const {
    std::vector<std::string> out;
    for (const auto& item : GetArray()) {
        if (item.IsString()) {
            out.push_back(item.stringValue_);
        }
    }
    return out;
}

bool JSONValue::HasKey(const std::string& key) const {
    return type_ == Type::Object && objectValue_.count(key) > 0;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    if (type_ != Type::Object) return kNull;
    auto it = objectValue_.find(key);
    return it == objectValue_.end() ? kNull : it->second;
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
    if (type_ != Type::Array || index >= arrayValue_.size()) return kNull;
    return arrayValue_[index];
}

void JSONValue::Push(JSONValue value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(std::move(value));
}

bool JSONValue::operator==(const JSONValue& other) const {
    if (type_ != other.type_) return false;
    switch (type_) {
        case Type::Null: return true;
        case Type::Bool: return boolValue_ == other.boolValue_;
        case Type::Int: return intValue_ == other.intValue_;
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

std::string JSONValue::ToJSON(bool pretty, int indent) const {
    std::ostringstream ss;
    std::string indentStr(indent * 2, ' ');
    std::string childIndent((indent + 1) * 2, ' ');

    switch (type_) {
        case Type::Null:
            ss << "null";
            break;
        case Type::Bool:
            ss << (boolValue_ ? "true" : "false");
            break;
        case Type::Int:
            ss << intValue_;
            break;
        case Type::Double:
            if (std::isfinite(doubleValue_)) {
                ss << std::setprecision(15) << doubleValue_;
            } else {
                ss << "null";
            }
            break;
        case Type::String:
            WriteEscaped(ss, stringValue_);
            break;
        case Type::Array: {
            if (arrayValue_.empty()) {
                ss << "[]";
                break;
            }
            ss << '[';
            for (size_t i = 0; i < arrayValue_.size(); ++i) {
                if (i > 0) ss << ',';
                if (pretty) ss << '\n' << childIndent;
                ss << arrayValue_[i].ToJSON(pretty, indent + 1);
            }
            if (pretty) ss << '\n' << indentStr;
            ss << ']';
            break;
        }
        case Type::Object: {
            if (objectValue_.empty()) {
                ss << "{}";
                break;
            }
            ss << '{';
            bool first = true;
            for (const auto& [key, value] : objectValue_) {
                if (!first) ss << ',';
                first = false;
                if (pretty) ss << '\n' << childIndent;
                WriteEscaped(ss, key);
                ss << (pretty ? ": " : ":") << value.ToJSON(pretty, indent + 1);
            }
            if (pretty) ss << '\n' << indentStr;
            ss << '}';
            break;
        }
    }
    return ss.str();
}

JSONValue JSONValue::Parse(const std::string& json) {
    Parser parser(json);
    auto result = parser.ParseDocument();
    if (!result) {
        throw std::runtime_error("JSON parse error near offset " +
                                 std::to_string(parser.Position()));
    }
    return std::move(*result);
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    Parser parser(json);
    return parser.ParseDocument();
}

} // namespace util
} // namespace concord
