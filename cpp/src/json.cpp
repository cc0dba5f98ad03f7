#include "chunkvault/json.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace chunkvault::json {

namespace {

const char* TypeName(Value::Type type) {
    switch (type) {
        case Value::Type::Null:
            return "null";
        case Value::Type::Bool:
            return "bool";
        case Value::Type::Number:
            return "number";
        case Value::Type::String:
            return "string";
        case Value::Type::Array:
            return "array";
        case Value::Type::Object:
            return "object";
    }
    return "unknown";
}

void Expect(const Value& value, Value::Type type) {
    if (value.type() != type) {
        throw std::runtime_error(std::string("JSON type mismatch: expected ") + TypeName(type) + ", got "
                                 + TypeName(value.type()));
    }
}

void AppendUtf8(std::string& out, std::uint32_t cp) {
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

class Parser {
public:
    explicit Parser(std::string_view text) : text_(text) {}

    Value ParseDocument() {
        Value value = ParseValue(0);
        SkipSpace();
        if (pos_ != text_.size()) {
            Fail("trailing characters");
        }
        return value;
    }

private:
    static constexpr int kMaxDepth = 64;

    [[noreturn]] void Fail(const std::string& what) const {
        throw std::runtime_error("JSON parse error at offset " + std::to_string(pos_) + ": " + what);
    }

    void SkipSpace() {
        while (pos_ < text_.size() && (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n'
                                       || text_[pos_] == '\r')) {
            ++pos_;
        }
    }

    char Peek() {
        SkipSpace();
        if (pos_ >= text_.size()) {
            Fail("unexpected end of input");
        }
        return text_[pos_];
    }

    void Consume(char expected) {
        if (Peek() != expected) {
            Fail(std::string("expected '") + expected + "'");
        }
        ++pos_;
    }

    void ConsumeLiteral(std::string_view literal) {
        if (text_.substr(pos_, literal.size()) != literal) {
            Fail("invalid literal");
        }
        pos_ += literal.size();
    }

    Value ParseValue(int depth) {
        if (depth > kMaxDepth) {
            Fail("nesting too deep");
        }
        char ch = Peek();
        switch (ch) {
            case '{':
                return ParseObject(depth);
            case '[':
                return ParseArray(depth);
            case '"':
                return Value::MakeString(ParseString());
            case 't':
                ConsumeLiteral("true");
                return Value::MakeBool(true);
            case 'f':
                ConsumeLiteral("false");
                return Value::MakeBool(false);
            case 'n':
                ConsumeLiteral("null");
                return Value();
            default:
                if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch))) {
                    return ParseNumber();
                }
                Fail(std::string("unexpected character '") + ch + "'");
        }
    }

    Value ParseObject(int depth) {
        Consume('{');
        Value out = Value::MakeObject();
        if (Peek() == '}') {
            ++pos_;
            return out;
        }
        while (true) {
            if (Peek() != '"') {
                Fail("expected object key");
            }
            std::string key = ParseString();
            Consume(':');
            if (out.Find(key) != nullptr) {
                Fail("duplicate key '" + key + "'");
            }
            out.Set(key, ParseValue(depth + 1));
            char next = Peek();
            ++pos_;
            if (next == '}') {
                return out;
            }
            if (next != ',') {
                --pos_;
                Fail("expected ',' or '}'");
            }
        }
    }

    Value ParseArray(int depth) {
        Consume('[');
        Value out = Value::MakeArray();
        if (Peek() == ']') {
            ++pos_;
            return out;
        }
        while (true) {
            out.MutableArray().push_back(ParseValue(depth + 1));
            char next = Peek();
            ++pos_;
            if (next == ']') {
                return out;
            }
            if (next != ',') {
                --pos_;
                Fail("expected ',' or ']'");
            }
        }
    }

    std::uint32_t ParseHex4() {
        if (pos_ + 4 > text_.size()) {
            Fail("truncated unicode escape");
        }
        std::uint32_t cp = 0;
        for (int i = 0; i < 4; ++i) {
            char ch = text_[pos_++];
            cp <<= 4;
            if (ch >= '0' && ch <= '9') {
                cp |= static_cast<std::uint32_t>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                cp |= static_cast<std::uint32_t>(ch - 'a' + 10);
            } else if (ch >= 'A' && ch <= 'F') {
                cp |= static_cast<std::uint32_t>(ch - 'A' + 10);
            } else {
                Fail("invalid unicode escape");
            }
        }
        return cp;
    }

    std::string ParseString() {
        Consume('"');
        std::string out;
        while (true) {
            if (pos_ >= text_.size()) {
                Fail("unterminated string");
            }
            char ch = text_[pos_++];
            if (ch == '"') {
                return out;
            }
            if (static_cast<unsigned char>(ch) < 0x20) {
                Fail("control character in string");
            }
            if (ch != '\\') {
                out.push_back(ch);
                continue;
            }
            if (pos_ >= text_.size()) {
                Fail("unterminated escape");
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"':
                case '\\':
                case '/':
                    out.push_back(esc);
                    break;
                case 'b':
                    out.push_back('\b');
                    break;
                case 'f':
                    out.push_back('\f');
                    break;
                case 'n':
                    out.push_back('\n');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'u': {
                    std::uint32_t cp = ParseHex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (text_.substr(pos_, 2) != "\\u") {
                            Fail("unpaired surrogate");
                        }
                        pos_ += 2;
                        std::uint32_t low = ParseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) {
                            Fail("invalid low surrogate");
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        Fail("unpaired surrogate");
                    }
                    AppendUtf8(out, cp);
                    break;
                }
                default:
                    Fail("invalid escape");
            }
        }
    }

    Value ParseNumber() {
        std::size_t start = pos_;
        if (text_[pos_] == '-') {
            ++pos_;
        }
        auto digits = [&]() {
            std::size_t first = pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                ++pos_;
            }
            if (pos_ == first) {
                Fail("malformed number");
            }
        };
        digits();
        if (pos_ < text_.size() && text_[pos_] == '.') {
            ++pos_;
            digits();
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) {
                ++pos_;
            }
            digits();
        }
        return Value::MakeNumberText(std::string(text_.substr(start, pos_ - start)));
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

void WriteEscaped(std::string& out, const std::string& value) {
    static const char kHex[] = "0123456789abcdef";
    out.push_back('"');
    for (char ch : value) {
        unsigned char uch = static_cast<unsigned char>(ch);
        switch (ch) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (uch < 0x20) {
                    out += "\\u00";
                    out.push_back(kHex[uch >> 4]);
                    out.push_back(kHex[uch & 0x0F]);
                } else {
                    out.push_back(ch);
                }
        }
    }
    out.push_back('"');
}

void Newline(std::string& out, int indent, int depth) {
    if (indent <= 0) {
        return;
    }
    out.push_back('\n');
    out.append(static_cast<std::size_t>(indent * depth), ' ');
}

void Write(std::string& out, const Value& value, int indent, int depth) {
    switch (value.type()) {
        case Value::Type::Null:
            out += "null";
            return;
        case Value::Type::Bool:
            out += value.AsBool() ? "true" : "false";
            return;
        case Value::Type::Number:
        case Value::Type::String:
            break;
        case Value::Type::Array: {
            const Value::Array& items = value.AsArray();
            out.push_back('[');
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (i > 0) {
                    out.push_back(',');
                }
                Newline(out, indent, depth + 1);
                Write(out, items[i], indent, depth + 1);
            }
            if (!items.empty()) {
                Newline(out, indent, depth);
            }
            out.push_back(']');
            return;
        }
        case Value::Type::Object: {
            const Value::Object& members = value.AsObject();
            out.push_back('{');
            for (std::size_t i = 0; i < members.size(); ++i) {
                if (i > 0) {
                    out.push_back(',');
                }
                Newline(out, indent, depth + 1);
                WriteEscaped(out, members[i].first);
                out += indent > 0 ? ": " : ":";
                Write(out, members[i].second, indent, depth + 1);
            }
            if (!members.empty()) {
                Newline(out, indent, depth);
            }
            out.push_back('}');
            return;
        }
    }
    if (value.type() == Value::Type::String) {
        WriteEscaped(out, value.AsString());
    } else {
        out += value.AsString();
    }
}

}  // namespace

Value Value::MakeBool(bool value) {
    Value out;
    out.type_ = Type::Bool;
    out.bool_ = value;
    return out;
}

Value Value::MakeUnsigned(std::uint64_t value) {
    return MakeNumberText(std::to_string(value));
}

Value Value::MakeNumberText(std::string text) {
    Value out;
    out.type_ = Type::Number;
    out.text_ = std::move(text);
    return out;
}

Value Value::MakeString(std::string value) {
    Value out;
    out.type_ = Type::String;
    out.text_ = std::move(value);
    return out;
}

Value Value::MakeArray(Array items) {
    Value out;
    out.type_ = Type::Array;
    out.array_ = std::move(items);
    return out;
}

Value Value::MakeObject(Object members) {
    Value out;
    out.type_ = Type::Object;
    out.object_ = std::move(members);
    return out;
}

bool Value::AsBool() const {
    Expect(*this, Type::Bool);
    return bool_;
}

std::uint64_t Value::AsUnsigned() const {
    Expect(*this, Type::Number);
    std::uint64_t value = 0;
    for (char ch : text_) {
        if (ch < '0' || ch > '9') {
            throw std::runtime_error("JSON number '" + text_ + "' is not an unsigned integer");
        }
        std::uint64_t digit = static_cast<std::uint64_t>(ch - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            throw std::runtime_error("JSON number '" + text_ + "' is out of range");
        }
        value = value * 10 + digit;
    }
    return value;
}

const std::string& Value::AsString() const {
    if (type_ != Type::Number) {
        Expect(*this, Type::String);
    }
    return text_;
}

const Value::Array& Value::AsArray() const {
    Expect(*this, Type::Array);
    return array_;
}

const Value::Object& Value::AsObject() const {
    Expect(*this, Type::Object);
    return object_;
}

Value::Array& Value::MutableArray() {
    Expect(*this, Type::Array);
    return array_;
}

void Value::Set(const std::string& key, Value value) {
    Expect(*this, Type::Object);
    for (auto& member : object_) {
        if (member.first == key) {
            member.second = std::move(value);
            return;
        }
    }
    object_.emplace_back(key, std::move(value));
}

const Value* Value::Find(std::string_view key) const {
    if (type_ != Type::Object) {
        return nullptr;
    }
    for (const auto& member : object_) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

Value Parse(std::string_view text) {
    return Parser(text).ParseDocument();
}

std::string Serialize(const Value& value, int indent) {
    std::string out;
    Write(out, value, indent, 0);
    if (indent > 0) {
        out.push_back('\n');
    }
    return out;
}

}  // namespace chunkvault::json
