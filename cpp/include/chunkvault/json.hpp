#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chunkvault::json {

// Minimal JSON document model for manifests. Numbers keep their source text
// so 64-bit sizes survive without going through double.
class Value {
public:
    enum class Type { Null, Bool, Number, String, Array, Object };
    using Array = std::vector<Value>;
    using Object = std::vector<std::pair<std::string, Value>>;

    Value() = default;
    static Value MakeBool(bool value);
    static Value MakeUnsigned(std::uint64_t value);
    static Value MakeNumberText(std::string text);
    static Value MakeString(std::string value);
    static Value MakeArray(Array items = {});
    static Value MakeObject(Object members = {});

    Type type() const { return type_; }
    bool IsNull() const { return type_ == Type::Null; }

    // Accessors throw std::runtime_error on a type mismatch.
    bool AsBool() const;
    std::uint64_t AsUnsigned() const;
    const std::string& AsString() const;
    const Array& AsArray() const;
    const Object& AsObject() const;

    Array& MutableArray();
    // Appends or replaces `key`; insertion order is kept for output.
    void Set(const std::string& key, Value value);
    const Value* Find(std::string_view key) const;

private:
    Type type_ = Type::Null;
    bool bool_ = false;
    std::string text_;
    Array array_;
    Object object_;
};

// Throws std::runtime_error with the byte offset of the first problem.
Value Parse(std::string_view text);
std::string Serialize(const Value& value, int indent = 2);

}  // namespace chunkvault::json
