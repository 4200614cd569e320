#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace chunknet::json {

enum class ValueType {
    Null,
    Boolean,
    Integer,
    Double,
    String,
    Object,
    Array
};

struct Value {
    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    double double_value{0.0};
    std::string string_value;
    std::map<std::string, Value> object_value;
    std::vector<Value> array_value;

    Value() = default;
    explicit Value(bool value) : type(ValueType::Boolean), boolean_value(value) {}
    explicit Value(int value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(std::int64_t value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(std::uint64_t value)
        : type(ValueType::Integer), integer_value(static_cast<std::int64_t>(value)) {}
    explicit Value(double value) : type(ValueType::Double), double_value(value) {}
    explicit Value(std::string value) : type(ValueType::String), string_value(std::move(value)) {}
    Value(const char* value) : Value(std::string(value)) {}

    static Value make_object();
    static Value make_array();

    bool is_null() const { return type == ValueType::Null; }
    bool is_boolean() const { return type == ValueType::Boolean; }
    bool is_integer() const { return type == ValueType::Integer; }
    bool is_double() const { return type == ValueType::Double; }
    bool is_number() const { return is_integer() || is_double(); }
    bool is_string() const { return type == ValueType::String; }
    bool is_object() const { return type == ValueType::Object; }
    bool is_array() const { return type == ValueType::Array; }

    std::map<std::string, Value>& ensure_object();
    std::vector<Value>& ensure_array();

    const std::map<std::string, Value>& as_object() const;
    std::map<std::string, Value>& as_object() { return ensure_object(); }
    const std::vector<Value>& as_array() const;
    std::vector<Value>& as_array() { return ensure_array(); }

    // Object member lookup; nullptr when absent or when this is not an object.
    const Value* find(std::string_view key) const;
    Value& set(std::string key, Value value);
    Value& push_back(Value value);

    std::optional<std::string> get_string(std::string_view key) const;
    std::optional<std::int64_t> get_int64(std::string_view key) const;
    std::optional<bool> get_bool(std::string_view key) const;

    bool operator==(const Value& other) const;
};

class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, std::size_t offset);

    std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

Value parse(std::string_view text);

// Compact JSON; non-ASCII bytes pass through untouched.
std::string serialize(const Value& value);
std::string escape_string(std::string_view text);

bool parse_floating_token(const char* begin, const char* end, double& value);

}  // namespace chunknet::json
