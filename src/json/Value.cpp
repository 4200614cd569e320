#include "chunknet/json/Value.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace chunknet::json {

Value Value::make_object() {
    Value value;
    value.type = ValueType::Object;
    return value;
}

Value Value::make_array() {
    Value value;
    value.type = ValueType::Array;
    return value;
}

std::map<std::string, Value>& Value::ensure_object() {
    if (type != ValueType::Object) {
        type = ValueType::Object;
        object_value.clear();
        array_value.clear();
        string_value.clear();
    }
    return object_value;
}

std::vector<Value>& Value::ensure_array() {
    if (type != ValueType::Array) {
        type = ValueType::Array;
        array_value.clear();
        object_value.clear();
        string_value.clear();
    }
    return array_value;
}

const std::map<std::string, Value>& Value::as_object() const {
    static const std::map<std::string, Value> empty{};
    return type == ValueType::Object ? object_value : empty;
}

const std::vector<Value>& Value::as_array() const {
    static const std::vector<Value> empty{};
    return type == ValueType::Array ? array_value : empty;
}

const Value* Value::find(std::string_view key) const {
    if (type != ValueType::Object) {
        return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    return it == object_value.end() ? nullptr : &it->second;
}

Value& Value::set(std::string key, Value value) {
    auto& fields = ensure_object();
    auto& slot = fields[std::move(key)];
    slot = std::move(value);
    return slot;
}

Value& Value::push_back(Value value) {
    auto& elements = ensure_array();
    elements.push_back(std::move(value));
    return elements.back();
}

std::optional<std::string> Value::get_string(std::string_view key) const {
    const auto* member = find(key);
    if (!member || !member->is_string()) {
        return std::nullopt;
    }
    return member->string_value;
}

std::optional<std::int64_t> Value::get_int64(std::string_view key) const {
    const auto* member = find(key);
    if (!member) {
        return std::nullopt;
    }
    if (member->is_integer()) {
        return member->integer_value;
    }
    if (member->is_double() && std::floor(member->double_value) == member->double_value) {
        return static_cast<std::int64_t>(member->double_value);
    }
    return std::nullopt;
}

std::optional<bool> Value::get_bool(std::string_view key) const {
    const auto* member = find(key);
    if (!member || !member->is_boolean()) {
        return std::nullopt;
    }
    return member->boolean_value;
}

bool Value::operator==(const Value& other) const {
    if (is_number() && other.is_number() && type != other.type) {
        const double lhs = is_integer() ? static_cast<double>(integer_value) : double_value;
        const double rhs = other.is_integer() ? static_cast<double>(other.integer_value) : other.double_value;
        return lhs == rhs;
    }
    if (type != other.type) {
        return false;
    }
    switch (type) {
    case ValueType::Null:
        return true;
    case ValueType::Boolean:
        return boolean_value == other.boolean_value;
    case ValueType::Integer:
        return integer_value == other.integer_value;
    case ValueType::Double:
        return double_value == other.double_value;
    case ValueType::String:
        return string_value == other.string_value;
    case ValueType::Object:
        return object_value == other.object_value;
    case ValueType::Array:
        return array_value == other.array_value;
    }
    return false;
}

ParseError::ParseError(const std::string& message, std::size_t offset)
    : std::runtime_error(message + " at offset " + std::to_string(offset)),
      offset_(offset) {}

bool parse_floating_token(const char* begin, const char* end, double& value) {
    // std::from_chars for double is missing on some standard libraries.
    std::string buffer(begin, end);
    if (buffer.empty()) {
        return false;
    }
    char* parsed_end = nullptr;
    errno = 0;
    value = std::strtod(buffer.c_str(), &parsed_end);
    if (parsed_end != buffer.c_str() + buffer.size()) {
        return false;
    }
    return errno != ERANGE;
}

namespace {

constexpr std::size_t kMaxDepth = 256;

class Parser {
public:
    explicit Parser(std::string_view text) : text_(text) {}

    Value parse_document() {
        skip_whitespace();
        Value value = parse_value(0);
        skip_whitespace();
        if (!at_end()) {
            fail("Unexpected trailing content");
        }
        return value;
    }

private:
    std::string_view text_;
    std::size_t position_{0};

    [[noreturn]] void fail(const std::string& message) const {
        throw ParseError(message, position_);
    }

    bool at_end() const { return position_ >= text_.size(); }
    char peek() const { return at_end() ? '\0' : text_[position_]; }
    char get() { return at_end() ? '\0' : text_[position_++]; }

    void skip_whitespace() {
        while (!at_end()) {
            const char ch = peek();
            if (ch != ' ' && ch != '\n' && ch != '\r' && ch != '\t') {
                break;
            }
            ++position_;
        }
    }

    Value parse_value(std::size_t depth) {
        if (depth > kMaxDepth) {
            fail("Nesting too deep");
        }
        skip_whitespace();
        if (at_end()) {
            fail("Unexpected end of input");
        }
        const char ch = peek();
        switch (ch) {
        case '{':
            return parse_object(depth);
        case '[':
            return parse_array(depth);
        case '"':
            return Value(parse_string());
        case 't':
            expect_literal("true");
            return Value(true);
        case 'f':
            expect_literal("false");
            return Value(false);
        case 'n':
            expect_literal("null");
            return Value();
        default:
            break;
        }
        if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch))) {
            return parse_number();
        }
        fail(std::string("Unexpected character '") + ch + "'");
    }

    void expect_literal(std::string_view literal) {
        if (text_.substr(position_, literal.size()) != literal) {
            fail("Invalid literal");
        }
        position_ += literal.size();
    }

    Value parse_object(std::size_t depth) {
        Value object = Value::make_object();
        get();
        skip_whitespace();
        if (peek() == '}') {
            get();
            return object;
        }
        auto& fields = object.as_object();
        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                fail("Expected string key");
            }
            std::string key = parse_string();
            skip_whitespace();
            if (get() != ':') {
                fail("Expected ':' after key");
            }
            fields[std::move(key)] = parse_value(depth + 1);
            skip_whitespace();
            const char ch = get();
            if (ch == '}') {
                return object;
            }
            if (ch != ',') {
                fail("Expected ',' or '}' in object");
            }
        }
    }

    Value parse_array(std::size_t depth) {
        Value array = Value::make_array();
        get();
        skip_whitespace();
        if (peek() == ']') {
            get();
            return array;
        }
        auto& elements = array.as_array();
        while (true) {
            elements.push_back(parse_value(depth + 1));
            skip_whitespace();
            const char ch = get();
            if (ch == ']') {
                return array;
            }
            if (ch != ',') {
                fail("Expected ',' or ']' in array");
            }
        }
    }

    unsigned int parse_hex4() {
        if (position_ + 4 > text_.size()) {
            fail("Incomplete unicode escape");
        }
        unsigned int code = 0;
        for (int i = 0; i < 4; ++i) {
            const char ch = text_[position_++];
            code <<= 4;
            if (ch >= '0' && ch <= '9') {
                code += static_cast<unsigned int>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                code += 10u + static_cast<unsigned int>(ch - 'a');
            } else if (ch >= 'A' && ch <= 'F') {
                code += 10u + static_cast<unsigned int>(ch - 'A');
            } else {
                fail("Invalid hex digit in unicode escape");
            }
        }
        return code;
    }

    static void append_utf8(std::string& out, unsigned int code_point) {
        if (code_point <= 0x7F) {
            out.push_back(static_cast<char>(code_point));
        } else if (code_point <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code_point >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        } else if (code_point <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code_point >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code_point >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        }
    }

    std::string parse_string() {
        if (get() != '"') {
            fail("Expected opening quote");
        }
        std::string result;
        while (!at_end()) {
            const char ch = get();
            if (ch == '"') {
                return result;
            }
            if (ch != '\\') {
                if (static_cast<unsigned char>(ch) < 0x20) {
                    fail("Unescaped control character in string");
                }
                result.push_back(ch);
                continue;
            }
            const char esc = get();
            switch (esc) {
            case '"':
            case '\\':
            case '/':
                result.push_back(esc);
                break;
            case 'b':
                result.push_back('\b');
                break;
            case 'f':
                result.push_back('\f');
                break;
            case 'n':
                result.push_back('\n');
                break;
            case 'r':
                result.push_back('\r');
                break;
            case 't':
                result.push_back('\t');
                break;
            case 'u': {
                unsigned int code = parse_hex4();
                if (code >= 0xD800 && code <= 0xDBFF) {
                    if (get() != '\\' || get() != 'u') {
                        fail("Unpaired surrogate in unicode escape");
                    }
                    const unsigned int low = parse_hex4();
                    if (low < 0xDC00 || low > 0xDFFF) {
                        fail("Invalid low surrogate in unicode escape");
                    }
                    code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                }
                append_utf8(result, code);
                break;
            }
            default:
                fail("Unsupported escape sequence");
            }
        }
        fail("Unterminated string");
    }

    Value parse_number() {
        const std::size_t start = position_;
        if (peek() == '-') {
            ++position_;
        }
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            fail("Invalid number");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            ++position_;
        }
        bool fractional = false;
        if (peek() == '.') {
            fractional = true;
            ++position_;
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                ++position_;
            }
        }
        if (peek() == 'e' || peek() == 'E') {
            fractional = true;
            ++position_;
            if (peek() == '+' || peek() == '-') {
                ++position_;
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                ++position_;
            }
        }
        const char* begin = text_.data() + start;
        const char* end = text_.data() + position_;
        if (!fractional) {
            std::int64_t integer{};
            const auto result = std::from_chars(begin, end, integer);
            if (result.ec == std::errc{} && result.ptr == end) {
                return Value(integer);
            }
        }
        double floating{};
        if (!parse_floating_token(begin, end, floating)) {
            fail("Invalid number");
        }
        return Value(floating);
    }
};

void serialize_into(const Value& value, std::string& out) {
    switch (value.type) {
    case ValueType::Null:
        out += "null";
        break;
    case ValueType::Boolean:
        out += value.boolean_value ? "true" : "false";
        break;
    case ValueType::Integer:
        out += std::to_string(value.integer_value);
        break;
    case ValueType::Double: {
        if (!std::isfinite(value.double_value)) {
            out += "null";
            break;
        }
        std::ostringstream stream;
        stream << std::setprecision(17) << value.double_value;
        out += stream.str();
        break;
    }
    case ValueType::String:
        out.push_back('"');
        out += escape_string(value.string_value);
        out.push_back('"');
        break;
    case ValueType::Object: {
        out.push_back('{');
        bool first = true;
        for (const auto& [key, member] : value.object_value) {
            if (!first) {
                out.push_back(',');
            }
            first = false;
            out.push_back('"');
            out += escape_string(key);
            out += "\":";
            serialize_into(member, out);
        }
        out.push_back('}');
        break;
    }
    case ValueType::Array: {
        out.push_back('[');
        bool first = true;
        for (const auto& element : value.array_value) {
            if (!first) {
                out.push_back(',');
            }
            first = false;
            serialize_into(element, out);
        }
        out.push_back(']');
        break;
    }
    }
}

}  // namespace

Value parse(std::string_view text) {
    return Parser(text).parse_document();
}

std::string serialize(const Value& value) {
    std::string out;
    serialize_into(value, out);
    return out;
}

std::string escape_string(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size() + 8);
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
                std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(static_cast<unsigned char>(ch)));
                escaped += buffer;
            } else {
                escaped.push_back(ch);
            }
            break;
        }
    }
    return escaped;
}

}  // namespace chunknet::json
