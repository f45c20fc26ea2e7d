#include "respkv/net/value.hpp"

#include <utility>

namespace respkv::net {

std::string quote(std::string_view text) {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
            case '\r':
                out += "\\r";
                break;
            case '\n':
                out += "\\n";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            default:
                out += c;
        }
    }
    out += '"';
    return out;
}

Value Value::simple_string(std::string text) {
    Value v;
    v.type = Type::SimpleString;
    v.str = std::move(text);
    return v;
}

Value Value::error(std::string text) {
    Value v;
    v.type = Type::Error;
    v.str = std::move(text);
    return v;
}

Value Value::integer_value(int64_t n) {
    Value v;
    v.type = Type::Integer;
    v.integer = n;
    return v;
}

Value Value::bulk_string(std::string text) {
    Value v;
    v.type = Type::BulkString;
    v.str = std::move(text);
    return v;
}

Value Value::array_value(std::vector<Value> items) {
    Value v;
    v.type = Type::Array;
    v.array = std::move(items);
    return v;
}

Value Value::null() {
    return Value{};
}

bool Value::is_string_like() const noexcept {
    return type == Type::SimpleString || type == Type::BulkString;
}

std::string Value::describe() const {
    switch (type) {
        case Type::SimpleString:
        case Type::Error:
        case Type::BulkString:
            return std::string(type_name(type)) + "(" + quote(str) + ")";
        case Type::Integer:
            return "Integer(" + std::to_string(integer) + ")";
        case Type::Array: {
            std::string out = "Array[";
            for (size_t i = 0; i < array.size(); ++i) {
                if (i > 0) out += ", ";
                out += array[i].describe();
            }
            out += "]";
            return out;
        }
        case Type::Null:
            return "Null";
    }
    return "Unknown";
}

bool Value::operator==(const Value& other) const {
    if (type != other.type) {
        return false;
    }
    switch (type) {
        case Type::SimpleString:
        case Type::Error:
        case Type::BulkString:
            return str == other.str;
        case Type::Integer:
            return integer == other.integer;
        case Type::Array:
            return array == other.array;
        case Type::Null:
            return true;
    }
    return false;
}

std::string_view type_name(Type type) noexcept {
    switch (type) {
        case Type::SimpleString:
            return "SimpleString";
        case Type::Error:
            return "Error";
        case Type::Integer:
            return "Integer";
        case Type::BulkString:
            return "BulkString";
        case Type::Array:
            return "Array";
        case Type::Null:
            return "Null";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << value.describe();
}

}  // namespace respkv::net
