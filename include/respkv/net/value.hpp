#ifndef RESPKV_NET_VALUE_HPP
#define RESPKV_NET_VALUE_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace respkv::net {

enum class Type : uint8_t {
    SimpleString,
    Error,
    Integer,
    BulkString,
    Array,
    Null,
};

// wire-level tagged value, used for requests and responses alike.
// only the member matching `type` is meaningful:
//   SimpleString, Error, BulkString -> str
//   Integer                         -> integer
//   Array                           -> array
struct Value {
    Type type = Type::Null;
    std::string str;
    int64_t integer = 0;
    std::vector<Value> array;

    static Value simple_string(std::string text);
    static Value error(std::string text);
    static Value integer_value(int64_t n);
    static Value bulk_string(std::string text);
    static Value array_value(std::vector<Value> items = {});
    static Value null();

    // SimpleString or BulkString
    [[nodiscard]] bool is_string_like() const noexcept;
    [[nodiscard]] bool is_null() const noexcept { return type == Type::Null; }
    [[nodiscard]] bool is_error() const noexcept { return type == Type::Error; }

    // debug rendering, e.g. Array[BulkString("GET"), BulkString("k")]
    [[nodiscard]] std::string describe() const;

    bool operator==(const Value& other) const;
};

[[nodiscard]] std::string_view type_name(Type type) noexcept;

// double-quoted with CR, LF, quotes and backslashes escaped, for logs
[[nodiscard]] std::string quote(std::string_view text);

// gtest picks this up for failure messages
std::ostream& operator<<(std::ostream& os, const Value& value);

}  // namespace respkv::net

#endif
