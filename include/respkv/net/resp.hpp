#ifndef RESPKV_NET_RESP_HPP
#define RESPKV_NET_RESP_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "respkv/net/io.hpp"
#include "respkv/net/value.hpp"

namespace respkv::net {

struct DecodeLimits {
    std::size_t max_bulk_length = 512 * 1024 * 1024;  // same ceiling redis uses
    std::size_t max_array_length = 1024 * 1024;
};

/*
    Decodes RESP values off a ByteReader.

    +text        SimpleString
    -text        Error
    :n           Integer
    $len ..      BulkString of exactly len bytes followed by CRLF, $-1 is Null
    *n ..        Array of n values, decoded recursively
    <other>      Error("Unknown error") value, not an exception

    Malformed numbers, exceeded limits and truncated input throw IoError.
*/
class RespReader {
   public:
    explicit RespReader(ByteReader& input, DecodeLimits limits = {});

    // one complete value, nullopt when the input ends cleanly before a new message
    [[nodiscard]] std::optional<Value> read();

    // bytes of the last message read (line terminators normalized to CRLF)
    [[nodiscard]] const std::string& raw_data() const noexcept { return raw_; }

    static constexpr std::size_t kMaxNestingDepth = 512;

   private:
    [[nodiscard]] Value read_value(const std::string& line, std::size_t depth);
    [[nodiscard]] Value read_bulk_string(std::string_view header);
    [[nodiscard]] Value read_array(std::string_view header, std::size_t depth);

    // a line inside a message, where end of input is an error
    [[nodiscard]] std::string next_line();

    ByteReader& input_;
    DecodeLimits limits_;
    std::string raw_;
};

class RespEncoder {
   public:
    [[nodiscard]] static std::string encode(const Value& value);
    static void encode_into(const Value& value, std::string& out);
    static void write(const Value& value, ByteWriter& out);
};

// signed 64-bit decimal, surrounding whitespace allowed. throws IoError
[[nodiscard]] int64_t parse_integer(std::string_view text);

}  // namespace respkv::net

#endif
