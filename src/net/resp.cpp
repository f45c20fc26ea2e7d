#include "respkv/net/resp.hpp"

#include <algorithm>
#include <charconv>
#include <utility>
#include <vector>

namespace respkv::net {

namespace {

constexpr char kSimpleString = '+';
constexpr char kError = '-';
constexpr char kInteger = ':';
constexpr char kBulkString = '$';
constexpr char kArray = '*';
constexpr std::string_view kCrlf = "\r\n";

// cap on up-front allocation, a hostile "*1000000" header should not reserve a megabyte of values
constexpr std::size_t kMaxReserve = 1024;

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

}  // namespace

int64_t parse_integer(std::string_view text) {
    std::string_view digits = trim(text);
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) {
        throw IoError("invalid integer: '" + std::string(text) + "'");
    }
    return value;
}

// DECODE -----------------------------------------------------------------------------------------

RespReader::RespReader(ByteReader& input, DecodeLimits limits) : input_(input), limits_(limits) {}

std::optional<Value> RespReader::read() {
    raw_.clear();
    auto line = input_.read_line();
    if (!line) {
        return std::nullopt;
    }
    raw_ += *line;
    raw_ += kCrlf;
    return read_value(*line, 0);
}

std::string RespReader::next_line() {
    auto line = input_.read_line();
    if (!line) {
        throw IoError("input ended mid-message");
    }
    raw_ += *line;
    raw_ += kCrlf;
    return std::move(*line);
}

Value RespReader::read_value(const std::string& line, std::size_t depth) {
    if (line.empty()) {
        return Value::error("Unknown error");
    }

    std::string_view rest = std::string_view(line).substr(1);
    switch (line.front()) {
        case kSimpleString:
            return Value::simple_string(std::string(rest));
        case kError:
            return Value::error(std::string(rest));
        case kInteger:
            return Value::integer_value(parse_integer(rest));
        case kBulkString:
            return read_bulk_string(rest);
        case kArray:
            return read_array(rest, depth);
        default:
            return Value::error("Unknown error");
    }
}

Value RespReader::read_bulk_string(std::string_view header) {
    int64_t length = parse_integer(header);
    if (length == -1) {
        return Value::null();
    }
    if (length < 0) {
        throw IoError("invalid bulk length: " + std::to_string(length));
    }
    if (static_cast<uint64_t>(length) > limits_.max_bulk_length) {
        throw IoError("bulk length " + std::to_string(length) + " exceeds limit of " +
                      std::to_string(limits_.max_bulk_length));
    }

    std::string payload = input_.read_exact(static_cast<std::size_t>(length));
    std::string terminator = input_.read_exact(kCrlf.size());
    raw_ += payload;
    raw_ += terminator;
    if (terminator != kCrlf) {
        throw IoError("bulk string of declared length " + std::to_string(length) +
                      " not followed by CRLF");
    }
    return Value::bulk_string(std::move(payload));
}

Value RespReader::read_array(std::string_view header, std::size_t depth) {
    int64_t count = parse_integer(header);
    if (count < 0) {
        throw IoError("invalid array count: " + std::to_string(count));
    }
    if (static_cast<uint64_t>(count) > limits_.max_array_length) {
        throw IoError("array count " + std::to_string(count) + " exceeds limit of " +
                      std::to_string(limits_.max_array_length));
    }
    if (depth >= kMaxNestingDepth) {
        throw IoError("arrays nested deeper than " + std::to_string(kMaxNestingDepth));
    }

    std::vector<Value> items;
    items.reserve(std::min(static_cast<std::size_t>(count), kMaxReserve));
    for (int64_t i = 0; i < count; ++i) {
        std::string line = next_line();
        items.push_back(read_value(line, depth + 1));
    }
    return Value::array_value(std::move(items));
}

// ENCODE -----------------------------------------------------------------------------------------

std::string RespEncoder::encode(const Value& value) {
    std::string out;
    encode_into(value, out);
    return out;
}

void RespEncoder::encode_into(const Value& value, std::string& out) {
    switch (value.type) {
        case Type::SimpleString:
            out += kSimpleString;
            out += value.str;
            out += kCrlf;
            break;
        case Type::Error:
            // the tag is always injected, even when the text already carries one
            out += kError;
            out += "ERR ";
            out += value.str;
            out += kCrlf;
            break;
        case Type::Integer:
            out += kInteger;
            out += std::to_string(value.integer);
            out += kCrlf;
            break;
        case Type::BulkString:
            out += kBulkString;
            out += std::to_string(value.str.size());
            out += kCrlf;
            out += value.str;
            out += kCrlf;
            break;
        case Type::Array:
            out += kArray;
            out += std::to_string(value.array.size());
            out += kCrlf;
            for (const auto& item : value.array) {
                encode_into(item, out);
            }
            break;
        case Type::Null:
            out += "$-1";
            out += kCrlf;
            break;
    }
}

void RespEncoder::write(const Value& value, ByteWriter& out) {
    out.write(encode(value));
}

}  // namespace respkv::net
