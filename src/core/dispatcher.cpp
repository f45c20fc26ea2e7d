#include "respkv/core/dispatcher.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include <variant>
#include <vector>

namespace respkv::core {

using net::Type;
using net::Value;

namespace {

std::string to_upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

bool is_array(const Value& request) {
    return request.type == Type::Array;
}

}  // namespace

namespace errors {
std::string wrong_arity(const std::string& command) {
    return "wrong number of arguments for '" + command + "' command";
}
}  // namespace errors

Value Dispatcher::handle(const Value& request, Store& store) {
    const Value* name = nullptr;
    if (request.is_string_like()) {
        name = &request;
    } else if (is_array(request) && !request.array.empty() &&
               request.array.front().is_string_like()) {
        name = &request.array.front();
    }
    if (name == nullptr) {
        return Value::error(errors::kInvalidCommand);
    }

    std::string command = to_upper(name->str);
    if (command == "PING") return ping();
    if (command == "SET") return set(request, store);
    if (command == "GET") return get(request, store);
    if (command == "HSET") return hset(request, store);
    if (command == "HGET") return hget(request, store);
    if (command == "HGETALL") return hgetall(request, store);
    return Value::error(errors::kInvalidCommand);
}

Value Dispatcher::ping() {
    return Value::simple_string("PONG");
}

// SET key value
Value Dispatcher::set(const Value& request, Store& store) {
    if (!is_array(request)) {
        return Value::error(errors::kSyntax);
    }
    const auto& args = request.array;
    // extra arguments (SET options) are a syntax error, missing ones an arity error
    if (args.size() > 3) {
        return Value::error(errors::kSyntax);
    }
    if (args.size() != 3 || !args[1].is_string_like() || !args[2].is_string_like()) {
        return Value::error(errors::wrong_arity("set"));
    }

    store.set(args[1].str, args[2].str);
    return Value::simple_string("OK");
}

// GET key
Value Dispatcher::get(const Value& request, const Store& store) {
    if (!is_array(request)) {
        return Value::error(errors::kSyntax);
    }
    const auto& args = request.array;
    if (args.size() != 2) {
        return Value::error(errors::wrong_arity("get"));
    }
    if (!args[1].is_string_like()) {
        return Value::error(errors::kSyntax);
    }

    const StoredValue* stored = store.find(args[1].str);
    if (stored == nullptr) {
        return Value::null();
    }
    // a hash under the key reads as null, not WRONGTYPE
    if (const auto* text = std::get_if<std::string>(stored)) {
        return Value::bulk_string(*text);
    }
    return Value::null();
}

// HSET key field value [field value ...]
Value Dispatcher::hset(const Value& request, Store& store) {
    if (!is_array(request)) {
        return Value::error(errors::wrong_arity("hset"));
    }
    const auto& args = request.array;
    if (args.size() < 4 || args.size() % 2 != 0 || !args[1].is_string_like()) {
        return Value::error(errors::wrong_arity("hset"));
    }

    Hash* hash = store.get_or_create_hash(args[1].str);
    if (hash == nullptr) {
        return Value::error(errors::kNotAMap);
    }

    // pairs are applied as they are validated: a bad pair leaves the earlier ones written
    int64_t new_fields = 0;
    for (std::size_t i = 2; i + 1 < args.size(); i += 2) {
        const Value& field = args[i];
        const Value& value = args[i + 1];
        if (!field.is_string_like()) {
            return Value::error(errors::kInvalidField);
        }
        if (!value.is_string_like()) {
            return Value::error(errors::kInvalidValue);
        }
        bool inserted = hash->insert_or_assign(field.str, value.str).second;
        if (inserted) {
            ++new_fields;
        }
    }

    return Value::integer_value(new_fields);
}

// HGET key field
Value Dispatcher::hget(const Value& request, const Store& store) {
    if (!is_array(request)) {
        return Value::error(errors::wrong_arity("hget"));
    }
    const auto& args = request.array;
    if (args.size() != 3 || !args[1].is_string_like() || !args[2].is_string_like()) {
        return Value::error(errors::wrong_arity("hget"));
    }

    const StoredValue* stored = store.find(args[1].str);
    if (stored == nullptr) {
        return Value::null();
    }
    const auto* hash = std::get_if<Hash>(stored);
    if (hash == nullptr) {
        return Value::error(errors::kWrongType);
    }
    auto it = hash->find(args[2].str);
    if (it == hash->end()) {
        return Value::null();
    }
    return Value::bulk_string(it->second);
}

// HGETALL key
Value Dispatcher::hgetall(const Value& request, const Store& store) {
    if (!is_array(request)) {
        return Value::error(errors::wrong_arity("hgetall"));
    }
    const auto& args = request.array;
    if (args.size() < 2) {
        return Value::error(errors::wrong_arity("hgetall"));
    }
    if (!args[1].is_string_like()) {
        return Value::error(errors::kSyntax);
    }

    std::vector<Value> items;
    const StoredValue* stored = store.find(args[1].str);
    // missing key or a string: empty array, never null or an error
    if (const auto* hash = stored ? std::get_if<Hash>(stored) : nullptr) {
        items.reserve(hash->size() * 2);
        for (const auto& [field, value] : *hash) {
            items.push_back(Value::bulk_string(field));
            items.push_back(Value::bulk_string(value));
        }
    }
    return Value::array_value(std::move(items));
}

}  // namespace respkv::core
