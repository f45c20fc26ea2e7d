#ifndef RESPKV_CORE_DISPATCHER_HPP
#define RESPKV_CORE_DISPATCHER_HPP

#include <string>

#include "respkv/core/store.hpp"
#include "respkv/net/value.hpp"

namespace respkv::core {

/*
    Interprets a decoded request and runs it against a Store.

    Requests are an Array whose first element names the command, or a lone string naming a
    command with no arguments. Command names are case-insensitive. Every failure a client can
    cause comes back as an Error value; nothing here throws on bad input.

        PING                            -> +PONG
        SET key value                   -> +OK
        GET key                         -> bulk string, or null
        HSET key field value [f v ...]  -> number of fields that were new
        HGET key field                  -> bulk string, or null
        HGETALL key                     -> flat array of field, value pairs
*/
class Dispatcher {
   public:
    // static functions - no per-instance state, the store is the only thing that changes
    [[nodiscard]] static net::Value handle(const net::Value& request, Store& store);

   private:
    [[nodiscard]] static net::Value ping();
    [[nodiscard]] static net::Value set(const net::Value& request, Store& store);
    [[nodiscard]] static net::Value get(const net::Value& request, const Store& store);
    [[nodiscard]] static net::Value hset(const net::Value& request, Store& store);
    [[nodiscard]] static net::Value hget(const net::Value& request, const Store& store);
    [[nodiscard]] static net::Value hgetall(const net::Value& request, const Store& store);
};

// error texts, shared with the tests
namespace errors {
inline constexpr const char* kInvalidCommand = "Invalid command";
inline constexpr const char* kSyntax = "syntax error";
inline constexpr const char* kNotAMap = "Key exists but value is not a map";
inline constexpr const char* kInvalidField = "Invalid field type";
inline constexpr const char* kInvalidValue = "Invalid value type";
inline constexpr const char* kWrongType =
    "WRONGTYPE Operation against a key holding the wrong kind of value";

[[nodiscard]] std::string wrong_arity(const std::string& command);
}  // namespace errors

}  // namespace respkv::core

#endif
