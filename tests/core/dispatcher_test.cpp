#include "respkv/core/dispatcher.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

namespace respkv::core::test {

using net::Value;

namespace {

// [BulkString...] request, the way clients send commands
Value cmd(std::initializer_list<std::string> parts) {
    std::vector<Value> items;
    for (const auto& part : parts) {
        items.push_back(Value::bulk_string(part));
    }
    return Value::array_value(std::move(items));
}

Value bulk(const std::string& s) {
    return Value::bulk_string(s);
}

Value err(const std::string& s) {
    return Value::error(s);
}

}  // namespace

class DispatcherTest : public ::testing::Test {
   protected:
    Value run(const Value& request) {
        return Dispatcher::handle(request, store_);
    }

    Store store_;
};

// Command routing

TEST_F(DispatcherTest, Ping) {
    EXPECT_EQ(run(cmd({"PING"})), Value::simple_string("PONG"));
}

TEST_F(DispatcherTest, PingIgnoresArguments) {
    EXPECT_EQ(run(cmd({"PING", "hello", "world"})), Value::simple_string("PONG"));
}

TEST_F(DispatcherTest, PingAsScalar) {
    EXPECT_EQ(run(bulk("ping")), Value::simple_string("PONG"));
    EXPECT_EQ(run(Value::simple_string("PING")), Value::simple_string("PONG"));
}

TEST_F(DispatcherTest, CommandNamesAreCaseInsensitive) {
    EXPECT_EQ(run(cmd({"sEt", "k", "v"})), Value::simple_string("OK"));
    EXPECT_EQ(run(cmd({"get", "k"})), bulk("v"));
}

TEST_F(DispatcherTest, SimpleStringArgumentsAccepted) {
    auto request = Value::array_value(
        {Value::simple_string("SET"), Value::simple_string("k"), Value::simple_string("v")});
    EXPECT_EQ(run(request), Value::simple_string("OK"));
    EXPECT_EQ(run(cmd({"GET", "k"})), bulk("v"));
}

TEST_F(DispatcherTest, UnknownCommand) {
    for (const char* name : {"FLUSHALL", "flushall", "FlushAll", "DEL"}) {
        EXPECT_EQ(run(cmd({name, "k"})), err("Invalid command")) << name;
    }
}

TEST_F(DispatcherTest, MalformedRequestShapes) {
    EXPECT_EQ(run(Value::integer_value(1)), err("Invalid command"));
    EXPECT_EQ(run(Value::null()), err("Invalid command"));
    EXPECT_EQ(run(Value::error("Unknown error")), err("Invalid command"));
    EXPECT_EQ(run(Value::array_value()), err("Invalid command"));
    EXPECT_EQ(run(Value::array_value({Value::integer_value(3), bulk("k")})),
              err("Invalid command"));
}

// SET / GET

TEST_F(DispatcherTest, SetThenGet) {
    EXPECT_EQ(run(cmd({"SET", "key1", "value1"})), Value::simple_string("OK"));
    EXPECT_EQ(run(cmd({"GET", "key1"})), bulk("value1"));
}

TEST_F(DispatcherTest, SetOverwrites) {
    (void)run(cmd({"SET", "k", "old"}));
    (void)run(cmd({"SET", "k", "new"}));
    EXPECT_EQ(run(cmd({"GET", "k"})), bulk("new"));
}

TEST_F(DispatcherTest, SetEmptyValue) {
    EXPECT_EQ(run(cmd({"SET", "k", ""})), Value::simple_string("OK"));
    EXPECT_EQ(run(cmd({"GET", "k"})), bulk(""));
}

TEST_F(DispatcherTest, SetTooManyArgumentsIsSyntaxError) {
    EXPECT_EQ(run(cmd({"SET", "key1", "value1", "value2"})), err("syntax error"));
    EXPECT_FALSE(store_.contains("key1"));
}

TEST_F(DispatcherTest, SetTooFewArgumentsIsArityError) {
    EXPECT_EQ(run(cmd({"SET", "key1"})), err("wrong number of arguments for 'set' command"));
    EXPECT_EQ(run(cmd({"SET"})), err("wrong number of arguments for 'set' command"));
}

TEST_F(DispatcherTest, SetErrorsAreDistinguishable) {
    EXPECT_NE(run(cmd({"SET", "k", "v", "x"})), run(cmd({"SET", "k"})));
}

TEST_F(DispatcherTest, SetNonStringArgumentsIsArityError) {
    auto request = Value::array_value({bulk("SET"), bulk("k"), Value::integer_value(5)});
    EXPECT_EQ(run(request), err("wrong number of arguments for 'set' command"));
}

TEST_F(DispatcherTest, SetAsScalarIsSyntaxError) {
    EXPECT_EQ(run(bulk("SET")), err("syntax error"));
}

TEST_F(DispatcherTest, SetReplacesHash) {
    (void)run(cmd({"HSET", "k", "f", "v"}));
    EXPECT_EQ(run(cmd({"SET", "k", "plain"})), Value::simple_string("OK"));
    EXPECT_EQ(run(cmd({"GET", "k"})), bulk("plain"));
}

TEST_F(DispatcherTest, GetMissingKeyIsNull) {
    EXPECT_EQ(run(cmd({"GET", "never_set"})), Value::null());
}

TEST_F(DispatcherTest, GetArity) {
    EXPECT_EQ(run(cmd({"GET"})), err("wrong number of arguments for 'get' command"));
    EXPECT_EQ(run(cmd({"GET", "key1", "key2"})), err("wrong number of arguments for 'get' command"));
}

TEST_F(DispatcherTest, GetNonStringKeyIsSyntaxError) {
    EXPECT_EQ(run(Value::array_value({bulk("GET"), Value::integer_value(1)})), err("syntax error"));
}

TEST_F(DispatcherTest, GetOnHashIsNull) {
    (void)run(cmd({"HSET", "h", "f", "v"}));
    EXPECT_EQ(run(cmd({"GET", "h"})), Value::null());
}

// HSET

TEST_F(DispatcherTest, HsetNewField) {
    EXPECT_EQ(run(cmd({"HSET", "new_hash", "field1", "value1"})), Value::integer_value(1));
}

TEST_F(DispatcherTest, HsetExistingFieldCountsZeroAndOverwrites) {
    EXPECT_EQ(run(cmd({"HSET", "h", "f1", "v1"})), Value::integer_value(1));
    EXPECT_EQ(run(cmd({"HSET", "h", "f1", "v2"})), Value::integer_value(0));
    EXPECT_EQ(run(cmd({"HGET", "h", "f1"})), bulk("v2"));
}

TEST_F(DispatcherTest, HsetMultiplePairs) {
    EXPECT_EQ(run(cmd({"HSET", "h", "f1", "v1", "f2", "v2"})), Value::integer_value(2));
}

TEST_F(DispatcherTest, HsetCountsOnlyNewFields) {
    (void)run(cmd({"HSET", "h", "f1", "v1"}));
    EXPECT_EQ(run(cmd({"HSET", "h", "f1", "x", "f2", "y", "f3", "z"})), Value::integer_value(2));
}

TEST_F(DispatcherTest, HsetRepeatedFieldInOneCall) {
    EXPECT_EQ(run(cmd({"HSET", "h", "f", "a", "f", "b"})), Value::integer_value(1));
    EXPECT_EQ(run(cmd({"HGET", "h", "f"})), bulk("b"));
}

TEST_F(DispatcherTest, HsetArity) {
    const Value expected = err("wrong number of arguments for 'hset' command");
    EXPECT_EQ(run(cmd({"HSET", "hash", "field"})), expected);
    EXPECT_EQ(run(cmd({"HSET", "hash", "field1", "value1", "field2"})), expected);
    EXPECT_EQ(run(cmd({"HSET"})), expected);
    EXPECT_EQ(run(bulk("HSET")), expected);
    EXPECT_FALSE(store_.contains("hash"));
}

TEST_F(DispatcherTest, HsetNonStringKeyIsArityError) {
    auto request = Value::array_value({bulk("HSET"), Value::integer_value(1), bulk("f"), bulk("v")});
    EXPECT_EQ(run(request), err("wrong number of arguments for 'hset' command"));
}

TEST_F(DispatcherTest, HsetOnStringKey) {
    (void)run(cmd({"SET", "s", "text"}));
    EXPECT_EQ(run(cmd({"HSET", "s", "f", "v"})), err("Key exists but value is not a map"));
    EXPECT_EQ(run(cmd({"GET", "s"})), bulk("text"));
}

TEST_F(DispatcherTest, HsetInvalidFieldType) {
    auto request = Value::array_value({bulk("HSET"), bulk("h"), Value::integer_value(1), bulk("v")});
    EXPECT_EQ(run(request), err("Invalid field type"));
}

TEST_F(DispatcherTest, HsetInvalidValueType) {
    auto request = Value::array_value({bulk("HSET"), bulk("h"), bulk("f"), Value::null()});
    EXPECT_EQ(run(request), err("Invalid value type"));
}

TEST_F(DispatcherTest, HsetKeepsPairsBeforeBadOne) {
    auto request = Value::array_value(
        {bulk("HSET"), bulk("h"), bulk("f1"), bulk("v1"), bulk("f2"), Value::integer_value(2)});
    EXPECT_EQ(run(request), err("Invalid value type"));

    // no rollback
    EXPECT_EQ(run(cmd({"HGET", "h", "f1"})), bulk("v1"));
    EXPECT_EQ(run(cmd({"HGET", "h", "f2"})), Value::null());
}

// HGET

TEST_F(DispatcherTest, HgetExistingField) {
    (void)run(cmd({"HSET", "existing_hash", "existing_field", "field_value"}));
    EXPECT_EQ(run(cmd({"HGET", "existing_hash", "existing_field"})), bulk("field_value"));
}

TEST_F(DispatcherTest, HgetMissingField) {
    (void)run(cmd({"HSET", "h", "f", "v"}));
    EXPECT_EQ(run(cmd({"HGET", "h", "other"})), Value::null());
}

TEST_F(DispatcherTest, HgetMissingKey) {
    EXPECT_EQ(run(cmd({"HGET", "nope", "f"})), Value::null());
}

TEST_F(DispatcherTest, HgetOnStringKeyIsWrongType) {
    (void)run(cmd({"SET", "string_key", "string_value"}));
    EXPECT_EQ(run(cmd({"HGET", "string_key", "f"})),
              err("WRONGTYPE Operation against a key holding the wrong kind of value"));
}

TEST_F(DispatcherTest, WrongTypeDiffersFromNotAMap) {
    (void)run(cmd({"SET", "s", "v"}));
    EXPECT_NE(run(cmd({"HGET", "s", "f"})), run(cmd({"HSET", "s", "f", "v"})));
}

TEST_F(DispatcherTest, HgetArity) {
    const Value expected = err("wrong number of arguments for 'hget' command");
    EXPECT_EQ(run(cmd({"HGET", "h"})), expected);
    EXPECT_EQ(run(cmd({"HGET", "h", "f", "extra"})), expected);
    EXPECT_EQ(run(bulk("HGET")), expected);
    EXPECT_EQ(run(Value::array_value({bulk("HGET"), bulk("h"), Value::integer_value(1)})), expected);
}

// HGETALL

TEST_F(DispatcherTest, HgetallReturnsAllPairs) {
    EXPECT_EQ(run(cmd({"HSET", "h", "f1", "v1", "f2", "v2"})), Value::integer_value(2));

    Value result = run(cmd({"HGETALL", "h"}));
    ASSERT_EQ(result.type, net::Type::Array);
    ASSERT_EQ(result.array.size(), 4u);

    // order is up to the container, compare as pairs
    std::map<std::string, std::string> pairs;
    for (size_t i = 0; i < result.array.size(); i += 2) {
        ASSERT_EQ(result.array[i].type, net::Type::BulkString);
        ASSERT_EQ(result.array[i + 1].type, net::Type::BulkString);
        pairs[result.array[i].str] = result.array[i + 1].str;
    }
    std::map<std::string, std::string> expected{{"f1", "v1"}, {"f2", "v2"}};
    EXPECT_EQ(pairs, expected);
}

TEST_F(DispatcherTest, HgetallMissingKeyIsEmptyArray) {
    EXPECT_EQ(run(cmd({"HGETALL", "missing"})), Value::array_value());
}

TEST_F(DispatcherTest, HgetallOnStringKeyIsEmptyArray) {
    (void)run(cmd({"SET", "s", "v"}));
    EXPECT_EQ(run(cmd({"HGETALL", "s"})), Value::array_value());
}

TEST_F(DispatcherTest, HgetallArity) {
    EXPECT_EQ(run(cmd({"HGETALL"})), err("wrong number of arguments for 'hgetall' command"));
    EXPECT_EQ(run(bulk("HGETALL")), err("wrong number of arguments for 'hgetall' command"));
}

TEST_F(DispatcherTest, HgetallNonStringKeyIsSyntaxError) {
    EXPECT_EQ(run(Value::array_value({bulk("HGETALL"), Value::array_value()})), err("syntax error"));
}

TEST_F(DispatcherTest, StoreIsPassedNotShared) {
    Store other;
    (void)Dispatcher::handle(cmd({"SET", "k", "v"}), other);

    EXPECT_EQ(run(cmd({"GET", "k"})), Value::null());
    EXPECT_EQ(Dispatcher::handle(cmd({"GET", "k"}), other), bulk("v"));
}

TEST(DispatcherErrorsTest, WrongArityText) {
    EXPECT_EQ(errors::wrong_arity("hgetall"), "wrong number of arguments for 'hgetall' command");
}

}  // namespace respkv::core::test
