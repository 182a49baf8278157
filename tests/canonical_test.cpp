#include "moltbridge/canonical.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "moltbridge/errors.hpp"

using nlohmann::json;
using MoltBridge::canonicalize;

TEST(CanonicalTest, KeyOrderDoesNotMatter) {
    json a = json::parse(R"({"b":2,"a":1,"c":{"y":true,"x":null}})");
    json b = json::parse(R"({"c":{"x":null,"y":true},"a":1,"b":2})");

    ASSERT_EQ(canonicalize(a), canonicalize(b));
    ASSERT_EQ(canonicalize(a), R"({"a":1,"b":2,"c":{"x":null,"y":true}})");
}

TEST(CanonicalTest, KeysSortByByteValue) {
    json value = {{"b", 1}, {"B", 2}, {"_", 3}, {"a", 4}};
    ASSERT_EQ(canonicalize(value), R"({"B":2,"_":3,"a":4,"b":1})");
}

TEST(CanonicalTest, ArraysKeepOrderAndObjectsInsideAreSorted) {
    json value = json::parse(R"([3,1,{"z":1,"a":[2,1]}])");
    ASSERT_EQ(canonicalize(value), R"([3,1,{"a":[2,1],"z":1}])");
}

TEST(CanonicalTest, Scalars) {
    ASSERT_EQ(canonicalize(json(nullptr)), "null");
    ASSERT_EQ(canonicalize(json(true)), "true");
    ASSERT_EQ(canonicalize(json(false)), "false");
    ASSERT_EQ(canonicalize(json(-42)), "-42");
    ASSERT_EQ(canonicalize(json(std::numeric_limits<uint64_t>::max())), "18446744073709551615");
    ASSERT_EQ(canonicalize(json::object()), "{}");
    ASSERT_EQ(canonicalize(json::array()), "[]");
}

TEST(CanonicalTest, NumbersUsePlainDecimal) {
    ASSERT_EQ(canonicalize(json(1.5)), "1.5");
    ASSERT_EQ(canonicalize(json(1.0)), "1");
    ASSERT_EQ(canonicalize(json(100.0)), "100");
    ASSERT_EQ(canonicalize(json(0.1)), "0.1");
    ASSERT_EQ(canonicalize(json(-2.25)), "-2.25");
    ASSERT_EQ(canonicalize(json(1e21)), "1000000000000000000000");
    ASSERT_EQ(canonicalize(json(1e-7)), "0.0000001");
    ASSERT_EQ(canonicalize(json(1.25e-7)), "0.000000125");
    ASSERT_EQ(canonicalize(json(-0.0)), "0");
}

TEST(CanonicalTest, NonFiniteNumbersAreRejected) {
    ASSERT_THROW(canonicalize(json(std::nan(""))), MoltBridge::InvalidArgument);
    ASSERT_THROW(canonicalize(json(std::numeric_limits<double>::infinity())), MoltBridge::InvalidArgument);
    ASSERT_THROW(canonicalize(json({{"x", -std::numeric_limits<double>::infinity()}})), MoltBridge::InvalidArgument);
}

TEST(CanonicalTest, StringEscaping) {
    ASSERT_EQ(canonicalize(json("a\"b\\c")), R"("a\"b\\c")");
    ASSERT_EQ(canonicalize(json("line\nbreak\ttab")), R"("line\nbreak\ttab")");
    ASSERT_EQ(canonicalize(json(std::string("\x01", 1))), R"("\u0001")");
    // non-ASCII passes through unescaped
    ASSERT_EQ(canonicalize(json("caf\xc3\xa9")), "\"caf\xc3\xa9\"");
    ASSERT_EQ(canonicalize(json("a/b")), R"("a/b")");
}

TEST(CanonicalTest, InvalidUtf8IsRejected) {
    ASSERT_THROW(canonicalize(json(std::string("\xff\xfe"))), MoltBridge::InvalidArgument);
}

TEST(CanonicalTest, AbsentBodyIsEmptyAndDistinctFromNull) {
    ASSERT_EQ(MoltBridge::canonical_body(std::nullopt), "");
    ASSERT_EQ(MoltBridge::canonical_body(json(nullptr)), "null");
    ASSERT_EQ(MoltBridge::canonical_body(json::object()), "{}");

    ASSERT_EQ(MoltBridge::body_digest(std::nullopt),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    ASSERT_NE(MoltBridge::body_digest(std::nullopt), MoltBridge::body_digest(json(nullptr)));
}

TEST(CanonicalTest, AnyMutationChangesDigest) {
    json body = {{"amount", 10}, {"to", "agent-b"}, {"tags", {"x", "y"}}};
    const std::string digest = MoltBridge::body_digest(body);

    json changed_value = body;
    changed_value["amount"] = 11;
    json added_key = body;
    added_key["memo"] = "";
    json reordered_array = body;
    reordered_array["tags"] = {"y", "x"};

    ASSERT_NE(MoltBridge::body_digest(changed_value), digest);
    ASSERT_NE(MoltBridge::body_digest(added_key), digest);
    ASSERT_NE(MoltBridge::body_digest(reordered_array), digest);
}
