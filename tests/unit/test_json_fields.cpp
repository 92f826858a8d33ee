#include <gtest/gtest.h>
#include "venues/json_fields.hpp"
#include <clocale>

using namespace prism::venues;
using json = nlohmann::json;

TEST(JsonFieldsTest, NumberFromStringOrNumber) {
    auto obj = json::parse(R"({"s": "65000.5", "n": 42, "f": 0.25, "neg": "-0.0001"})");

    EXPECT_EQ(fields::number(obj, "s"), 65000.5);
    EXPECT_EQ(fields::number(obj, "n"), 42.0);
    EXPECT_EQ(fields::number(obj, "f"), 0.25);
    EXPECT_EQ(fields::number(obj, "neg"), -0.0001);
}

TEST(JsonFieldsTest, NumberFailsSoft) {
    auto obj = json::parse(R"({
        "empty": "", "blank": "  ", "word": "abc", "partial": "12abc",
        "null": null, "bool": true, "arr": [1], "nan": "nan", "inf": "inf"
    })");

    for (const char* key : {"empty", "blank", "word", "partial", "null", "bool",
                            "arr", "nan", "inf", "absent"}) {
        EXPECT_FALSE(fields::number(obj, key)) << "key: " << key;
    }
}

TEST(JsonFieldsTest, NumberOnNonObject) {
    EXPECT_FALSE(fields::number(json::array(), "x"));
    EXPECT_FALSE(fields::number(json("text"), "x"));
}

TEST(JsonFieldsTest, IsPresent) {
    auto obj = json::parse(R"({"a": "1", "b": "", "c": null, "d": 0})");

    EXPECT_TRUE(fields::is_present(obj, "a"));
    EXPECT_FALSE(fields::is_present(obj, "b"));
    EXPECT_FALSE(fields::is_present(obj, "c"));
    EXPECT_TRUE(fields::is_present(obj, "d"));
    EXPECT_FALSE(fields::is_present(obj, "e"));
}

TEST(JsonFieldsTest, FirstNumberUsesPrecedence) {
    auto obj = json::parse(R"({"volCcyQuote": "", "volCcy24h": "1200", "volCcy": "99"})");

    EXPECT_EQ(fields::first_number(obj, {"volCcyQuote", "volCcy24h", "volCcy"}), 1200.0);
}

TEST(JsonFieldsTest, FirstNumberPresentButUnparsableWins) {
    auto obj = json::parse(R"({"a": "oops", "b": "5"})");

    EXPECT_FALSE(fields::first_number(obj, {"a", "b"}));
}

TEST(JsonFieldsTest, TextFromStringOrInteger) {
    auto obj = json::parse(R"({"ts": "1714564800000", "time": 1714564800000, "x": 1.5})");

    EXPECT_EQ(fields::text(obj, "ts"), "1714564800000");
    EXPECT_EQ(fields::text(obj, "time"), "1714564800000");
    EXPECT_FALSE(fields::text(obj, "x"));
    EXPECT_FALSE(fields::text(obj, "missing"));
}

TEST(JsonFieldsTest, FirstRow) {
    auto rows = json::parse(R"([{"a": 1}, {"a": 2}])");

    ASSERT_NE(fields::first_row(rows), nullptr);
    EXPECT_EQ((*fields::first_row(rows))["a"], 1);
    EXPECT_EQ(fields::first_row(json::array()), nullptr);
    EXPECT_EQ(fields::first_row(json::parse("[1, 2]")), nullptr);
    EXPECT_EQ(fields::first_row(json::object()), nullptr);
}

TEST(JsonFieldsTest, NumberIgnoresDecimalCommaLocale) {
    if (std::setlocale(LC_ALL, "de_DE.UTF-8") == nullptr &&
        std::setlocale(LC_ALL, "fr_FR.UTF-8") == nullptr) {
        GTEST_SKIP() << "no decimal-comma locale installed";
    }
    auto obj = json::parse(R"({"last": "65000.1", "comma": "65000,1"})");

    auto last = fields::number(obj, "last");
    auto comma = fields::number(obj, "comma");
    std::setlocale(LC_ALL, "C");

    EXPECT_EQ(last, 65000.1);
    EXPECT_FALSE(comma);
}

TEST(JsonFieldsTest, NumberAcceptsExponentForm) {
    auto obj = json::parse(R"({"tiny": "1e-05", "big": "3.5E+08"})");

    EXPECT_EQ(fields::number(obj, "tiny"), 1e-05);
    EXPECT_EQ(fields::number(obj, "big"), 3.5e+08);
}
