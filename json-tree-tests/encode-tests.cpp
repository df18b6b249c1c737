#define DOCTEST_CONFIG_TREAT_CHAR_STAR_AS_STRING
#include <doctest/doctest.h>
#include <json-tree/json-tree.h>

#include <limits>
#include <string>

using namespace json_tree;

TEST_SUITE("Encode")
{
	TEST_CASE("Scalars")
	{
		CHECK(encode(Value{}) == "null");
		CHECK(encode(Value{true}) == "true");
		CHECK(encode(Value{false}) == "false");
		CHECK(encode(Value{0}) == "0");
		CHECK(encode(Value{-42}) == "-42");
		CHECK(encode(Value{INT64_MIN}) == "-9223372036854775808");
		CHECK(encode(Value{"hi"}) == "\"hi\"");
	}

	TEST_CASE("Floats keep their kind")
	{
		CHECK(encode(Value{2.0}) == "2.0");
		CHECK(encode(Value{-2.0}) == "-2.0");
		CHECK(encode(Value{20.05}) == "20.05");
		CHECK(encode(Value{0.1}) == "0.1");
		CHECK(encode(Value{1e300}) == "1e+300");

		CHECK(decode(encode(Value{2.0})).val.kind() == VALUE_FLOAT);
		CHECK(decode(encode(Value{1e21})).val == Value{1e21});
	}

	TEST_CASE("Non-finite floats")
	{
		CHECK(encode(Value{std::numeric_limits<double>::infinity()}) == "null");
		CHECK(encode(Value{-std::numeric_limits<double>::infinity()}) == "null");
		CHECK(encode(Value{std::numeric_limits<double>::quiet_NaN()}) == "null");
	}

	TEST_CASE("String escapes")
	{
		CHECK(encode(Value{"a\"b"}) == R"("a\"b")");
		CHECK(encode(Value{"back\\slash"}) == R"("back\\slash")");
		CHECK(encode(Value{"\b\f\n\r\t"}) == R"("\b\f\n\r\t")");
		CHECK(encode(Value{std::string{"\x01\x1f", 2}}) == R"("\u0001\u001f")");
		CHECK(encode(Value{std::string{"a\0b", 3}}) == R"("a\u0000b")");
		CHECK(encode(Value{"a/b"}) == R"("a/b")");
		CHECK(encode(Value{"\xc3\xbc" "ber"}) == "\"\xc3\xbc" "ber\"");
	}

	TEST_CASE("Invalid UTF-8 is replaced")
	{
		CHECK(encode(Value{std::string{"\xff"}}) == "\"\xef\xbf\xbd\"");
		CHECK(encode(Value{std::string{"a\xc3" "b"}}) == "\"a\xef\xbf\xbd" "b\"");
		// an encoded surrogate is not valid UTF-8
		CHECK(encode(Value{std::string{"\xed\xa0\x80"}}) == "\"\xef\xbf\xbd\xef\xbf\xbd\xef\xbf\xbd\"");

		auto [decoded, err] = decode(encode(Value{List{std::string{"x\xfey"}}}));
		REQUIRE_FALSE(err);
		CHECK(decoded == Value{List{"x\xef\xbf\xbd" "y"}});
	}

	TEST_CASE("Containers")
	{
		CHECK(encode(Value{List{}}) == "[]");
		CHECK(encode(Value{Object{}}) == "{}");
		CHECK(encode(Value{List{1, "a", nullptr, false}}) == R"([1,"a",null,false])");

		Value doc{Object{
			{"name", "x"},
			{"items", List{1, List{2, 3}, Object{{"k", 1.5}}}},
			{"empty", Object{}},
		}};
		CHECK(encode(doc) == R"({"name":"x","items":[1,[2,3],{"k":1.5}],"empty":{}})");
	}

	TEST_CASE("Keys are escaped")
	{
		Value doc{Object{{"quote\"key", 1}, {"line\nbreak", 2}}};
		CHECK(encode(doc) == R"({"quote\"key":1,"line\nbreak":2})");
	}

	TEST_CASE("Indented output")
	{
		Value doc{Object{
			{"a", List{1, 2}},
			{"b", Object{}},
			{"c", List{}},
		}};

		std::string expected =
			"{\n"
			"  \"a\": [\n"
			"    1,\n"
			"    2\n"
			"  ],\n"
			"  \"b\": {},\n"
			"  \"c\": []\n"
			"}";
		CHECK(encode(doc, Encode_Options{.indent = 2}) == expected);
		CHECK(encode(Value{1}, Encode_Options{.indent = 4}) == "1");

		auto [again, err] = decode(expected);
		REQUIRE_FALSE(err);
		CHECK(again == doc);
	}

	TEST_CASE("Round trip")
	{
		Value doc{Object{
			{"null", nullptr},
			{"bools", List{true, false}},
			{"ints", List{0, -1, INT64_MAX, INT64_MIN}},
			{"floats", List{0.5, -2.25, 1e-7, 6.02214076e23, 3.0}},
			{"strings", List{"", "plain", "tab\there", "quote\"", "\\", "\x1b[0m", "\xe2\x82\xac", "\xf0\x9d\x84\x9e"}},
			{"nested", Object{{"deeper", Object{{"deepest", List{List{List{}}}}}}}},
		}};

		auto text = encode(doc);
		auto [decoded, err] = decode(text);
		REQUIRE_FALSE(err);
		CHECK(decoded == doc);

		// encoding is stable once canonical
		CHECK(encode(decoded) == text);

		auto pretty = encode(doc, Encode_Options{.indent = 3});
		auto [from_pretty, pretty_err] = decode(pretty);
		REQUIRE_FALSE(pretty_err);
		CHECK(from_pretty == doc);
	}
}
