#define DOCTEST_CONFIG_TREAT_CHAR_STAR_AS_STRING
#include <doctest/doctest.h>
#include <json-tree/json-tree.h>

#include <cmath>
#include <string>

using namespace json_tree;

namespace
{
	// Decodes `text` expecting failure, returns the error
	Error
	decode_error(std::string_view text)
	{
		auto [value, err] = decode(text);
		return err;
	}

	bool
	contains(const std::string& haystack, std::string_view needle)
	{
		return haystack.find(needle) != std::string::npos;
	}
}

TEST_SUITE("Decode")
{
	TEST_CASE("Empty containers")
	{
		auto [object, object_err] = decode("{}");
		REQUIRE_FALSE(object_err);
		REQUIRE(object.kind() == VALUE_OBJECT);
		CHECK(object.as_object().val->empty());

		auto [list, list_err] = decode("[]");
		REQUIRE_FALSE(list_err);
		REQUIRE(list.kind() == VALUE_LIST);
		CHECK(list.as_list().val->empty());

		auto [spaced, spaced_err] = decode(" \t{ \r\n } ");
		REQUIRE_FALSE(spaced_err);
		CHECK(spaced == Value{Object{}});
	}

	TEST_CASE("Scalars")
	{
		CHECK(decode("\"hi\"").val == Value{"hi"});
		CHECK(decode("1").val == Value{1});
		CHECK(decode("2.0").val == Value{2.0});
		CHECK(decode("-2.0").val == Value{-2.0});
		CHECK(decode("20.05").val == Value{20.05});
		CHECK(decode("true").val == Value{true});
		CHECK(decode("false").val == Value{false});
		CHECK(decode("null").val == Value{nullptr});

		CHECK(decode("1").val.kind() == VALUE_INTEGER);
		CHECK(decode("2.0").val.kind() == VALUE_FLOAT);
		CHECK(decode("null").val.kind() == VALUE_NULL);
	}

	TEST_CASE("Numbers")
	{
		CHECK(decode("0").val == Value{0});
		CHECK(decode("-0").val == Value{0});
		CHECK(decode("-17").val == Value{-17});
		CHECK(decode("9223372036854775807").val == Value{INT64_MAX});
		CHECK(decode("-9223372036854775808").val == Value{INT64_MIN});

		// exponent without a fraction still makes a float
		CHECK(decode("1e2").val == Value{100.0});
		CHECK(decode("1E+2").val == Value{100.0});
		CHECK(decode("25e-1").val == Value{2.5});
		CHECK(decode("-1.5e3").val == Value{-1500.0});
		CHECK(decode("0.5").val == Value{0.5});

		// out of the integer range falls back to a float
		auto [huge, huge_err] = decode("18446744073709551616");
		REQUIRE_FALSE(huge_err);
		CHECK(huge.kind() == VALUE_FLOAT);
		CHECK(huge.as_float().val == doctest::Approx(1.8446744073709552e19));

		// below the smallest subnormal rounds to a signed zero
		auto [tiny, tiny_err] = decode("1e-400");
		REQUIRE_FALSE(tiny_err);
		CHECK(tiny == Value{0.0});
		CHECK(std::signbit(tiny.as_float().val) == false);

		auto [negative_tiny, negative_tiny_err] = decode("-1e-400");
		REQUIRE_FALSE(negative_tiny_err);
		CHECK(negative_tiny.kind() == VALUE_FLOAT);
		CHECK(std::signbit(negative_tiny.as_float().val));

		CHECK(decode("[1e-400]").val == Value{List{0.0}});
		CHECK(decode("0." + std::string(340, '0') + "1").val == Value{0.0});
		CHECK(decode("5e-324").val.as_float().val > 0.0);
	}

	TEST_CASE("Strings")
	{
		CHECK(decode(R"("")").val == Value{""});
		CHECK(decode(R"("a\"b")").val == Value{"a\"b"});
		CHECK(decode(R"("\\ \/ \b \f \n \r \t")").val == Value{"\\ / \b \f \n \r \t"});
		CHECK(decode(R"("A\u00e9")").val == Value{"A\xc3\xa9"});
		CHECK(decode(R"("\u20AC")").val == Value{"\xe2\x82\xac"});
		CHECK(decode(R"("\ud834\udd1e")").val == Value{"\xf0\x9d\x84\x9e"});
		CHECK(decode("\"\xc3\xbc" "ber\"").val == Value{"\xc3\xbc" "ber"});

		auto [nul, nul_err] = decode(R"("a\u0000b")");
		REQUIRE_FALSE(nul_err);
		CHECK(nul.as_string().val == std::string_view{"a\0b", 3});
	}

	TEST_CASE("Nested")
	{
		auto [doc, err] = decode(R"({"a": [true, [4, 2, 3], {"f": {"b": 1, "c": null}}, 55]})");
		REQUIRE_FALSE(err);

		auto [a, a_err] = doc.get("a");
		REQUIRE_FALSE(a_err);

		CHECK(a->at(0).val->as_bool().val == true);

		auto [digits, digits_err] = a->at(1);
		REQUIRE_FALSE(digits_err);
		CHECK(digits->at(0).val->as_integer().val == 4);
		CHECK(digits->at(1).val->as_integer().val == 2);
		CHECK(digits->at(2).val->as_integer().val == 3);

		auto [f, f_err] = a->at(2).val->get("f");
		REQUIRE_FALSE(f_err);
		CHECK(f->get("b").val->as_integer().val == 1);
		CHECK(f->get("c").val->is_null());

		CHECK(a->at(3).val->as_integer().val == 55);
		CHECK(a->at(4).err.kind == ERROR_INDEX_OUT_OF_RANGE);
	}

	TEST_CASE("Duplicate keys keep the last value")
	{
		auto [doc, err] = decode(R"({"k": 1, "other": 2, "k": 3})");
		REQUIRE_FALSE(err);

		auto object = doc.as_object().val;
		REQUIRE(object->size() == 2);
		CHECK(object->begin()->key == "k");
		CHECK(object->find("k")->as_integer().val == 3);
	}

	TEST_CASE("Member order is preserved")
	{
		auto [doc, err] = decode(R"({"z": 1, "a": 2, "m": 3})");
		REQUIRE_FALSE(err);

		std::string keys;
		for (const auto& [key, value] : *doc.as_object().val)
			keys += key;
		CHECK(keys == "zam");
	}

	TEST_CASE("Unterminated")
	{
		for (auto text : {"{", "[", "[1, 2", R"({"a": 1)", "[[]"})
		{
			CAPTURE(text);
			auto err = decode_error(text);
			CHECK(err.kind == ERROR_UNTERMINATED_CONTAINER);
			CHECK(contains(err.msg, "unterminated container"));
		}

		auto err = decode_error("\"asdasd");
		CHECK(err.kind == ERROR_UNTERMINATED_STRING);
		CHECK(contains(err.msg, "unterminated string"));

		CHECK(decode_error("\"abc\\").kind == ERROR_UNTERMINATED_STRING);
		CHECK(decode_error("\"\\u12").kind == ERROR_UNTERMINATED_STRING);
	}

	TEST_CASE("Corrupt literals")
	{
		for (auto text : {"nuls", "nul", "n", "[nul]"})
		{
			CAPTURE(text);
			auto err = decode_error(text);
			CHECK(err.kind == ERROR_CORRUPT_LITERAL);
			CHECK(contains(err.msg, "corrupt null"));
		}

		auto truu = decode_error("truu");
		CHECK(truu.kind == ERROR_CORRUPT_LITERAL);
		CHECK(contains(truu.msg, "corrupt true"));
		// reported where the literal stops matching its lead character
		CHECK(truu.offset == 1);
		CHECK(decode_error("[nul]").offset == 2);
		CHECK(decode_error("  fals").offset == 3);

		auto false_upper = decode_error("fALSE");
		CHECK(false_upper.kind == ERROR_CORRUPT_LITERAL);
		CHECK(contains(false_upper.msg, "corrupt false"));

		// a literal followed by garbage is not a corrupt literal
		CHECK(decode_error("nullx").kind == ERROR_INVALID_CHARACTER);
	}

	TEST_CASE("Corrupt numbers")
	{
		for (auto text : {"-", "-a", "1.", "1.e5", "1e", "1e+", "01", "-012", "[1.x]"})
		{
			CAPTURE(text);
			CHECK(decode_error(text).kind == ERROR_CORRUPT_NUMBER);
		}

		CHECK(decode_error(".5").kind == ERROR_INVALID_CHARACTER);
		CHECK(decode_error("+1").kind == ERROR_INVALID_CHARACTER);
		CHECK(decode_error("1e999").kind == ERROR_CORRUPT_NUMBER);
		CHECK(decode_error("-1e999").kind == ERROR_CORRUPT_NUMBER);
		// a negative exponent does not make a large mantissa small
		CHECK(decode_error("1" + std::string(400, '0') + "e-10").kind == ERROR_CORRUPT_NUMBER);
	}

	TEST_CASE("Escapes")
	{
		auto err = decode_error(R"("\x")");
		CHECK(err.kind == ERROR_INVALID_ESCAPE);
		CHECK(contains(err.msg, "invalid escape '\\x'"));

		CHECK(decode_error(R"("\u12G4")").kind == ERROR_INVALID_ESCAPE);
		CHECK(decode_error(R"("\udc00")").kind == ERROR_INVALID_ESCAPE);
		CHECK(decode_error(R"("\ud800")").kind == ERROR_INVALID_ESCAPE);
		CHECK(decode_error(R"("\ud800A")").kind == ERROR_INVALID_ESCAPE);
		CHECK(decode_error(R"("\ud800abcdef")").kind == ERROR_INVALID_ESCAPE);
	}

	TEST_CASE("Container grammar")
	{
		CHECK(decode_error("[1,]").kind == ERROR_TRAILING_COMMA);
		CHECK(decode_error(R"({"a": 1,})").kind == ERROR_TRAILING_COMMA);
		CHECK(decode_error(R"({"a"})").kind == ERROR_DANGLING_KEY);
		CHECK(decode_error(R"({"a":})").kind == ERROR_DANGLING_KEY);
		CHECK(decode_error("[1}").kind == ERROR_MISMATCHED_BRACKET);
		CHECK(decode_error(R"({"a": 1])").kind == ERROR_MISMATCHED_BRACKET);
		CHECK(decode_error("]").kind == ERROR_MISMATCHED_BRACKET);
		CHECK(decode_error("[1]]").kind == ERROR_MISMATCHED_BRACKET);

		CHECK(decode_error("[1:2]").kind == ERROR_UNEXPECTED_COLON);
		CHECK(decode_error(R"({:1})").kind == ERROR_UNEXPECTED_COLON);
		CHECK(decode_error(R"({"a"::1})").kind == ERROR_UNEXPECTED_COLON);
		CHECK(decode_error(":").kind == ERROR_UNEXPECTED_COLON);

		CHECK(decode_error("[,1]").kind == ERROR_UNEXPECTED_COMMA);
		CHECK(decode_error("[1,,2]").kind == ERROR_UNEXPECTED_COMMA);
		CHECK(decode_error(R"({"a",1})").kind == ERROR_UNEXPECTED_COMMA);
		CHECK(decode_error(R"({,})").kind == ERROR_UNEXPECTED_COMMA);
		CHECK(decode_error("1,2").kind == ERROR_UNEXPECTED_COMMA);

		CHECK(decode_error("[1 2]").kind == ERROR_UNEXPECTED_VALUE);
		CHECK(decode_error("[[] {}]").kind == ERROR_UNEXPECTED_VALUE);
		CHECK(decode_error(R"({"a" 1})").kind == ERROR_UNEXPECTED_VALUE);
		CHECK(decode_error(R"({"a": 1 "b": 2})").kind == ERROR_UNEXPECTED_VALUE);
		CHECK(decode_error("1 2").kind == ERROR_UNEXPECTED_VALUE);
		CHECK(decode_error("{} []").kind == ERROR_UNEXPECTED_VALUE);
		CHECK(decode_error(R"("a" "b")").kind == ERROR_UNEXPECTED_VALUE);

		CHECK(decode_error("{1: 2}").kind == ERROR_INVALID_KEY);
		CHECK(decode_error("{true: 2}").kind == ERROR_INVALID_KEY);
		CHECK(decode_error("{[]: 2}").kind == ERROR_INVALID_KEY);
	}

	TEST_CASE("Invalid characters")
	{
		auto err = decode_error("[1, @]");
		CHECK(err.kind == ERROR_INVALID_CHARACTER);
		CHECK(contains(err.msg, "invalid character '@'"));
		CHECK(err.offset == 4);

		CHECK(decode_error("{a: 1}").kind == ERROR_INVALID_CHARACTER);
		CHECK(decode_error("['a']").kind == ERROR_INVALID_CHARACTER);
		CHECK(decode_error("[1] // comment").kind == ERROR_INVALID_CHARACTER);
		CHECK(contains(decode_error("\x01").msg, "U+0001"));
	}

	TEST_CASE("Invalid UTF-8")
	{
		CHECK(decode_error("\"\xff\"").kind == ERROR_INVALID_UTF8);
		CHECK(decode_error("[\xc3]").kind == ERROR_INVALID_UTF8);
	}

	TEST_CASE("Empty document")
	{
		CHECK(decode_error("").kind == ERROR_EMPTY_DOCUMENT);
		CHECK(decode_error(" \n\t ").kind == ERROR_EMPTY_DOCUMENT);
	}

	TEST_CASE("Error offsets")
	{
		CHECK(decode_error("[").offset == 1);
		CHECK(decode_error("[1,]").offset == 3);
		CHECK(decode_error("  }").offset == 2);

		auto err = decode_error(R"({"a": tru})");
		CHECK(err.kind == ERROR_CORRUPT_LITERAL);
		CHECK(contains(err.msg, "at offset"));
	}

	TEST_CASE("Maximum depth")
	{
		std::string deep(10, '[');
		deep.append(10, ']');

		auto [ok, ok_err] = decode(deep, Decode_Options{.max_depth = 10});
		CHECK_FALSE(ok_err);

		auto err = decode_error(std::string(600, '['));
		CHECK(err.kind == ERROR_DEPTH_EXCEEDED);

		auto [shallow, shallow_err] = decode(deep, Decode_Options{.max_depth = 9});
		CHECK(shallow_err.kind == ERROR_DEPTH_EXCEEDED);
	}
}
