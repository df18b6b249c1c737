#define DOCTEST_CONFIG_TREAT_CHAR_STAR_AS_STRING
#include <doctest/doctest.h>
#include <json-tree/json-tree.h>

#include <string>
#include <type_traits>

using namespace json_tree;

TEST_SUITE("Value")
{
	TEST_CASE("Kinds")
	{
		CHECK(Value{}.kind() == VALUE_NULL);
		CHECK(Value{nullptr}.kind() == VALUE_NULL);
		CHECK(Value{true}.kind() == VALUE_BOOL);
		CHECK(Value{42}.kind() == VALUE_INTEGER);
		CHECK(Value{int64_t(-7)}.kind() == VALUE_INTEGER);
		CHECK(Value{2.5}.kind() == VALUE_FLOAT);
		CHECK(Value{"hi"}.kind() == VALUE_STRING);
		CHECK(Value{std::string{"hi"}}.kind() == VALUE_STRING);
		CHECK(Value{List{}}.kind() == VALUE_LIST);
		CHECK(Value{Object{}}.kind() == VALUE_OBJECT);

		CHECK(std::string{kind_name(VALUE_OBJECT)} == "object");
		CHECK(std::string{kind_name(VALUE_LIST)} == "list");
		CHECK(std::string{kind_name(VALUE_FLOAT)} == "float");
	}

	TEST_CASE("Native accessors")
	{
		CHECK(Value{true}.as_bool().val == true);
		CHECK(Value{42}.as_integer().val == 42);
		CHECK(Value{2.5}.as_float().val == 2.5);
		CHECK(Value{"hi"}.as_string().val == "hi");
		CHECK(Value{}.is_null());
		CHECK_FALSE(Value{}.as_null().err);

		Value list{List{1, "two", 3.0}};
		auto [items, err] = list.as_list();
		REQUIRE_FALSE(err);
		CHECK(items->size() == 3);

		Value object{Object{{"a", 1}, {"b", List{true}}}};
		auto [members, members_err] = object.as_object();
		REQUIRE_FALSE(members_err);
		CHECK(members->size() == 2);
		CHECK(members->contains("a"));
		CHECK_FALSE(members->contains("c"));
	}

	TEST_CASE("Type mismatch")
	{
		Value str{"hello"};

		auto [list, list_err] = str.as_list();
		CHECK(list == nullptr);
		CHECK(list_err.kind == ERROR_TYPE_MISMATCH);
		CHECK(list_err.msg == "type mismatch: expected list, got string");

		CHECK(str.at(0).err.kind == ERROR_TYPE_MISMATCH);
		CHECK(str.get("a").err.kind == ERROR_TYPE_MISMATCH);
		CHECK(str.as_integer().err.kind == ERROR_TYPE_MISMATCH);
		CHECK(str.as_float().err.kind == ERROR_TYPE_MISMATCH);
		CHECK(str.as_bool().err.kind == ERROR_TYPE_MISMATCH);
		CHECK(str.as_null().err.kind == ERROR_TYPE_MISMATCH);
		CHECK(str.as_object().err.kind == ERROR_TYPE_MISMATCH);

		// integers and floats are distinct kinds
		CHECK(Value{1}.as_float().err.kind == ERROR_TYPE_MISMATCH);
		CHECK(Value{1.0}.as_integer().err.kind == ERROR_TYPE_MISMATCH);
		CHECK(Value{}.as_string().err.kind == ERROR_TYPE_MISMATCH);
		CHECK_FALSE(Value{}.as_string().err == false);
	}

	TEST_CASE("Key lookup")
	{
		Value object{Object{{"a", 1}, {"b", "x"}}};

		auto [a, a_err] = object.get("a");
		REQUIRE_FALSE(a_err);
		CHECK(a->as_integer().val == 1);

		auto [missing, missing_err] = object.get("missing");
		CHECK(missing == nullptr);
		CHECK(missing_err.kind == ERROR_KEY_NOT_FOUND);
		CHECK(missing_err.msg == "key \"missing\" not found");
	}

	TEST_CASE("Index lookup")
	{
		Value list{List{10, 20, 30}};

		auto [last, last_err] = list.at(2);
		REQUIRE_FALSE(last_err);
		CHECK(last->as_integer().val == 30);

		auto [out, out_err] = list.at(3);
		CHECK(out == nullptr);
		CHECK(out_err.kind == ERROR_INDEX_OUT_OF_RANGE);
		CHECK(Value{List{}}.at(0).err.kind == ERROR_INDEX_OUT_OF_RANGE);
	}

	TEST_CASE("Object set replaces in place")
	{
		Object object;
		object.set("first", 1);
		object.set("second", 2);
		object.set("first", "one");

		REQUIRE(object.size() == 2);
		CHECK(object.begin()->key == "first");
		CHECK(object.begin()->value.as_string().val == "one");
		CHECK((object.begin() + 1)->key == "second");

		Object from_list{{"k", 1}, {"k", 2}};
		CHECK(from_list.size() == 1);
		CHECK(from_list.find("k")->as_integer().val == 2);
	}

	TEST_CASE("Equality")
	{
		CHECK(Value{1} == Value{1});
		CHECK_FALSE(Value{1} == Value{2});
		CHECK_FALSE(Value{1} == Value{1.0});
		CHECK_FALSE(Value{} == Value{false});
		CHECK(Value{"a"} == Value{std::string{"a"}});

		CHECK(Value{List{1, 2}} == Value{List{1, 2}});
		CHECK_FALSE(Value{List{1, 2}} == Value{List{2, 1}});

		// member order does not matter for objects
		Value lhs{Object{{"a", 1}, {"b", List{true, nullptr}}}};
		Value rhs{Object{{"b", List{true, nullptr}}, {"a", 1}}};
		CHECK(lhs == rhs);

		Value other{Object{{"a", 1}, {"b", List{true}}}};
		CHECK_FALSE(lhs == other);
		CHECK_FALSE(Value{Object{{"a", 1}}} == Value{Object{{"b", 1}}});
	}

	TEST_CASE("Containers own their children")
	{
		List inner{1, 2};
		Value outer{List{Value{inner}, Value{inner}}};
		inner.push_back(3);

		auto [first, err] = outer.at(0);
		REQUIRE_FALSE(err);
		CHECK(first->as_list().val->size() == 2);
	}

	TEST_CASE("Characters and pointers are not values")
	{
		static_assert(std::is_constructible_v<Value, char> == false);
		static_assert(std::is_constructible_v<Value, char32_t> == false);
		static_assert(std::is_constructible_v<Value, const int*> == false);
		static_assert(std::is_constructible_v<Value, void*> == false);

		static_assert(std::is_constructible_v<Value, signed char>);
		static_assert(std::is_constructible_v<Value, const char*>);
		static_assert(std::is_constructible_v<Value, std::nullptr_t>);

		CHECK(Value{(signed char)-3} == Value{-3});
		CHECK(Value{nullptr}.is_null());
	}

	TEST_CASE("Version")
	{
		auto v = version();
		CHECK(v.major == PROJECT_VERSION_MAJOR);
		CHECK(v.minor == PROJECT_VERSION_MINOR);
		CHECK(v.patch == PROJECT_VERSION_PATCH);
	}
}
