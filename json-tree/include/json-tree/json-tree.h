#pragma once

#include <stddef.h>
#include <stdint.h>

#include <concepts>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "json-tree/Exports.h"

namespace json_tree
{
	struct Version
	{
		uint8_t major, minor, patch;
	};

	enum ERROR_KIND
	{
		ERROR_NONE,

		// decode
		ERROR_INVALID_CHARACTER,
		ERROR_INVALID_UTF8,
		ERROR_UNEXPECTED_COLON,
		ERROR_UNEXPECTED_COMMA,
		ERROR_UNEXPECTED_VALUE,
		ERROR_UNEXPECTED_END,
		ERROR_DANGLING_KEY,
		ERROR_TRAILING_COMMA,
		ERROR_MISMATCHED_BRACKET,
		ERROR_UNTERMINATED_CONTAINER,
		ERROR_UNTERMINATED_STRING,
		ERROR_INVALID_ESCAPE,
		ERROR_CORRUPT_NUMBER,
		ERROR_CORRUPT_LITERAL,
		ERROR_INVALID_KEY,
		ERROR_EMPTY_DOCUMENT,
		ERROR_DEPTH_EXCEEDED,

		// access
		ERROR_TYPE_MISMATCH,
		ERROR_KEY_NOT_FOUND,
		ERROR_INDEX_OUT_OF_RANGE,
	};

	struct Error
	{
		ERROR_KIND kind = ERROR_NONE;
		std::string msg;
		// byte offset into the decoded text, decode errors only
		size_t offset = 0;

		explicit operator bool() const { return kind != ERROR_NONE; }

		bool
		operator==(bool v) const
		{
			return bool(*this) == v;
		}

		bool
		operator!=(bool v) const
		{
			return bool(*this) != v;
		}
	};

	template<typename T>
	struct Result
	{
		T val;
		Error err;

		Result(Error e) : val{}, err(std::move(e))
		{
		}

		template<typename... TArgs>
		Result(TArgs&&... args) : val(std::forward<TArgs>(args)...), err{}
		{
		}

		Result(const Result&) = delete;

		Result(Result&&) = default;

		Result&
		operator=(const Result&) = delete;

		Result&
		operator=(Result&&) = default;

		~Result() = default;
	};

	enum VALUE_KIND
	{
		VALUE_NULL,
		VALUE_BOOL,
		VALUE_INTEGER,
		VALUE_FLOAT,
		VALUE_STRING,
		VALUE_LIST,
		VALUE_OBJECT,
	};

	JSON_TREE_EXPORT const char*
	kind_name(VALUE_KIND kind);

	template<typename T>
	concept Character = std::same_as<T, char> || std::same_as<T, wchar_t> || std::same_as<T, char8_t> ||
		std::same_as<T, char16_t> || std::same_as<T, char32_t>;

	struct Value;
	struct Pair;

	using List = std::vector<Value>;

	// Members keep insertion order, keys are unique
	struct JSON_TREE_EXPORT Object
	{
		std::vector<Pair> _pairs;

		Object();
		Object(std::initializer_list<Pair> pairs);

		// Inserts the pair, or replaces the value in place when the key exists
		void
		set(std::string key, Value value);

		const Value*
		find(std::string_view key) const;

		bool
		contains(std::string_view key) const;

		size_t
		size() const;

		bool
		empty() const;

		std::vector<Pair>::const_iterator
		begin() const;

		std::vector<Pair>::const_iterator
		end() const;

		// Order insensitive
		bool
		operator==(const Object& other) const;
	};

	struct JSON_TREE_EXPORT Value
	{
		// alternatives are indexed by VALUE_KIND
		std::variant<std::nullptr_t, bool, int64_t, double, std::string, List, Object> _data;

		Value() : _data(std::in_place_index<VALUE_NULL>, nullptr) {}
		Value(std::nullptr_t) : _data(std::in_place_index<VALUE_NULL>, nullptr) {}
		Value(bool v) : _data(std::in_place_index<VALUE_BOOL>, v) {}
		Value(const char* v) : _data(std::in_place_index<VALUE_STRING>, v) {}
		Value(std::string_view v) : _data(std::in_place_index<VALUE_STRING>, v) {}
		Value(std::string v) : _data(std::in_place_index<VALUE_STRING>, std::move(v)) {}
		Value(List v);
		Value(Object v);

		// would otherwise convert to bool
		Value(const void*) = delete;

		template<Character T>
		Value(T) = delete;

		template<std::integral T>
			requires (std::same_as<T, bool> == false && Character<T> == false)
		Value(T v) : _data(std::in_place_index<VALUE_INTEGER>, int64_t(v)) {}

		template<std::floating_point T>
		Value(T v) : _data(std::in_place_index<VALUE_FLOAT>, double(v)) {}

		VALUE_KIND
		kind() const
		{
			return VALUE_KIND(_data.index());
		}

		bool
		is_null() const
		{
			return kind() == VALUE_NULL;
		}

		Result<std::nullptr_t>
		as_null() const;

		Result<bool>
		as_bool() const;

		Result<int64_t>
		as_integer() const;

		Result<double>
		as_float() const;

		Result<std::string_view>
		as_string() const;

		Result<const List*>
		as_list() const;

		Result<const Object*>
		as_object() const;

		Result<const Value*>
		at(size_t index) const;

		Result<const Value*>
		get(std::string_view key) const;

		bool
		operator==(const Value& other) const;
	};

	struct Pair
	{
		std::string key;
		Value value;
	};

	struct Decode_Options
	{
		// Maximum number of simultaneously open objects and lists
		size_t max_depth = 512;
	};

	struct Encode_Options
	{
		// 0 renders compact output, otherwise spaces per nesting level
		int indent = 0;
	};

	JSON_TREE_EXPORT Version
	version();

	JSON_TREE_EXPORT Result<Value>
	decode(std::string_view text, const Decode_Options& options = {});

	JSON_TREE_EXPORT std::string
	encode(const Value& value, const Encode_Options& options = {});
}
