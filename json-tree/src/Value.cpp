#include <algorithm>

#include "Base.h"

namespace json_tree
{
	inline static Error
	type_mismatch(VALUE_KIND expected, VALUE_KIND actual)
	{
		return Error{ERROR_TYPE_MISMATCH, std::format("type mismatch: expected {}, got {}", kind_name(expected), kind_name(actual))};
	}

	const char*
	kind_name(VALUE_KIND kind)
	{
		switch (kind)
		{
		case VALUE_NULL:    return "null";
		case VALUE_BOOL:    return "bool";
		case VALUE_INTEGER: return "integer";
		case VALUE_FLOAT:   return "float";
		case VALUE_STRING:  return "string";
		case VALUE_LIST:    return "list";
		case VALUE_OBJECT:  return "object";
		default:
			unreachable("invalid kind");
			return "";
		}
	}

	Version
	version()
	{
		return {0, 2, 0};
	}

	Object::Object() = default;

	Object::Object(std::initializer_list<Pair> pairs)
	{
		for (const auto& [key, value] : pairs)
			set(key, value);
	}

	void
	Object::set(std::string key, Value value)
	{
		auto it = std::find_if(_pairs.begin(), _pairs.end(), [&](const Pair& p) { return p.key == key; });
		if (it != _pairs.end())
			it->value = std::move(value);
		else
			_pairs.push_back(Pair{std::move(key), std::move(value)});
	}

	const Value*
	Object::find(std::string_view key) const
	{
		for (const auto& pair : _pairs)
			if (pair.key == key)
				return &pair.value;
		return nullptr;
	}

	bool
	Object::contains(std::string_view key) const
	{
		return find(key) != nullptr;
	}

	size_t
	Object::size() const
	{
		return _pairs.size();
	}

	bool
	Object::empty() const
	{
		return _pairs.empty();
	}

	std::vector<Pair>::const_iterator
	Object::begin() const
	{
		return _pairs.begin();
	}

	std::vector<Pair>::const_iterator
	Object::end() const
	{
		return _pairs.end();
	}

	bool
	Object::operator==(const Object& other) const
	{
		if (size() != other.size())
			return false;

		for (const auto& [key, value] : _pairs)
		{
			auto other_value = other.find(key);
			if (other_value == nullptr || (*other_value == value) == false)
				return false;
		}
		return true;
	}

	Value::Value(List v) : _data(std::in_place_index<VALUE_LIST>, std::move(v))
	{
	}

	Value::Value(Object v) : _data(std::in_place_index<VALUE_OBJECT>, std::move(v))
	{
	}

	Result<std::nullptr_t>
	Value::as_null() const
	{
		if (kind() != VALUE_NULL)
			return type_mismatch(VALUE_NULL, kind());
		return nullptr;
	}

	Result<bool>
	Value::as_bool() const
	{
		if (kind() != VALUE_BOOL)
			return type_mismatch(VALUE_BOOL, kind());
		return std::get<bool>(_data);
	}

	Result<int64_t>
	Value::as_integer() const
	{
		if (kind() != VALUE_INTEGER)
			return type_mismatch(VALUE_INTEGER, kind());
		return std::get<int64_t>(_data);
	}

	Result<double>
	Value::as_float() const
	{
		if (kind() != VALUE_FLOAT)
			return type_mismatch(VALUE_FLOAT, kind());
		return std::get<double>(_data);
	}

	Result<std::string_view>
	Value::as_string() const
	{
		if (kind() != VALUE_STRING)
			return type_mismatch(VALUE_STRING, kind());
		return std::string_view{std::get<std::string>(_data)};
	}

	Result<const List*>
	Value::as_list() const
	{
		if (kind() != VALUE_LIST)
			return type_mismatch(VALUE_LIST, kind());
		return &std::get<List>(_data);
	}

	Result<const Object*>
	Value::as_object() const
	{
		if (kind() != VALUE_OBJECT)
			return type_mismatch(VALUE_OBJECT, kind());
		return &std::get<Object>(_data);
	}

	Result<const Value*>
	Value::at(size_t index) const
	{
		auto [list, err] = as_list();
		if (err)
			return std::move(err);

		if (index >= list->size())
			return Error{ERROR_INDEX_OUT_OF_RANGE, std::format("index {} out of range for list of size {}", index, list->size())};
		return &(*list)[index];
	}

	Result<const Value*>
	Value::get(std::string_view key) const
	{
		auto [object, err] = as_object();
		if (err)
			return std::move(err);

		auto value = object->find(key);
		if (value == nullptr)
			return Error{ERROR_KEY_NOT_FOUND, std::format("key \"{}\" not found", key)};
		return value;
	}

	bool
	Value::operator==(const Value& other) const
	{
		return _data == other._data;
	}
}
