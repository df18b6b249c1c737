#include <cmath>
#include <string>

#include <tracy/Tracy.hpp>

#include "Base.h"

namespace json_tree
{
	struct Encoder
	{
		std::string _out;
		int _indent;
		int _depth;

		Encoder(const Encode_Options& options) : _out{}, _indent(options.indent > 0 ? options.indent : 0), _depth(0)
		{
		}

		void
		newline()
		{
			if (_indent == 0)
				return;

			_out.push_back('\n');
			_out.append(size_t(_indent * _depth), ' ');
		}

		// Invalid UTF-8 sequences are replaced by U+FFFD, one per offending byte
		void
		string(std::string_view str)
		{
			_out.push_back('"');
			size_t pos = 0;
			while (pos < str.size())
			{
				Rune rune{};
				auto bytes_read = utf8proc_iterate((const utf8proc_uint8_t*)str.data() + pos, utf8proc_ssize_t(str.size() - pos), &rune);
				if (bytes_read < 0)
				{
					append_rune(_out, 0xFFFD);
					pos++;
					continue;
				}

				switch (rune)
				{
				case '"':  _out.append("\\\""); break;
				case '\\': _out.append("\\\\"); break;
				case '\b': _out.append("\\b"); break;
				case '\f': _out.append("\\f"); break;
				case '\n': _out.append("\\n"); break;
				case '\r': _out.append("\\r"); break;
				case '\t': _out.append("\\t"); break;
				default:
					if (rune < 0x20)
						_out.append(std::format("\\u{:04x}", rune));
					else
						_out.append(str.substr(pos, (size_t)bytes_read));
					break;
				}
				pos += (size_t)bytes_read;
			}
			_out.push_back('"');
		}

		void
		real(double value)
		{
			if (std::isfinite(value) == false)
			{
				_out.append("null");
				return;
			}

			// shortest text that reads back to the same double
			auto text = std::format("{}", value);
			_out.append(text);
			if (text.find_first_of(".e") == std::string::npos)
				_out.append(".0");
		}

		void
		list(const List& list)
		{
			_out.push_back('[');
			if (list.empty())
			{
				_out.push_back(']');
				return;
			}

			_depth++;
			for (auto it = list.begin(); it != list.end(); it++)
			{
				if (it != list.begin())
					_out.push_back(',');
				newline();
				value(*it);
			}
			_depth--;

			newline();
			_out.push_back(']');
		}

		void
		object(const Object& object)
		{
			_out.push_back('{');
			if (object.empty())
			{
				_out.push_back('}');
				return;
			}

			_depth++;
			for (auto it = object.begin(); it != object.end(); it++)
			{
				if (it != object.begin())
					_out.push_back(',');
				newline();
				string(it->key);
				_out.append(_indent ? ": " : ":");
				value(it->value);
			}
			_depth--;

			newline();
			_out.push_back('}');
		}

		void
		value(const Value& value)
		{
			switch (value.kind())
			{
			case VALUE_NULL:
				_out.append("null");
				return;

			case VALUE_BOOL:
				_out.append(std::get<bool>(value._data) ? "true" : "false");
				return;

			case VALUE_INTEGER:
				_out.append(std::format("{}", std::get<int64_t>(value._data)));
				return;

			case VALUE_FLOAT:
				return real(std::get<double>(value._data));

			case VALUE_STRING:
				return string(std::get<std::string>(value._data));

			case VALUE_LIST:
				return list(std::get<List>(value._data));

			case VALUE_OBJECT:
				return object(std::get<Object>(value._data));

			default:
				unreachable("invalid kind");
			}
		}
	};

	std::string
	encode(const Value& value, const Encode_Options& options)
	{
		ZoneScoped;

		Encoder encoder{options};
		encoder.value(value);
		return std::move(encoder._out);
	}
}
