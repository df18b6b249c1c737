#pragma once

#include "json-tree/json-tree.h"

#include <string_view>
#include <format>

#include <assert.h>

#include <utf8proc.h>

#define unreachable(msg) assert(!msg)

namespace json_tree
{
	using Rune = utf8proc_int32_t;

	// Returned by Reader when the input is exhausted
	constexpr Rune RUNE_EOF = -1;

	inline bool
	is_whitespace(Rune rune)
	{
		switch (rune)
		{
		case 0x20: case 0x0a: case 0x0d: case 0x09:
			return true;
		default:
			return false;
		}
	}

	inline bool
	is_digit(Rune rune)
	{
		return Rune('0') <= rune && rune <= Rune('9');
	}

	inline bool
	is_hexdigit(Rune rune)
	{
		return is_digit(rune) || (Rune('a') <= rune && rune <= Rune('f')) || (Rune('A') <= rune && rune <= Rune('F'));
	}

	inline int
	hexdigit_value(Rune rune)
	{
		if (is_digit(rune))
			return rune - '0';
		if (Rune('a') <= rune && rune <= Rune('f'))
			return rune - 'a' + 10;
		return rune - 'A' + 10;
	}

	inline void
	append_rune(std::string& buf, Rune rune)
	{
		utf8proc_uint8_t bytes[4];
		auto count = utf8proc_encode_char(rune, bytes);
		buf.append((const char*)bytes, (size_t)count);
	}

	// Pull-based cursor over UTF-8 text, one code point at a time
	struct Reader
	{
		std::string_view _text;
		size_t _pos;
		size_t _prev;

		Reader(std::string_view text) : _text(text), _pos(0), _prev(0)
		{
		}

		size_t
		offset() const
		{
			return _pos;
		}

		std::string_view
		slice(size_t begin, size_t end) const
		{
			return _text.substr(begin, end - begin);
		}

		Error
		fail(ERROR_KIND kind, std::string_view msg) const
		{
			return Error{kind, std::format("{} at offset {}", msg, _pos), _pos};
		}

		inline Result<Rune>
		peek() const
		{
			if (_pos >= _text.size())
				return RUNE_EOF;

			Rune rune{};
			auto bytes_read = utf8proc_iterate((const utf8proc_uint8_t*)_text.data() + _pos, utf8proc_ssize_t(_text.size() - _pos), &rune);
			if (bytes_read < 0)
				return fail(ERROR_INVALID_UTF8, utf8proc_errmsg(bytes_read));
			return rune;
		}

		inline Result<Rune>
		get()
		{
			if (_pos >= _text.size())
			{
				_prev = _pos;
				return RUNE_EOF;
			}

			Rune rune{};
			auto bytes_read = utf8proc_iterate((const utf8proc_uint8_t*)_text.data() + _pos, utf8proc_ssize_t(_text.size() - _pos), &rune);
			if (bytes_read < 0)
				return fail(ERROR_INVALID_UTF8, utf8proc_errmsg(bytes_read));

			_prev = _pos;
			_pos += (size_t)bytes_read;
			return rune;
		}

		// Rewinds exactly the last rune returned by get()
		inline void
		unget()
		{
			_pos = _prev;
		}

		// Moves the cursor back to an offset previously returned by offset()
		inline void
		rewind(size_t offset)
		{
			_pos = offset;
			_prev = offset;
		}

		// Consumes up to `count` runes, fewer only at end of input
		inline Result<std::string_view>
		read(size_t count)
		{
			size_t begin = _pos;
			for (size_t i = 0; i < count; i++)
			{
				auto [rune, err] = get();
				if (err)
					return std::move(err);
				if (rune == RUNE_EOF)
					break;
			}
			return slice(begin, _pos);
		}

		inline Result<std::string_view>
		read_exactly(size_t count)
		{
			size_t begin = _pos;
			for (size_t i = 0; i < count; i++)
			{
				auto [rune, err] = get();
				if (err)
					return std::move(err);
				if (rune == RUNE_EOF)
					return fail(ERROR_UNEXPECTED_END, std::format("expected {} characters, got {}", count, i));
			}
			return slice(begin, _pos);
		}
	};
}
