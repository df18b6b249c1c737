#include <charconv>
#include <optional>
#include <stack>
#include <string>
#include <variant>

#include <spdlog/spdlog.h>

#include <tracy/Tracy.hpp>

#include "Base.h"

namespace json_tree
{
	inline static Error
	decode_unicode_escape(Reader& reader, std::string& buf);

	// Expects the opening quote to be consumed
	inline static Result<std::string>
	decode_string(Reader& reader)
	{
		ZoneScoped;

		std::string buf;
		for (;;)
		{
			size_t begin = reader.offset();
			auto [rune, err] = reader.get();
			if (err)
				return std::move(err);

			if (rune == RUNE_EOF)
				return reader.fail(ERROR_UNTERMINATED_STRING, "unterminated string");

			if (rune == '"')
				return std::move(buf);

			if (rune != '\\')
			{
				buf.append(reader.slice(begin, reader.offset()));
				continue;
			}

			auto [escaped, escape_err] = reader.get();
			if (escape_err)
				return std::move(escape_err);

			switch (escaped)
			{
			case RUNE_EOF: return reader.fail(ERROR_UNTERMINATED_STRING, "unterminated string");
			case '"':  buf.push_back('"'); break;
			case '\\': buf.push_back('\\'); break;
			case '/':  buf.push_back('/'); break;
			case 'b':  buf.push_back('\b'); break;
			case 'f':  buf.push_back('\f'); break;
			case 'n':  buf.push_back('\n'); break;
			case 'r':  buf.push_back('\r'); break;
			case 't':  buf.push_back('\t'); break;
			case 'u': {
				if (auto unicode_err = decode_unicode_escape(reader, buf))
					return std::move(unicode_err);
				break;
			}
			default: {
				std::string sequence{"\\"};
				append_rune(sequence, escaped);
				return reader.fail(ERROR_INVALID_ESCAPE, std::format("invalid escape '{}'", sequence));
			}
			}
		}
	}

	inline static Result<Rune>
	read_hex4(Reader& reader)
	{
		auto [hex, err] = reader.read_exactly(4);
		if (err && err.kind == ERROR_UNEXPECTED_END)
			return reader.fail(ERROR_UNTERMINATED_STRING, "unterminated string");
		if (err)
			return std::move(err);

		Rune code_point = 0;
		for (auto c : hex)
		{
			if (is_hexdigit(Rune(c)) == false)
				return reader.fail(ERROR_INVALID_ESCAPE, std::format("invalid unicode escape '\\u{}'", hex));
			code_point = code_point * 16 + hexdigit_value(Rune(c));
		}
		return code_point;
	}

	// Expects "\u" to be consumed, appends the decoded code point to `buf`
	inline static Error
	decode_unicode_escape(Reader& reader, std::string& buf)
	{
		auto [code_point, err] = read_hex4(reader);
		if (err)
			return std::move(err);

		if (0xDC00 <= code_point && code_point <= 0xDFFF)
			return reader.fail(ERROR_INVALID_ESCAPE, "unpaired low surrogate");

		if (0xD800 <= code_point && code_point <= 0xDBFF)
		{
			auto [backslash, backslash_err] = reader.peek();
			if (backslash_err)
				return std::move(backslash_err);
			if (backslash != '\\')
				return reader.fail(ERROR_INVALID_ESCAPE, "unpaired high surrogate");
			reader.get();

			auto [u, u_err] = reader.get();
			if (u_err)
				return std::move(u_err);
			if (u == RUNE_EOF)
				return reader.fail(ERROR_UNTERMINATED_STRING, "unterminated string");
			if (u != 'u')
				return reader.fail(ERROR_INVALID_ESCAPE, "unpaired high surrogate");

			auto [low, low_err] = read_hex4(reader);
			if (low_err)
				return std::move(low_err);
			if (low < 0xDC00 || low > 0xDFFF)
				return reader.fail(ERROR_INVALID_ESCAPE, "unpaired high surrogate");

			code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
		}

		if (utf8proc_codepoint_valid(code_point) == false)
			return reader.fail(ERROR_INVALID_ESCAPE, std::format("invalid code point U+{:04X}", code_point));

		append_rune(buf, code_point);
		return Error{};
	}

	inline static Error
	expect_digit(Reader& reader, std::string_view what)
	{
		auto [rune, err] = reader.get();
		if (err)
			return std::move(err);

		if (is_digit(rune) == false)
		{
			reader.unget();
			return reader.fail(ERROR_CORRUPT_NUMBER, std::format("corrupt number: expected digit {}", what));
		}
		return Error{};
	}

	inline static Error
	skip_digits(Reader& reader)
	{
		for (;;)
		{
			auto [rune, err] = reader.peek();
			if (err)
				return std::move(err);
			if (is_digit(rune) == false)
				return Error{};
			reader.get();
		}
	}

	// Power of ten of the leading significant digit of a well formed number literal
	inline static int64_t
	decimal_magnitude(std::string_view literal)
	{
		constexpr int64_t EXPONENT_LIMIT = INT64_MAX / 4;

		auto exp_pos = literal.find_first_of("eE");
		auto mantissa = literal.substr(0, exp_pos);
		if (mantissa.starts_with('-'))
			mantissa.remove_prefix(1);

		int64_t exponent = 0;
		if (exp_pos != std::string_view::npos)
		{
			auto digits = literal.substr(exp_pos + 1);
			bool negative = digits.starts_with('-');
			if (negative || digits.starts_with('+'))
				digits.remove_prefix(1);

			auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), exponent);
			if (ec == std::errc::result_out_of_range || exponent > EXPONENT_LIMIT)
				exponent = EXPONENT_LIMIT;
			if (negative)
				exponent = -exponent;
		}

		auto dot = mantissa.find('.');
		auto integer = mantissa.substr(0, dot);
		if (auto lead = integer.find_first_not_of('0'); lead != std::string_view::npos)
			return int64_t(integer.size() - lead) - 1 + exponent;

		auto fraction = dot == std::string_view::npos ? std::string_view{} : mantissa.substr(dot + 1);
		if (auto lead = fraction.find_first_not_of('0'); lead != std::string_view::npos)
			return -int64_t(lead) - 1 + exponent;
		return 0;
	}

	// -? digit+ ('.' digit+)? ([eE] [+-]? digit+)?
	// Expects the lead character to be unread
	inline static Result<Value>
	decode_number(Reader& reader)
	{
		ZoneScoped;

		size_t begin = reader.offset();
		bool is_float = false;

		auto [sign, sign_err] = reader.peek();
		if (sign_err)
			return std::move(sign_err);
		if (sign == '-')
			reader.get();

		auto [lead, lead_err] = reader.peek();
		if (lead_err)
			return std::move(lead_err);
		if (lead == '0')
		{
			reader.get();
			auto [next, next_err] = reader.peek();
			if (next_err)
				return std::move(next_err);
			if (is_digit(next))
				return reader.fail(ERROR_CORRUPT_NUMBER, "corrupt number: leading zero");
		}
		else
		{
			if (auto err = expect_digit(reader, "in integer part"))
				return err;
			if (auto err = skip_digits(reader))
				return err;
		}

		auto [dot, dot_err] = reader.peek();
		if (dot_err)
			return std::move(dot_err);
		if (dot == '.')
		{
			reader.get();
			if (auto err = expect_digit(reader, "in fraction"))
				return err;
			if (auto err = skip_digits(reader))
				return err;
			is_float = true;
		}

		auto [exp, exp_err] = reader.peek();
		if (exp_err)
			return std::move(exp_err);
		if (exp == 'e' || exp == 'E')
		{
			reader.get();
			auto [exp_sign, exp_sign_err] = reader.peek();
			if (exp_sign_err)
				return std::move(exp_sign_err);
			if (exp_sign == '+' || exp_sign == '-')
				reader.get();

			if (auto err = expect_digit(reader, "in exponent"))
				return err;
			if (auto err = skip_digits(reader))
				return err;
			is_float = true;
		}

		auto literal = reader.slice(begin, reader.offset());
		const char* first = literal.data();
		const char* last = literal.data() + literal.size();

		if (is_float == false)
		{
			int64_t integer{};
			auto [ptr, ec] = std::from_chars(first, last, integer);
			if (ec == std::errc{} && ptr == last)
				return Value{integer};
			if (ec != std::errc::result_out_of_range)
				return reader.fail(ERROR_CORRUPT_NUMBER, std::format("corrupt number '{}'", literal));
			// too large for an integer, keep it as a float
		}

		double real{};
		auto [ptr, ec] = std::from_chars(first, last, real);
		if (ec == std::errc::result_out_of_range)
		{
			// too small to represent rounds to zero, too large is an error
			if (decimal_magnitude(literal) < 0)
				return Value{literal.starts_with('-') ? -0.0 : 0.0};
			return reader.fail(ERROR_CORRUPT_NUMBER, std::format("number '{}' out of range", literal));
		}
		if (ec != std::errc{} || ptr != last)
			return reader.fail(ERROR_CORRUPT_NUMBER, std::format("corrupt number '{}'", literal));
		return Value{real};
	}

	// Expects the lead character to be consumed
	inline static Result<Value>
	decode_literal(Reader& reader, Rune lead)
	{
		ZoneScoped;

		std::string_view rest;
		std::string_view msg;
		Value value;
		switch (lead)
		{
		case 't': rest = "rue";  msg = "corrupt true";  value = Value{true};    break;
		case 'f': rest = "alse"; msg = "corrupt false"; value = Value{false};   break;
		case 'n': rest = "ull";  msg = "corrupt null";  value = Value{nullptr}; break;
		default:
			unreachable("invalid literal lead character");
			return reader.fail(ERROR_INVALID_CHARACTER, "invalid literal");
		}

		size_t begin = reader.offset();
		auto [read, err] = reader.read(rest.size());
		if (err)
			return std::move(err);

		if (read != rest)
		{
			reader.rewind(begin);
			return reader.fail(ERROR_CORRUPT_LITERAL, msg);
		}
		return std::move(value);
	}

	inline static std::string
	describe_rune(Rune rune)
	{
		if (rune < 0x20 || rune == 0x7f)
			return std::format("U+{:04X}", rune);

		std::string utf8;
		append_rune(utf8, rune);
		return std::format("'{}'", utf8);
	}

	struct Object_Frame
	{
		Object object;
		std::optional<std::string> key;
		bool colon;
		bool awaiting_item;
	};

	struct List_Frame
	{
		List list;
		bool awaiting_item;
	};

	using Frame = std::variant<Object_Frame, List_Frame>;

	struct Decoder
	{
		Reader _reader;
		Decode_Options _options;
		std::stack<Frame> _frames;
		std::optional<Value> _root;
		// offset of the lead character being handled
		size_t _token;

		Decoder(std::string_view text, const Decode_Options& options) : _reader(text), _options(options), _frames{}, _root{}, _token(0)
		{
		}

		Error
		fail(ERROR_KIND kind, std::string_view msg) const
		{
			return Error{kind, std::format("{} at offset {}", msg, _token), _token};
		}

		// Checks that the top frame is in a position to receive a value
		Error
		begin_value(bool is_string)
		{
			if (_frames.empty())
			{
				if (_root)
					return fail(ERROR_UNEXPECTED_VALUE, "unexpected value after document root");
				return Error{};
			}

			if (auto frame = std::get_if<List_Frame>(&_frames.top()))
			{
				if (frame->list.empty() == false && frame->awaiting_item == false)
					return fail(ERROR_UNEXPECTED_VALUE, "expected ',' between list items");
				return Error{};
			}

			auto& frame = std::get<Object_Frame>(_frames.top());
			if (frame.key)
			{
				if (frame.colon == false)
					return fail(ERROR_UNEXPECTED_VALUE, "expected ':' after object key");
				return Error{};
			}

			if (frame.object.empty() == false && frame.awaiting_item == false)
				return fail(ERROR_UNEXPECTED_VALUE, "expected ',' between object members");
			if (is_string == false)
				return fail(ERROR_INVALID_KEY, "object key must be a string");
			return Error{};
		}

		// Hands a completed value to the top frame, or makes it the root
		Error
		deliver(Value&& value)
		{
			if (_frames.empty())
			{
				if (_root)
					return fail(ERROR_UNEXPECTED_VALUE, "unexpected value after document root");
				_root = std::move(value);
				return Error{};
			}

			if (auto frame = std::get_if<List_Frame>(&_frames.top()))
			{
				frame->list.push_back(std::move(value));
				frame->awaiting_item = false;
				return Error{};
			}

			auto& frame = std::get<Object_Frame>(_frames.top());
			if (frame.key)
			{
				frame.object.set(std::move(*frame.key), std::move(value));
				frame.key.reset();
				frame.colon = false;
				frame.awaiting_item = false;
				return Error{};
			}

			auto [key, err] = value.as_string();
			if (err)
				return fail(ERROR_INVALID_KEY, "object key must be a string");
			frame.key = std::string{key};
			return Error{};
		}

		Error
		open(Frame frame)
		{
			if (auto err = begin_value(false))
				return err;

			if (_frames.size() >= _options.max_depth)
				return fail(ERROR_DEPTH_EXCEEDED, std::format("nesting exceeds maximum depth {}", _options.max_depth));

			_frames.push(std::move(frame));
			return Error{};
		}

		Error
		close_object()
		{
			if (_frames.empty() || std::holds_alternative<Object_Frame>(_frames.top()) == false)
				return fail(ERROR_MISMATCHED_BRACKET, "mismatched bracket '}'");

			auto frame = std::move(std::get<Object_Frame>(_frames.top()));
			if (frame.key)
				return fail(ERROR_DANGLING_KEY, std::format("dangling key \"{}\"", *frame.key));
			if (frame.awaiting_item)
				return fail(ERROR_TRAILING_COMMA, "trailing comma");

			_frames.pop();
			return deliver(Value{std::move(frame.object)});
		}

		Error
		close_list()
		{
			if (_frames.empty() || std::holds_alternative<List_Frame>(_frames.top()) == false)
				return fail(ERROR_MISMATCHED_BRACKET, "mismatched bracket ']'");

			auto frame = std::move(std::get<List_Frame>(_frames.top()));
			if (frame.awaiting_item)
				return fail(ERROR_TRAILING_COMMA, "trailing comma");

			_frames.pop();
			return deliver(Value{std::move(frame.list)});
		}

		Error
		colon()
		{
			if (_frames.empty())
				return fail(ERROR_UNEXPECTED_COLON, "unexpected ':' outside of object");

			auto frame = std::get_if<Object_Frame>(&_frames.top());
			if (frame == nullptr)
				return fail(ERROR_UNEXPECTED_COLON, "unexpected ':' in list");
			if (frame->key.has_value() == false || frame->colon)
				return fail(ERROR_UNEXPECTED_COLON, "unexpected ':'");

			frame->colon = true;
			return Error{};
		}

		Error
		comma()
		{
			if (_frames.empty())
				return fail(ERROR_UNEXPECTED_COMMA, "unexpected ',' outside of container");

			if (auto frame = std::get_if<List_Frame>(&_frames.top()))
			{
				if (frame->list.empty() || frame->awaiting_item)
					return fail(ERROR_UNEXPECTED_COMMA, "unexpected ',' in list");
				frame->awaiting_item = true;
				return Error{};
			}

			auto& frame = std::get<Object_Frame>(_frames.top());
			if (frame.key)
				return fail(ERROR_UNEXPECTED_COMMA, std::format("unexpected ',' after key \"{}\"", *frame.key));
			if (frame.object.empty() || frame.awaiting_item)
				return fail(ERROR_UNEXPECTED_COMMA, "unexpected ',' in object");
			frame.awaiting_item = true;
			return Error{};
		}

		Error
		end_input()
		{
			if (_frames.empty() == false)
				return fail(ERROR_UNTERMINATED_CONTAINER, "unterminated container");
			if (_root.has_value() == false)
				return fail(ERROR_EMPTY_DOCUMENT, "empty document");
			return Error{};
		}

		Error
		step(Rune rune)
		{
			switch (rune)
			{
			case '{': return open(Object_Frame{.object{}, .key{}, .colon = false, .awaiting_item = false});
			case '[': return open(List_Frame{.list{}, .awaiting_item = false});
			case '}': return close_object();
			case ']': return close_list();
			case ':': return colon();
			case ',': return comma();

			case '"': {
				if (auto err = begin_value(true))
					return err;

				auto [str, err] = decode_string(_reader);
				if (err)
					return std::move(err);
				return deliver(Value{std::move(str)});
			}

			case 't':
			case 'f':
			case 'n': {
				if (auto err = begin_value(false))
					return err;

				auto [value, err] = decode_literal(_reader, rune);
				if (err)
					return std::move(err);
				return deliver(std::move(value));
			}

			case '-':
			case '0': case '1': case '2': case '3': case '4':
			case '5': case '6': case '7': case '8': case '9': {
				_reader.unget();
				if (auto err = begin_value(false))
					return err;

				auto [value, err] = decode_number(_reader);
				if (err)
					return std::move(err);
				return deliver(std::move(value));
			}

			default:
				return fail(ERROR_INVALID_CHARACTER, std::format("invalid character {}", describe_rune(rune)));
			}
		}

		Result<Value>
		decode()
		{
			ZoneScoped;

			for (;;)
			{
				_token = _reader.offset();
				auto [rune, err] = _reader.get();
				if (err)
					return std::move(err);

				if (rune == RUNE_EOF)
					break;

				if (is_whitespace(rune))
					continue;

				if (auto step_err = step(rune))
					return std::move(step_err);
			}

			if (auto err = end_input())
				return err;
			return std::move(*_root);
		}
	};

	Result<Value>
	decode(std::string_view text, const Decode_Options& options)
	{
		ZoneScoped;

		auto result = Decoder(text, options).decode();
		if (result.err)
			spdlog::debug("json-tree: decode failed: {}", result.err.msg);
		else
			spdlog::trace("json-tree: decoded {} bytes", text.size());
		return result;
	}
}
