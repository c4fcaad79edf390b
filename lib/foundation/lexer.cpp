/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <cctype>
#include <fmt/format.h>
#include <ershov/foundation/lexer.hpp>

namespace ershov
{
	namespace
	{
		bool is_digit(const char c)
		{
			return std::isdigit(static_cast<unsigned char>(c)) != 0;
		}

		bool is_identifier_start(const char c)
		{
			return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
		}

		bool is_identifier_char(const char c)
		{
			return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
		}
	}

	ParseError::ParseError(const std::size_t position, std::string reason)
		: std::runtime_error(fmt::format("parse error at {}: {}", position, reason)),
		  pos(position), why(std::move(reason)) {}

	std::vector<Token> Lexer::tokenize() const
	{
		std::vector<Token> tokens;
		std::size_t i = 0;
		while (i < src.size())
		{
			const char c = src[i];
			if (std::isspace(static_cast<unsigned char>(c)))
			{
				++i;
				continue;
			}

			if (is_digit(c) || c == '.')
			{
				const std::size_t end = scan_number(i);
				tokens.push_back({ TokenKind::NUMBER, std::string(src.substr(i, end - i)), i });
				i = end;
				continue;
			}

			if (is_identifier_start(c))
			{
				const std::size_t end = scan_identifier(i);
				tokens.push_back({ TokenKind::IDENTIFIER, std::string(src.substr(i, end - i)), i });
				i = end;
				continue;
			}

			switch (c)
			{
				case '+':
				case '-':
				case '*':
				case '/':
				case '^':
					tokens.push_back({ TokenKind::OPERATOR, std::string(1, c), i });
					break;
				case '(':
					tokens.push_back({ TokenKind::LPAREN, "(", i });
					break;
				case ')':
					tokens.push_back({ TokenKind::RPAREN, ")", i });
					break;
				default:
					throw ParseError(i, fmt::format("unknown character '{}'", c));
			}
			++i;
		}

		tokens.push_back({ TokenKind::END, "", src.size() });
		return tokens;
	}

	std::size_t Lexer::scan_number(const std::size_t start) const
	{
		std::size_t i = start;
		std::size_t digits = 0;
		while (i < src.size() && is_digit(src[i]))
		{
			++i;
			++digits;
		}

		if (i < src.size() && src[i] == '.')
		{
			++i;
			std::size_t fraction = 0;
			while (i < src.size() && is_digit(src[i]))
			{
				++i;
				++fraction;
			}
			/* `1.` and a lone `.` are both rejected */
			if (fraction == 0)
				throw ParseError(start, fmt::format("malformed number '{}'", src.substr(start, i - start)));
			digits += fraction;
		}

		if (digits == 0)
			throw ParseError(start, "malformed number");

		/* `2x` is neither a number nor an identifier */
		if (i < src.size() && (is_identifier_start(src[i]) || src[i] == '.'))
			throw ParseError(i, fmt::format("unexpected '{}' after number", src[i]));
		return i;
	}

	std::size_t Lexer::scan_identifier(const std::size_t start) const
	{
		std::size_t i = start;
		while (i < src.size() && is_identifier_char(src[i]))
			++i;
		return i;
	}
}
