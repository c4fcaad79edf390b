/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ershov
{
	/**
	 * @brief Malformed input; carries the byte offset where it was detected
	 */
	class ParseError : public std::runtime_error
	{
	public:
		ParseError(std::size_t position, std::string reason);

		[[nodiscard]] std::size_t position() const noexcept
		{
			return pos;
		}

		[[nodiscard]] const std::string &reason() const noexcept
		{
			return why;
		}

	private:
		std::size_t pos;
		std::string why;
	};

	enum class TokenKind : std::uint8_t
	{
		IDENTIFIER,
		NUMBER,
		OPERATOR,
		LPAREN,
		RPAREN,
		/** @brief Sentinel appended after the last real token */
		END
	};

	struct Token
	{
		TokenKind kind = TokenKind::END;
		std::string text;
		std::size_t position = 0;
	};

	/**
	 * @brief Splits an expression string into tokens
	 *
	 * Identifiers are `[A-Za-z_][A-Za-z0-9_]*`, numbers are `digits[.digits]`
	 * or `.digits`, operators are one of `+ - * / ^`. Whitespace separates
	 * tokens and is otherwise ignored.
	 */
	class Lexer
	{
	public:
		explicit Lexer(std::string_view source) : src(source) {}

		/**
		 * @return Every token in the source followed by one END token
		 * @throws ParseError on a character that starts no token or a malformed number
		 */
		[[nodiscard]] std::vector<Token> tokenize() const;

	private:
		std::string_view src;

		[[nodiscard]] std::size_t scan_number(std::size_t start) const;
		[[nodiscard]] std::size_t scan_identifier(std::size_t start) const;
	};
}
