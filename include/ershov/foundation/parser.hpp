/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <memory>
#include <string_view>
#include <vector>
#include <ershov/foundation/expression.hpp>
#include <ershov/foundation/lexer.hpp>

namespace ershov
{
	/**
	 * @brief Recursive descent parser for infix arithmetic
	 *
	 * Grammar, lowest precedence first:
	 *
	 *     expression := term (('+' | '-') term)*
	 *     term       := unary (('*' | '/') unary)*
	 *     unary      := ('-' | '+') unary | power
	 *     power      := primary ('^' unary)?
	 *     primary    := identifier | number | '(' expression ')'
	 *
	 * so `+ - * /` associate to the left, `^` to the right, and `-a^2`
	 * parses as `-(a^2)`. Negating a numeric literal folds into the literal.
	 */
	class Parser
	{
	public:
		explicit Parser(std::vector<Token> tokens) : toks(std::move(tokens)) {}

		/**
		 * @return Tree for the whole token stream
		 * @throws ParseError if the stream is not exactly one expression
		 */
		std::unique_ptr<Expression> parse();

	private:
		std::vector<Token> toks;
		std::size_t cursor = 0;
		std::size_t depth = 0;

		std::unique_ptr<Expression> parse_expression();
		std::unique_ptr<Expression> parse_term();
		std::unique_ptr<Expression> parse_unary();
		std::unique_ptr<Expression> parse_power();
		std::unique_ptr<Expression> parse_primary();

		[[nodiscard]] const Token &peek() const;
		const Token &advance();
		[[nodiscard]] bool at_operator(char op) const;
	};

	/**
	 * @brief Tokenize and parse in one call
	 * @throws ParseError on malformed input; no partial tree is returned
	 */
	std::unique_ptr<Expression> parse(std::string_view text);
}
