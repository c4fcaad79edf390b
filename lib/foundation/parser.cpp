/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <fmt/format.h>
#include <ershov/foundation/parser.hpp>

namespace ershov
{
	namespace
	{
		Operator binary_operator(const char c)
		{
			switch (c)
			{
				case '+':
					return Operator::ADD;
				case '-':
					return Operator::SUB;
				case '*':
					return Operator::MUL;
				case '/':
					return Operator::DIV;
				case '^':
					return Operator::POW;
				default:
					return Operator::NONE;
			}
		}
	}

	std::unique_ptr<Expression> Parser::parse()
	{
		cursor = 0;
		depth = 0;
		if (toks.empty() || toks.back().kind != TokenKind::END)
			toks.push_back({ TokenKind::END, "", toks.empty() ? 0 : toks.back().position + toks.back().text.size() });

		if (peek().kind == TokenKind::END)
			throw ParseError(peek().position, "empty expression");

		auto expr = parse_expression();

		const Token &tail = peek();
		if (tail.kind == TokenKind::RPAREN)
			throw ParseError(tail.position, "unbalanced parentheses: unexpected ')'");
		if (tail.kind != TokenKind::END)
			throw ParseError(tail.position, fmt::format("unexpected trailing input '{}'", tail.text));
		return expr;
	}

	std::unique_ptr<Expression> Parser::parse_expression() // NOLINT(*-no-recursion)
	{
		auto lhs = parse_term();
		while (at_operator('+') || at_operator('-'))
		{
			const Token &op = advance();
			auto rhs = parse_term();
			lhs = Expression::binary(binary_operator(op.text[0]), std::move(lhs), std::move(rhs), op.position);
		}
		return lhs;
	}

	std::unique_ptr<Expression> Parser::parse_term() // NOLINT(*-no-recursion)
	{
		auto lhs = parse_unary();
		while (at_operator('*') || at_operator('/'))
		{
			const Token &op = advance();
			auto rhs = parse_unary();
			lhs = Expression::binary(binary_operator(op.text[0]), std::move(lhs), std::move(rhs), op.position);
		}
		return lhs;
	}

	std::unique_ptr<Expression> Parser::parse_unary() // NOLINT(*-no-recursion)
	{
		if (at_operator('+'))
		{
			advance();
			return parse_unary();
		}

		if (at_operator('-'))
		{
			const std::size_t pos = advance().position;
			auto operand = parse_unary();

			/* negated literals stay literals so `-3` reads as one leaf */
			if (operand->kind == ExpressionKind::LEAF && operand->constant)
			{
				if (operand->text.starts_with('-'))
					operand->text.erase(0, 1);
				else
					operand->text.insert(0, 1, '-');
				operand->position = pos;
				return operand;
			}
			return Expression::unary(Operator::NEG, std::move(operand), pos);
		}

		return parse_power();
	}

	std::unique_ptr<Expression> Parser::parse_power() // NOLINT(*-no-recursion)
	{
		auto base = parse_primary();
		if (at_operator('^'))
		{
			const std::size_t pos = advance().position;
			/* recursing through unary makes `^` right-associative and admits `2^-1` */
			auto exponent = parse_unary();
			return Expression::binary(Operator::POW, std::move(base), std::move(exponent), pos);
		}
		return base;
	}

	std::unique_ptr<Expression> Parser::parse_primary() // NOLINT(*-no-recursion)
	{
		const Token &tok = peek();
		switch (tok.kind)
		{
			case TokenKind::IDENTIFIER:
				advance();
				return Expression::variable(tok.text, tok.position);
			case TokenKind::NUMBER:
				advance();
				return Expression::constant_of(tok.text, tok.position);
			case TokenKind::LPAREN:
			{
				const std::size_t open = advance().position;
				++depth;
				auto inner = parse_expression();
				if (peek().kind != TokenKind::RPAREN)
				{
					throw ParseError(peek().position,
					                 fmt::format("unbalanced parentheses: missing ')' for '(' at {}", open));
				}
				advance();
				--depth;
				return inner;
			}
			case TokenKind::RPAREN:
				if (depth == 0)
					throw ParseError(tok.position, "unbalanced parentheses: unexpected ')'");
				throw ParseError(tok.position, "missing operand before ')'");
			case TokenKind::OPERATOR:
				throw ParseError(tok.position, fmt::format("unexpected operator '{}'", tok.text));
			case TokenKind::END:
				break;
		}
		throw ParseError(tok.position, "missing operand at end of input");
	}

	const Token &Parser::peek() const
	{
		return toks[cursor];
	}

	const Token &Parser::advance()
	{
		const Token &tok = toks[cursor];
		if (tok.kind != TokenKind::END)
			++cursor;
		return tok;
	}

	bool Parser::at_operator(const char op) const
	{
		const Token &tok = peek();
		return tok.kind == TokenKind::OPERATOR && tok.text[0] == op;
	}

	std::unique_ptr<Expression> parse(const std::string_view text)
	{
		Parser parser(Lexer(text).tokenize());
		return parser.parse();
	}
}
