/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <cmath>
#include <stdexcept>
#include <fmt/format.h>
#include <ershov/foundation/expression.hpp>

namespace ershov
{
	std::string_view spelling(const Operator op)
	{
		switch (op)
		{
			case Operator::ADD:
				return "+";
			case Operator::SUB:
			case Operator::NEG:
				return "-";
			case Operator::MUL:
				return "*";
			case Operator::DIV:
				return "/";
			case Operator::POW:
				return "^";
			case Operator::NONE:
				break;
		}
		return "?";
	}

	bool is_commutative(const Operator op)
	{
		return op == Operator::ADD || op == Operator::MUL;
	}

	bool is_associative(const Operator op)
	{
		return op == Operator::ADD || op == Operator::MUL;
	}

	std::size_t arity(const Operator op)
	{
		switch (op)
		{
			case Operator::NONE:
				return 0;
			case Operator::NEG:
				return 1;
			case Operator::ADD:
			case Operator::SUB:
			case Operator::MUL:
			case Operator::DIV:
			case Operator::POW:
				return 2;
		}
		return 0;
	}

	double apply(const Operator op, const double lhs, const double rhs)
	{
		switch (op)
		{
			case Operator::ADD:
				return lhs + rhs;
			case Operator::SUB:
				return lhs - rhs;
			case Operator::MUL:
				return lhs * rhs;
			case Operator::DIV:
				return lhs / rhs;
			case Operator::POW:
				return std::pow(lhs, rhs);
			case Operator::NEG:
				return -lhs;
			case Operator::NONE:
				break;
		}
		throw std::invalid_argument("apply: operator has no semantics");
	}

	std::unique_ptr<Expression> Expression::variable(std::string name, const std::size_t pos)
	{
		auto expr = std::make_unique<Expression>();
		expr->text = std::move(name);
		expr->position = pos;
		return expr;
	}

	std::unique_ptr<Expression> Expression::constant_of(std::string literal, const std::size_t pos)
	{
		auto expr = variable(std::move(literal), pos);
		expr->constant = true;
		return expr;
	}

	std::unique_ptr<Expression> Expression::unary(const Operator op, std::unique_ptr<Expression> operand,
	                                              const std::size_t pos)
	{
		auto expr = std::make_unique<Expression>();
		expr->kind = ExpressionKind::UNARY;
		expr->op = op;
		expr->position = pos;
		expr->lhs = std::move(operand);
		return expr;
	}

	std::unique_ptr<Expression> Expression::binary(const Operator op, std::unique_ptr<Expression> lhs,
	                                               std::unique_ptr<Expression> rhs, const std::size_t pos)
	{
		auto expr = std::make_unique<Expression>();
		expr->kind = ExpressionKind::BINARY;
		expr->op = op;
		expr->position = pos;
		expr->lhs = std::move(lhs);
		expr->rhs = std::move(rhs);
		return expr;
	}

	std::size_t Expression::leaves() const // NOLINT(*-no-recursion)
	{
		switch (kind)
		{
			case ExpressionKind::LEAF:
				return 1;
			case ExpressionKind::UNARY:
				return lhs->leaves();
			case ExpressionKind::BINARY:
				return lhs->leaves() + rhs->leaves();
		}
		return 0;
	}

	double evaluate(const Expression &expr, const Bindings &bindings) // NOLINT(*-no-recursion)
	{
		switch (expr.kind)
		{
			case ExpressionKind::LEAF:
			{
				if (expr.constant)
					return std::stod(expr.text);

				const auto it = bindings.find(expr.text);
				if (it == bindings.end())
					throw std::out_of_range(fmt::format("no binding for variable '{}'", expr.text));
				return it->second;
			}
			case ExpressionKind::UNARY:
				return apply(expr.op, evaluate(*expr.lhs, bindings));
			case ExpressionKind::BINARY:
				return apply(expr.op, evaluate(*expr.lhs, bindings), evaluate(*expr.rhs, bindings));
		}
		return 0.0;
	}

	std::string to_string(const Expression &expr) // NOLINT(*-no-recursion)
	{
		switch (expr.kind)
		{
			case ExpressionKind::LEAF:
				return expr.text;
			case ExpressionKind::UNARY:
				return fmt::format("(-{})", to_string(*expr.lhs));
			case ExpressionKind::BINARY:
				return fmt::format("({} {} {})", to_string(*expr.lhs), spelling(expr.op), to_string(*expr.rhs));
		}
		return {};
	}
}
