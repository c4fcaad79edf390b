/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ershov
{
	/**
	 * @brief Arithmetic operators understood by every stage of the pipeline
	 */
	enum class Operator : std::uint8_t
	{
		NONE,
		/** @brief Binary addition; commutative and associative */
		ADD,
		/** @brief Binary subtraction */
		SUB,
		/** @brief Binary multiplication; commutative and associative */
		MUL,
		/** @brief Binary division */
		DIV,
		/** @brief Exponentiation; right-associative */
		POW,
		/** @brief Unary negation */
		NEG
	};

	/**
	 * @return Source spelling of the operator (`-` for both SUB and NEG)
	 */
	[[nodiscard]] std::string_view spelling(Operator op);

	/**
	 * @return true if operands of `op` may be swapped
	 */
	[[nodiscard]] bool is_commutative(Operator op);

	/**
	 * @return true if a chain of `op` may be re-bracketed
	 */
	[[nodiscard]] bool is_associative(Operator op);

	/**
	 * @return Number of operands `op` takes (1 or 2, 0 for NONE)
	 */
	[[nodiscard]] std::size_t arity(Operator op);

	/**
	 * @brief Evaluate `op` on concrete values
	 * @throws std::invalid_argument for NONE or an arity mismatch
	 */
	[[nodiscard]] double apply(Operator op, double lhs, double rhs = 0.0);

	enum class ExpressionKind : std::uint8_t
	{
		/** @brief Variable or numeric literal */
		LEAF,
		/** @brief Negation of a single operand */
		UNARY,
		/** @brief Operator applied to an ordered pair of operands */
		BINARY
	};

	/**
	 * @brief Abstract syntax tree produced by the parser
	 *
	 * Operand order is exactly the source order. Leaves keep their source
	 * spelling so numeric literals round-trip unchanged into instructions.
	 */
	struct Expression
	{
		ExpressionKind kind = ExpressionKind::LEAF;
		Operator op = Operator::NONE;
		/** @brief Leaf spelling; empty for operator nodes */
		std::string text;
		/** @brief true if the leaf is a numeric literal */
		bool constant = false;
		/** @brief Byte offset of the node in the source text */
		std::size_t position = 0;
		std::unique_ptr<Expression> lhs;
		std::unique_ptr<Expression> rhs;

		static std::unique_ptr<Expression> variable(std::string name, std::size_t pos = 0);
		static std::unique_ptr<Expression> constant_of(std::string literal, std::size_t pos = 0);
		static std::unique_ptr<Expression> unary(Operator op, std::unique_ptr<Expression> operand, std::size_t pos = 0);
		static std::unique_ptr<Expression> binary(Operator op, std::unique_ptr<Expression> lhs,
		                                          std::unique_ptr<Expression> rhs, std::size_t pos = 0);

		/**
		 * @return Number of leaf occurrences in the tree
		 */
		[[nodiscard]] std::size_t leaves() const;
	};

	using Bindings = std::unordered_map<std::string, double>;

	/**
	 * @brief Evaluate the tree directly
	 * @param expr Tree to evaluate
	 * @param bindings Values for every variable in the tree
	 * @throws std::out_of_range if a variable has no binding
	 */
	[[nodiscard]] double evaluate(const Expression &expr, const Bindings &bindings);

	/**
	 * @brief Render the tree fully parenthesized, e.g. `((a + b) * c)`
	 */
	[[nodiscard]] std::string to_string(const Expression &expr);
}
