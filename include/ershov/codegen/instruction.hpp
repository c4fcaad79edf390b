/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <ershov/foundation/dag.hpp>
#include <ershov/foundation/expression.hpp>

namespace ershov
{
	/** @brief Virtual register number; `R1` is 1 */
	using Register = std::uint32_t;

	/**
	 * @return Printable register name, e.g. `R3`
	 */
	[[nodiscard]] std::string register_name(Register reg);

	/**
	 * @brief Source operand of a three-address instruction
	 */
	struct Operand
	{
		enum class Type : std::uint8_t
		{
			NONE,
			/** @brief Value held in a virtual register */
			REGISTER,
			/** @brief Variable read from memory */
			MEMORY,
			/** @brief Numeric literal encoded in the instruction */
			IMMEDIATE
		};

		Type type = Type::NONE;
		Register reg = 0;
		/** @brief Spelling of a MEMORY or IMMEDIATE operand */
		std::string text;

		static Operand in_register(const Register r)
		{
			return { Type::REGISTER, r, {} };
		}

		static Operand memory(std::string name)
		{
			return { Type::MEMORY, 0, std::move(name) };
		}

		static Operand immediate(std::string literal)
		{
			return { Type::IMMEDIATE, 0, std::move(literal) };
		}

		[[nodiscard]] bool is_register() const
		{
			return type == Type::REGISTER;
		}
	};

	/**
	 * @brief One three-address instruction: `dest = lhs op rhs` or `dest = op lhs`
	 */
	struct Instruction
	{
		Register dest = 0;
		Operator op = Operator::NONE;
		std::array<Operand, 2> operands;
		/**
		 * @brief Leaf copied into the register of `operands[0]` just before
		 *        this instruction; unset when the left operand is already resident
		 */
		std::optional<Operand> load;
		/** @brief DAG node whose value this instruction computes */
		NodeIndex node = INVALID_NODE;

		[[nodiscard]] bool is_unary() const
		{
			return arity(op) == 1;
		}
	};

	[[nodiscard]] std::string to_string(const Operand &operand);

	/**
	 * @brief Render as `Rd = Ra <op> Rb`, `Rd = Ra <op> value` or `Rd = -Ra`
	 *
	 * A pending `load` is not part of the text; `Listing::trace` and `dump`
	 * report it.
	 */
	[[nodiscard]] std::string to_string(const Instruction &insn);
}
