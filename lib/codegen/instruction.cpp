/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <fmt/format.h>
#include <ershov/codegen/instruction.hpp>

namespace ershov
{
	std::string register_name(const Register reg)
	{
		return fmt::format("R{}", reg);
	}

	std::string to_string(const Operand &operand)
	{
		switch (operand.type)
		{
			case Operand::Type::REGISTER:
				return register_name(operand.reg);
			case Operand::Type::MEMORY:
			case Operand::Type::IMMEDIATE:
				return operand.text;
			case Operand::Type::NONE:
				break;
		}
		return "?";
	}

	std::string to_string(const Instruction &insn)
	{
		if (insn.is_unary())
			return fmt::format("{} = {}{}", register_name(insn.dest), spelling(insn.op), to_string(insn.operands[0]));

		return fmt::format("{} = {} {} {}", register_name(insn.dest), to_string(insn.operands[0]),
		                   spelling(insn.op), to_string(insn.operands[1]));
	}
}
