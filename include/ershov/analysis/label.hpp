/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <ershov/foundation/dag.hpp>

namespace ershov
{
	/**
	 * @brief Sethi-Ullman labeling
	 *
	 * Fills `DAGNode::label` for every node in one pass over the arena, which
	 * is already in dependency order. A leaf is labeled from its first parent
	 * (lowest arena index, first slot within it): 1 in the leftmost slot since
	 * the value must be resident, 0 otherwise since it can be read straight
	 * from memory. A parentless leaf is labeled 1. Operations charge each
	 * operand by `need` for the slot it occupies, so a leaf shared between a
	 * right slot and a later left slot costs a register where it is loaded.
	 * Binary nodes take `max(l, r)` when the operand needs differ and `l + 1`
	 * when they are equal; unary nodes take `max(l, 1)`.
	 *
	 * @param dag DAG to label in place
	 * @return Label of the root, or 0 for an empty DAG
	 */
	std::uint32_t label(Dag &dag);

	/**
	 * @brief Label a binary node from its operand labels
	 */
	[[nodiscard]] constexpr std::uint32_t combine(const std::uint32_t lhs, const std::uint32_t rhs)
	{
		return lhs == rhs ? lhs + 1 : (lhs > rhs ? lhs : rhs);
	}

	/**
	 * @brief Register need of `operand` when it sits in operand slot `slot`
	 *
	 * Differs from the stored label only for leaves shared between slots: a
	 * leaf is resident (1) in slot 0 and a memory operand (0) elsewhere.
	 */
	[[nodiscard]] std::uint32_t need(const Dag &dag, NodeIndex operand, std::size_t slot);
}
