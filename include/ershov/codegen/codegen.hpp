/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <ershov/codegen/instruction.hpp>
#include <ershov/codegen/regalloc.hpp>
#include <ershov/foundation/dag.hpp>

namespace ershov
{
	struct GenerateOptions
	{
		/** @brief Hard register limit; unset sizes the pool to the root label */
		std::optional<std::uint32_t> register_budget;
	};

	/**
	 * @brief Human-readable account of the allocation decisions behind one instruction
	 */
	struct AllocationStep
	{
		std::string text;
		/** @brief Registers loaded, read, released or written, in mention order */
		std::vector<Register> registers;
	};

	/**
	 * @brief Output of one code generation run
	 */
	struct Listing
	{
		/** @brief One instruction per OPERATION node, in emission order */
		std::vector<Instruction> instructions;
		/** @brief `steps[i]` describes `instructions[i]` */
		std::vector<AllocationStep> steps;
		/** @brief Result register per node; leaves stay empty */
		std::vector<std::optional<Register>> assignments;
		/** @brief Live range per node; leaves stay empty */
		std::vector<std::optional<LiveRange>> live_ranges;
		/** @brief Root label of the generated DAG */
		std::uint32_t min_registers = 0;
		/** @brief Most registers held at once during emission */
		std::uint32_t peak = 0;
		/** @brief Register holding the final value; empty for a lone leaf */
		std::optional<Register> result;

		[[nodiscard]] std::vector<std::string> code() const;
		[[nodiscard]] std::vector<std::string> trace() const;
	};

	/**
	 * @brief Emit register-allocated three-address code for a labeled DAG
	 *
	 * Walks the DAG post-order from the root, evaluating the operand with the
	 * larger label first (left first on ties). Every OPERATION node is emitted
	 * exactly once; later uses read its register until its liveness counter
	 * reaches zero.
	 *
	 * @param dag Labeled DAG
	 * @param options Register budget
	 * @return Instructions, allocation steps and per-node results
	 * @throws RegisterBudgetExceeded if a budget is set and is too small
	 * @throws std::logic_error if the DAG has no labels
	 */
	Listing generate(const Dag &dag, const GenerateOptions &options = {});

	/**
	 * @brief Copy the registers of a Listing onto the nodes it was generated from
	 */
	void annotate(Dag &dag, const Listing &listing);
}
