/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <stdexcept>
#include <vector>
#include <ershov/codegen/instruction.hpp>
#include <ershov/foundation/dag.hpp>

namespace ershov
{
	/**
	 * @brief A fixed register budget cannot hold the values that must be live
	 */
	class RegisterBudgetExceeded : public std::runtime_error
	{
	public:
		RegisterBudgetExceeded(std::uint32_t budget, std::uint32_t required);

		[[nodiscard]] std::uint32_t budget() const noexcept
		{
			return limit;
		}

		/**
		 * @return Registers the evaluation needs; a lower bound when raised mid-generation
		 */
		[[nodiscard]] std::uint32_t required() const noexcept
		{
			return want;
		}

	private:
		std::uint32_t limit;
		std::uint32_t want;
	};

	/**
	 * @brief Pool of virtual registers `R1..Rk`
	 *
	 * `acquire` always hands out the lowest free register so a result can land
	 * in the register one of its operands just released. A fixed pool throws
	 * once exhausted; an elastic pool grows by one register instead.
	 */
	class RegisterPool
	{
	public:
		/**
		 * @param capacity Initial number of registers
		 * @param fixed true if `capacity` is a hard budget
		 */
		explicit RegisterPool(std::uint32_t capacity, bool fixed = false);

		/**
		 * @return Lowest free register
		 * @throws RegisterBudgetExceeded if the pool is fixed and empty
		 */
		Register acquire();

		/**
		 * @brief Return a register to the pool
		 * @throws std::logic_error if `reg` is not currently held
		 */
		void release(Register reg);

		[[nodiscard]] bool available(Register reg) const;

		/**
		 * @return Registers currently held
		 */
		[[nodiscard]] std::uint32_t pressure() const
		{
			return held;
		}

		/**
		 * @return Highest pressure seen since construction
		 */
		[[nodiscard]] std::uint32_t peak() const
		{
			return high_water;
		}

		[[nodiscard]] std::uint32_t capacity() const
		{
			return size;
		}

		[[nodiscard]] bool fixed() const
		{
			return hard_limit;
		}

	private:
		std::set<Register> idle;
		std::uint32_t size;
		std::uint32_t held = 0;
		std::uint32_t high_water = 0;
		bool hard_limit;
	};

	/**
	 * @brief Steps at which a computed value is defined and last consumed
	 */
	struct LiveRange
	{
		std::size_t def = 0;
		std::size_t last_use = 0;
	};

	/**
	 * @brief Mutable state threaded through one code generation run
	 *
	 * One instance per DAG being generated, so independent runs never share
	 * any of it.
	 */
	struct AllocationState
	{
		RegisterPool pool;
		/** @brief Remaining uses per node, starting at its parent count */
		std::vector<std::uint32_t> liveness;
		/** @brief Result register per OPERATION node once emitted */
		std::vector<std::optional<Register>> assigned;
		/** @brief Live range per OPERATION node once emitted */
		std::vector<std::optional<LiveRange>> ranges;

		AllocationState(const Dag &dag, RegisterPool registers);

		/**
		 * @brief Consume one use of `idx` at step `step`
		 * @return Register released by this use, if it was the last one
		 */
		std::optional<Register> consume(NodeIndex idx, std::size_t step);
	};
}
