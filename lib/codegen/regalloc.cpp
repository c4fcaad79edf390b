/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <algorithm>
#include <utility>
#include <fmt/format.h>
#include <ershov/codegen/regalloc.hpp>

namespace ershov
{
	RegisterBudgetExceeded::RegisterBudgetExceeded(const std::uint32_t budget, const std::uint32_t required)
		: std::runtime_error(fmt::format("register budget exceeded: {} available, at least {} required",
		                                 budget, required)),
		  limit(budget), want(required) {}

	RegisterPool::RegisterPool(const std::uint32_t capacity, const bool fixed) : size(capacity), hard_limit(fixed)
	{
		for (Register r = 1; r <= capacity; ++r)
			idle.insert(r);
	}

	Register RegisterPool::acquire()
	{
		if (idle.empty())
		{
			if (hard_limit)
				throw RegisterBudgetExceeded(size, held + 1);

			/* elastic pools only grow when sharing keeps more values live
			 * than the root label accounted for */
			idle.insert(++size);
		}

		const Register reg = *idle.begin();
		idle.erase(idle.begin());
		++held;
		high_water = std::max(high_water, held);
		return reg;
	}

	void RegisterPool::release(const Register reg)
	{
		if (reg == 0 || reg > size || idle.contains(reg))
			throw std::logic_error(fmt::format("release of register R{} which is not held", reg));
		idle.insert(reg);
		--held;
	}

	bool RegisterPool::available(const Register reg) const
	{
		return idle.contains(reg);
	}

	AllocationState::AllocationState(const Dag &dag, RegisterPool registers)
		: pool(std::move(registers)), liveness(dag.size(), 0), assigned(dag.size()), ranges(dag.size())
	{
		for (const DAGNode &n: dag.nodes())
			liveness[n.id] = n.parent_count;
	}

	std::optional<Register> AllocationState::consume(const NodeIndex idx, const std::size_t step)
	{
		if (liveness[idx] > 0)
			--liveness[idx];

		if (ranges[idx])
			ranges[idx]->last_use = step;

		if (liveness[idx] != 0 || !assigned[idx])
			return std::nullopt;

		const Register reg = *assigned[idx];
		pool.release(reg);
		return reg;
	}
}
