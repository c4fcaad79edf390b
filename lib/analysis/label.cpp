/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <algorithm>
#include <vector>
#include <ershov/analysis/label.hpp>
#include <ershov/support/log.hpp>

namespace ershov
{
	std::uint32_t label(Dag &dag)
	{
		if (dag.empty())
			return 0;

		std::vector<bool> seen(dag.size(), false);
		for (NodeIndex idx = 0; idx < dag.size(); ++idx)
		{
			DAGNode &n = dag[idx];
			if (n.is_leaf())
			{
				/* provisional; overwritten below when a parent is reached */
				n.label = 1;
				continue;
			}

			/* operands precede their users in the arena, so the first user
			 * visited here is the leaf's first-encountered parent */
			for (std::size_t slot = 0; slot < n.operands.size(); ++slot)
			{
				const NodeIndex o = n.operands[slot];
				if (dag[o].is_leaf() && !seen[o])
				{
					dag[o].label = slot == 0 ? 1 : 0;
					seen[o] = true;
				}
			}

			/* a shared leaf keeps its first-parent label, but every parent
			 * charges it by the slot it sits in here */
			const std::uint32_t lhs = need(dag, n.operands[0], 0);
			if (n.operands.size() == 1)
				n.label = std::max<std::uint32_t>(lhs, 1);
			else
				n.label = combine(lhs, need(dag, n.operands[1], 1));
		}

		const DAGNode &root = dag.node(dag.root());
		/* a lone leaf still has to be loaded to produce a value */
		if (root.is_leaf())
			dag[root.id].label = 1;

		log_trace("labeled {} nodes, root label {}", dag.size(), dag[dag.root()].label);
		return dag[dag.root()].label;
	}

	std::uint32_t need(const Dag &dag, const NodeIndex operand, const std::size_t slot)
	{
		const DAGNode &n = dag.node(operand);
		if (n.is_leaf())
			return slot == 0 ? 1 : 0;
		return n.label;
	}
}
