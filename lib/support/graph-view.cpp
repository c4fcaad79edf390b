/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <ershov/codegen/codegen.hpp>
#include <ershov/support/graph-view.hpp>

namespace ershov
{
	GraphView project(const Dag &dag, const Listing *listing)
	{
		GraphView view;
		view.nodes.reserve(dag.size());

		for (const DAGNode &n: dag.nodes())
		{
			GraphView::Node node;
			node.id = n.id;
			node.label = std::string(dag.spelling(n.id));
			node.group = n.is_leaf() ? "variable" : "operation";
			node.rank = n.label;
			if (listing && n.id < listing->assignments.size() && listing->assignments[n.id])
				node.reg = register_name(*listing->assignments[n.id]);
			else if (n.reg)
				node.reg = register_name(*n.reg);
			view.nodes.push_back(std::move(node));

			for (std::size_t slot = 0; slot < n.operands.size(); ++slot)
			{
				const NodeIndex o = n.operands[slot];
				if (slot > 0 && o == n.operands[0])
					continue;
				view.edges.push_back({ .from = o, .to = n.id });
			}
		}

		return view;
	}
}
