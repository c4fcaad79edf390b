/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <string>
#include <fmt/ostream.h>
#include <ershov/codegen/codegen.hpp>
#include <ershov/foundation/dag.hpp>
#include <ershov/foundation/pipeline.hpp>
#include <ershov/support/dump.hpp>
#include <ershov/support/graph-view.hpp>

namespace ershov
{
	namespace
	{
		std::string kind_name(const NodeKind kind)
		{
			switch (kind)
			{
				case NodeKind::VARIABLE:
					return "var";
				case NodeKind::CONSTANT:
					return "const";
				case NodeKind::OPERATION:
					return "op";
			}
			return "?";
		}

		void print_node(const Dag &dag, const DAGNode &n, std::ostream &os)
		{
			fmt::print(os, "  n{} = ", n.id);
			if (n.is_leaf())
				fmt::print(os, "{} {}", kind_name(n.kind), dag.spelling(n.id));
			else if (n.operands.size() == 1)
				fmt::print(os, "{}n{}", spelling(n.op), n.operands[0]);
			else
				fmt::print(os, "n{} {} n{}", n.operands[0], spelling(n.op), n.operands[1]);

			fmt::print(os, "  ; label {}, parents {}", n.label, n.parent_count);
			if (n.reg)
				fmt::print(os, ", {}", register_name(*n.reg));
			fmt::print(os, "\n");
		}

		void print_bundle(const char *name, const Result &result, std::ostream &os)
		{
			fmt::print(os, "{}: min registers {}\n", name, result.min_registers);
			for (std::size_t i = 0; i < result.three_address_code.size(); ++i)
			{
				fmt::print(os, "  {}\n", result.three_address_code[i]);
				if (i < result.steps.size())
					fmt::print(os, "    ; {}\n", result.steps[i]);
			}
			dump(result.graph, os);
		}
	}

	void dump(const Dag &dag, std::ostream &os)
	{
		fmt::print(os, "dag ({} nodes):\n", dag.size());
		for (const DAGNode &n: dag.nodes())
			print_node(dag, n, os);
		if (!dag.empty())
			fmt::print(os, "  root n{}\n", dag.root());
	}

	void dump(const Listing &listing, std::ostream &os)
	{
		fmt::print(os, "listing ({} instructions, min registers {}, peak {}):\n",
		           listing.instructions.size(), listing.min_registers, listing.peak);
		for (std::size_t i = 0; i < listing.instructions.size(); ++i)
		{
			const Instruction &insn = listing.instructions[i];
			if (insn.load)
				fmt::print(os, "       {} <- {}\n", to_string(insn.operands[0]), to_string(*insn.load));
			fmt::print(os, "  {:>3}: {}\n", i, to_string(insn));
			if (i < listing.steps.size())
				fmt::print(os, "       ; {}\n", listing.steps[i].text);
		}

		for (std::size_t idx = 0; idx < listing.live_ranges.size(); ++idx)
		{
			const auto &range = listing.live_ranges[idx];
			if (!range || !listing.assignments[idx])
				continue;
			fmt::print(os, "  live n{} in {}: [{}, {}]\n", idx, register_name(*listing.assignments[idx]),
			           range->def, range->last_use);
		}

		if (listing.result)
			fmt::print(os, "  result {}\n", register_name(*listing.result));
	}

	void dump(const GraphView &view, std::ostream &os)
	{
		fmt::print(os, "graph ({} nodes, {} edges):\n", view.nodes.size(), view.edges.size());
		for (const GraphView::Node &node: view.nodes)
		{
			fmt::print(os, "  [{}] {} ({}, rank {}", node.id, node.label, node.group, node.rank);
			if (node.reg)
				fmt::print(os, ", {}", *node.reg);
			fmt::print(os, ")\n");
		}
		for (const GraphView::Edge &edge: view.edges)
			fmt::print(os, "  {} -> {}\n", edge.from, edge.to);
	}

	void dump(const Report &report, std::ostream &os)
	{
		if (!report.success)
		{
			fmt::print(os, "error: {}\n", report.error);
			return;
		}

		print_bundle("original", report.original, os);
		print_bundle("rearranged", report.rearranged, os);
	}

	void dump_dbg(const Dag &dag)
	{
		dump(dag, std::cerr);
	}

	void dump_dbg(const Listing &listing)
	{
		dump(listing, std::cerr);
	}
}
