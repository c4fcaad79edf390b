/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <array>
#include <stdexcept>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <ershov/analysis/label.hpp>
#include <ershov/codegen/codegen.hpp>
#include <ershov/support/log.hpp>

namespace ershov
{
	namespace
	{
		class Emitter
		{
		public:
			Emitter(const Dag &d, Listing &l) : dag(d), listing(l) {}

			Register evaluate(NodeIndex idx, AllocationState &state);

		private:
			const Dag &dag;
			Listing &listing;

			[[nodiscard]] Operand leaf_operand(NodeIndex idx) const
			{
				const DAGNode &n = dag[idx];
				const auto text = std::string(dag.spelling(idx));
				return n.kind == NodeKind::CONSTANT ? Operand::immediate(text) : Operand::memory(text);
			}
		};

		Register Emitter::evaluate(const NodeIndex idx, AllocationState &state) // NOLINT(*-no-recursion)
		{
			/* shared subexpressions are emitted once */
			if (state.assigned[idx])
				return *state.assigned[idx];

			const DAGNode &n = dag[idx];
			const std::size_t count = n.operands.size();

			std::array<std::size_t, 2> order = { 0, 1 };
			if (count == 2 && need(dag, n.operands[1], 1) > need(dag, n.operands[0], 0))
				order = { 1, 0 };

			Instruction insn;
			insn.op = n.op;
			insn.node = idx;

			std::vector<std::string> notes;
			std::vector<Register> touched;
			std::optional<Register> loaded;

			for (std::size_t k = 0; k < count; ++k)
			{
				const std::size_t slot = order[k];
				const NodeIndex o = n.operands[slot];
				const DAGNode &operand = dag[o];

				if (operand.is_leaf())
				{
					if (slot == 0)
					{
						/* the left operand must be resident before the operation */
						loaded = state.pool.acquire();
						insn.load = leaf_operand(o);
						insn.operands[slot] = Operand::in_register(*loaded);
						notes.push_back(fmt::format("load {} into {}", dag.spelling(o), register_name(*loaded)));
						touched.push_back(*loaded);
					}
					else
					{
						insn.operands[slot] = leaf_operand(o);
						if (operand.kind == NodeKind::CONSTANT)
							notes.push_back(fmt::format("use literal {}", dag.spelling(o)));
						else
							notes.push_back(fmt::format("read {} from memory", dag.spelling(o)));
					}
					continue;
				}

				const bool cached = state.assigned[o].has_value();
				const Register reg = evaluate(o, state);
				insn.operands[slot] = Operand::in_register(reg);
				if (cached)
					notes.push_back(fmt::format("reuse {} holding n{}", register_name(reg), o));
				touched.push_back(reg);
			}

			const std::size_t step = listing.instructions.size();
			for (std::size_t slot = 0; slot < count; ++slot)
			{
				if (const auto released = state.consume(n.operands[slot], step))
				{
					notes.push_back(fmt::format("free {}", register_name(*released)));
					touched.push_back(*released);
				}
			}
			if (loaded)
				state.pool.release(*loaded);

			insn.dest = state.pool.acquire();
			state.assigned[idx] = insn.dest;
			state.ranges[idx] = LiveRange { .def = step, .last_use = step };
			notes.push_back(fmt::format("n{} ({}) -> {}", idx, dag.expression(idx), register_name(insn.dest)));
			touched.push_back(insn.dest);

			const std::string text = to_string(insn);
			log_trace("emit {}", text);
			listing.steps.push_back({ fmt::format("{}: {}", text, fmt::join(notes, ", ")), std::move(touched) });
			listing.instructions.push_back(std::move(insn));
			return listing.instructions.back().dest;
		}
	}

	std::vector<std::string> Listing::code() const
	{
		std::vector<std::string> lines;
		lines.reserve(instructions.size());
		for (const Instruction &insn: instructions)
			lines.push_back(to_string(insn));
		return lines;
	}

	std::vector<std::string> Listing::trace() const
	{
		std::vector<std::string> lines;
		lines.reserve(steps.size());
		for (const AllocationStep &step: steps)
			lines.push_back(step.text);
		return lines;
	}

	Listing generate(const Dag &dag, const GenerateOptions &options)
	{
		Listing listing;
		if (dag.empty())
			return listing;

		const DAGNode &root = dag.node(dag.root());
		if (root.label == 0)
			throw std::logic_error("generate: DAG has not been labeled");

		listing.min_registers = root.label;
		if (options.register_budget && *options.register_budget < root.label)
			throw RegisterBudgetExceeded(*options.register_budget, root.label);

		const std::uint32_t capacity = options.register_budget.value_or(root.label);
		AllocationState state(dag, RegisterPool(capacity, options.register_budget.has_value()));

		if (root.is_operation())
		{
			Emitter emitter(dag, listing);
			listing.result = emitter.evaluate(root.id, state);
		}

		listing.assignments = state.assigned;
		listing.live_ranges = state.ranges;
		listing.peak = state.pool.peak();
		log_debug("generated {} instructions, {} registers labeled, {} used",
		          listing.instructions.size(), listing.min_registers, listing.peak);
		return listing;
	}

	void annotate(Dag &dag, const Listing &listing)
	{
		for (NodeIndex idx = 0; idx < dag.size() && idx < listing.assignments.size(); ++idx)
			dag[idx].reg = listing.assignments[idx];
	}
}
