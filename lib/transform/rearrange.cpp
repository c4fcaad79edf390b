/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <algorithm>
#include <map>
#include <numeric>
#include <utility>
#include <ershov/analysis/label.hpp>
#include <ershov/support/log.hpp>
#include <ershov/transform/rearrange.hpp>

namespace ershov
{
	namespace
	{
		/* register need of a placed value in operand slot `slot`; leaves are
		 * resident on the left and read from memory on the right */
		template<typename T>
		std::uint32_t slot_need(const T &value, const std::size_t slot)
		{
			if (value.leaf)
				return slot == 0 ? 1 : 0;
			return value.weight;
		}
	}

	Rearranger::Rearranger(const Dag &dag, const RearrangeOptions opts) : source(dag), options(opts) {}

	Dag Rearranger::run()
	{
		rewritten = false;
		target = Dag {};
		memo.assign(source.size(), std::nullopt);
		if (source.empty())
			return Dag {};

		Dag baseline = source;
		const std::uint32_t before = label(baseline);

		const Built top = visit(source.root(), 0);
		target.set_root(top.idx);
		const std::uint32_t after = label(target);

		/* only a strictly lower root label justifies the rewrite; anything
		 * else returns the input unchanged */
		if (after < before)
		{
			rewritten = true;
			log_debug("rearranged: root label {} -> {}, {} -> {} nodes", before, after, source.size(), target.size());
			return std::move(target);
		}

		log_debug("rearrangement kept the input: best label {} vs {}", after, before);
		return baseline;
	}

	Rearranger::Built Rearranger::visit(const NodeIndex idx, const std::uint32_t depth) // NOLINT(*-no-recursion)
	{
		if (memo[idx])
			return *memo[idx];

		const DAGNode &n = source[idx];
		Built built;
		if (n.is_leaf() || depth >= options.max_depth)
			built = copy(idx);
		else if (n.operands.size() == 2 && is_commutative(n.op) && is_associative(n.op))
			built = chain(idx, depth);
		else
		{
			std::vector<Built> children;
			for (const NodeIndex o: n.operands)
				children.push_back(visit(o, depth + 1));
			built = place(n.op, children);
		}

		memo[idx] = built;
		return built;
	}

	Rearranger::Built Rearranger::copy(const NodeIndex idx) // NOLINT(*-no-recursion)
	{
		if (memo[idx])
			return *memo[idx];

		const DAGNode &n = source[idx];
		Built built;
		if (n.is_leaf())
		{
			const std::string_view text = source.spelling(idx);
			built.idx = n.kind == NodeKind::CONSTANT ? target.constant(text) : target.variable(text);
			built.leaf = true;
		}
		else
		{
			std::vector<Built> children;
			for (const NodeIndex o: n.operands)
				children.push_back(copy(o));
			built = place(n.op, children);
		}

		memo[idx] = built;
		return built;
	}

	Rearranger::Built Rearranger::chain(const NodeIndex idx, const std::uint32_t depth) // NOLINT(*-no-recursion)
	{
		const Operator op = source[idx].op;

		Shape original;
		std::vector<NodeIndex> list;
		original.root = flatten(idx, op, true, original, list);

		std::vector<Built> operands;
		operands.reserve(list.size());
		for (const NodeIndex o: list)
			operands.push_back(visit(o, depth + 1));

		std::vector<int> in_order(operands.size());
		std::iota(in_order.begin(), in_order.end(), 0);

		/* heaviest operations first, leaves last so they end up in right slots */
		std::vector<int> heavy = in_order;
		std::ranges::stable_sort(heavy, [&](const int a, const int b)
		{
			const Built &x = operands[a];
			const Built &y = operands[b];
			if (x.leaf != y.leaf)
				return !x.leaf;
			return x.weight > y.weight;
		});

		std::vector<Shape> candidates;
		candidates.push_back(std::move(original));
		candidates.push_back(left_deep(in_order, operands));
		candidates.push_back(left_deep(heavy, operands));
		candidates.push_back(balanced(in_order, operands));
		candidates.push_back(balanced(heavy, operands));

		std::size_t best = 0;
		std::uint32_t best_weight = 0;
		std::size_t best_nodes = 0;
		for (std::size_t k = 0; k < candidates.size(); ++k)
		{
			score(candidates[k], operands);
			const std::uint32_t weight = candidates[k].nodes[candidates[k].root].weight;
			const std::size_t nodes = distinct_nodes(candidates[k], operands);
			if (k == 0 || weight < best_weight || (weight == best_weight && nodes < best_nodes))
			{
				best = k;
				best_weight = weight;
				best_nodes = nodes;
			}
		}

		log_trace("chain n{} of {} operands: shape {} with estimate {}", idx, operands.size(), best, best_weight);

		const Shape &chosen = candidates[best];
		return Built { .idx = materialize(op, chosen, chosen.root, operands), .weight = best_weight, .leaf = false };
	}

	int Rearranger::flatten(const NodeIndex idx, const Operator op, const bool top, Shape &original, // NOLINT(*-no-recursion)
	                        std::vector<NodeIndex> &operands) const
	{
		const DAGNode &n = source[idx];
		/* a shared inner node stays one operand so every parent keeps using it */
		const bool inner = n.is_operation() && n.op == op && n.operands.size() == 2 && (top || n.parent_count == 1);
		if (!inner)
		{
			operands.push_back(idx);
			return add_operand(original, static_cast<int>(operands.size() - 1));
		}

		const int lhs = flatten(n.operands[0], op, false, original, operands);
		const int rhs = flatten(n.operands[1], op, false, original, operands);
		return join(original, lhs, rhs);
	}

	int Rearranger::add_operand(Shape &shape, const int position)
	{
		Shape::Element e;
		e.operand = position;
		shape.nodes.push_back(e);
		return static_cast<int>(shape.nodes.size() - 1);
	}

	int Rearranger::join(Shape &shape, const int lhs, const int rhs)
	{
		Shape::Element e;
		e.lhs = lhs;
		e.rhs = rhs;
		shape.nodes.push_back(e);
		return static_cast<int>(shape.nodes.size() - 1);
	}

	Rearranger::Shape Rearranger::left_deep(const std::vector<int> &order, const std::vector<Built> &operands)
	{
		Shape shape;
		shape.nodes.reserve(operands.size() * 2);
		int acc = add_operand(shape, order[0]);
		for (std::size_t k = 1; k < order.size(); ++k)
			acc = join(shape, acc, add_operand(shape, order[k]));
		shape.root = acc;
		return shape;
	}

	Rearranger::Shape Rearranger::balanced(const std::vector<int> &order, const std::vector<Built> &operands)
	{
		Shape shape;
		shape.nodes.reserve(operands.size() * 2);
		shape.root = balanced_range(shape, order, 0, order.size());
		return shape;
	}

	int Rearranger::balanced_range(Shape &shape, const std::vector<int> &order, // NOLINT(*-no-recursion)
	                               const std::size_t begin, const std::size_t end)
	{
		if (end - begin == 1)
			return add_operand(shape, order[begin]);

		const std::size_t mid = begin + (end - begin) / 2;
		const int lhs = balanced_range(shape, order, begin, mid);
		const int rhs = balanced_range(shape, order, mid, end);
		return join(shape, lhs, rhs);
	}

	void Rearranger::score(Shape &shape, const std::vector<Built> &operands)
	{
		/* children always precede their join, so one forward sweep suffices */
		for (Shape::Element &e: shape.nodes)
		{
			if (e.operand >= 0)
			{
				e.leaf = operands[e.operand].leaf;
				e.weight = operands[e.operand].weight;
				continue;
			}

			const Shape::Element &lhs = shape.nodes[e.lhs];
			const Shape::Element &rhs = shape.nodes[e.rhs];
			const std::uint32_t keep = combine(slot_need(lhs, 0), slot_need(rhs, 1));
			const std::uint32_t swap = combine(slot_need(rhs, 0), slot_need(lhs, 1));
			e.leaf = false;
			e.swapped = swap < keep;
			e.weight = std::min(keep, swap);
		}
	}

	std::size_t Rearranger::distinct_nodes(const Shape &shape, const std::vector<Built> &operands)
	{
		/* joins are keyed by their unordered pair of children, mirroring how
		 * the target arena will hash-cons them */
		constexpr std::uint64_t first_join = std::uint64_t { 1 } << 32;
		std::vector<std::uint64_t> canon(shape.nodes.size(), 0);
		std::map<std::pair<std::uint64_t, std::uint64_t>, std::uint64_t> joins;
		std::uint64_t next = first_join;

		for (std::size_t k = 0; k < shape.nodes.size(); ++k)
		{
			const Shape::Element &e = shape.nodes[k];
			if (e.operand >= 0)
			{
				canon[k] = operands[e.operand].idx;
				continue;
			}

			const auto [low, high] = std::minmax(canon[e.lhs], canon[e.rhs]);
			const auto [it, inserted] = joins.try_emplace(std::make_pair(low, high), next);
			if (inserted)
				++next;
			canon[k] = it->second;
		}
		return joins.size();
	}

	NodeIndex Rearranger::materialize(const Operator op, const Shape &shape, const int at, // NOLINT(*-no-recursion)
	                                  const std::vector<Built> &operands)
	{
		const Shape::Element &e = shape.nodes[at];
		if (e.operand >= 0)
			return operands[e.operand].idx;

		const NodeIndex lhs = materialize(op, shape, e.lhs, operands);
		const NodeIndex rhs = materialize(op, shape, e.rhs, operands);
		return e.swapped ? target.operation(op, rhs, lhs) : target.operation(op, lhs, rhs);
	}

	Rearranger::Built Rearranger::place(const Operator op, const std::vector<Built> &children)
	{
		Built built;
		if (children.size() == 1)
		{
			built.idx = target.operation(op, children[0].idx);
			built.weight = std::max<std::uint32_t>(slot_need(children[0], 0), 1);
		}
		else
		{
			built.idx = target.operation(op, children[0].idx, children[1].idx);
			built.weight = combine(slot_need(children[0], 0), slot_need(children[1], 1));
		}
		return built;
	}

	Dag rearrange(const Dag &dag, const RearrangeOptions &options)
	{
		Rearranger rearranger(dag, options);
		return rearranger.run();
	}
}
