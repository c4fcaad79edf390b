/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <algorithm>
#include <stdexcept>
#include <fmt/format.h>
#include <ershov/foundation/dag.hpp>

namespace ershov
{
	namespace
	{
		template<typename T>
		std::size_t hash_combine(const std::size_t seed, const T &value)
		{
			return seed ^ (std::hash<T>{}(value) + 0x9e3779b9 + (seed << 6) + (seed >> 2));
		}

		NodeIndex build_node(Dag &dag, const Expression &expr) // NOLINT(*-no-recursion)
		{
			switch (expr.kind)
			{
				case ExpressionKind::LEAF:
					return expr.constant ? dag.constant(expr.text) : dag.variable(expr.text);
				case ExpressionKind::UNARY:
					return dag.operation(expr.op, build_node(dag, *expr.lhs));
				case ExpressionKind::BINARY:
				{
					/* post-order: both operands exist before the node that uses them */
					const NodeIndex lhs = build_node(dag, *expr.lhs);
					const NodeIndex rhs = build_node(dag, *expr.rhs);
					return dag.operation(expr.op, lhs, rhs);
				}
			}
			throw std::invalid_argument("build: unknown expression kind");
		}
	}

	std::size_t Dag::NodeKeyHash::operator()(const NodeKey &key) const
	{
		auto hash = static_cast<std::size_t>(key.kind);
		hash = hash_combine(hash, static_cast<std::uint8_t>(key.op));
		hash = hash_combine(hash, key.symbol);
		hash = hash_combine(hash, key.first);
		hash = hash_combine(hash, key.second);
		return hash;
	}

	NodeIndex Dag::variable(const std::string_view name)
	{
		return leaf(NodeKind::VARIABLE, name);
	}

	NodeIndex Dag::constant(const std::string_view literal)
	{
		return leaf(NodeKind::CONSTANT, literal);
	}

	NodeIndex Dag::operation(const Operator op, const NodeIndex lhs, const NodeIndex rhs)
	{
		if (arity(op) != 2)
			throw std::invalid_argument(fmt::format("operator '{}' is not binary", ershov::spelling(op)));
		(void) node(lhs);
		(void) node(rhs);

		NodeKey key { .kind = NodeKind::OPERATION, .op = op, .first = lhs, .second = rhs };
		/* `a + b` and `b + a` share one node; the stored order is whichever came first */
		if (is_commutative(op) && key.first > key.second)
			std::swap(key.first, key.second);

		DAGNode candidate;
		candidate.kind = NodeKind::OPERATION;
		candidate.op = op;
		candidate.operands = { lhs, rhs };
		return intern(key, std::move(candidate));
	}

	NodeIndex Dag::operation(const Operator op, const NodeIndex operand)
	{
		if (arity(op) != 1)
			throw std::invalid_argument(fmt::format("operator '{}' is not unary", ershov::spelling(op)));
		(void) node(operand);

		const NodeKey key { .kind = NodeKind::OPERATION, .op = op, .first = operand };
		DAGNode candidate;
		candidate.kind = NodeKind::OPERATION;
		candidate.op = op;
		candidate.operands = { operand };
		return intern(key, std::move(candidate));
	}

	const DAGNode &Dag::node(const NodeIndex idx) const
	{
		if (idx >= arena.size())
			throw std::out_of_range(fmt::format("Dag::node: invalid node index {}", idx));
		return arena[idx];
	}

	DAGNode &Dag::node(const NodeIndex idx)
	{
		if (idx >= arena.size())
			throw std::out_of_range(fmt::format("Dag::node: invalid node index {}", idx));
		return arena[idx];
	}

	std::size_t Dag::operation_count() const
	{
		return static_cast<std::size_t>(std::ranges::count_if(arena, [](const DAGNode &n)
		{
			return n.is_operation();
		}));
	}

	void Dag::set_root(const NodeIndex idx)
	{
		(void) node(idx);
		top = idx;
	}

	std::string_view Dag::spelling(const NodeIndex idx) const
	{
		const DAGNode &n = node(idx);
		if (n.is_leaf())
			return table.get(n.symbol);
		return ershov::spelling(n.op);
	}

	std::string Dag::expression(const NodeIndex idx) const // NOLINT(*-no-recursion)
	{
		const DAGNode &n = node(idx);
		if (n.is_leaf())
			return std::string(table.get(n.symbol));

		auto operand = [&](const NodeIndex o)
		{
			return arena[o].is_leaf() ? expression(o) : fmt::format("({})", expression(o));
		};

		if (n.operands.size() == 1)
			return fmt::format("-{}", operand(n.operands[0]));
		return fmt::format("{} {} {}", operand(n.operands[0]), ershov::spelling(n.op), operand(n.operands[1]));
	}

	NodeIndex Dag::leaf(const NodeKind kind, const std::string_view spelling)
	{
		if (spelling.empty())
			throw std::invalid_argument("leaf spelling must not be empty");

		const SymbolTable::SymbolId symbol = table.intern(spelling);
		const NodeKey key { .kind = kind, .symbol = symbol };

		DAGNode candidate;
		candidate.kind = kind;
		candidate.symbol = symbol;
		return intern(key, std::move(candidate));
	}

	NodeIndex Dag::intern(const NodeKey &key, DAGNode candidate)
	{
		if (const auto it = lookup.find(key);
			it != lookup.end())
		{
			return it->second;
		}

		const auto idx = static_cast<NodeIndex>(arena.size());
		candidate.id = idx;
		for (const NodeIndex operand: candidate.operands)
			++arena[operand].parent_count;

		arena.push_back(std::move(candidate));
		lookup.emplace(key, idx);
		return idx;
	}

	Dag build(const Expression &expr)
	{
		Dag dag;
		dag.set_root(build_node(dag, expr));
		return dag;
	}
}
