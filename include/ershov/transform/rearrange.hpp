/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <ershov/foundation/dag.hpp>

namespace ershov
{
	struct RearrangeOptions
	{
		/** @brief Operator levels below the root that may be rewritten; deeper nodes are copied */
		std::uint32_t max_depth = 32;
	};

	/**
	 * @brief Algebraic rearrangement for lower register pressure
	 *
	 * Rewrites only the commutative and associative families (ADD, MUL). A
	 * maximal same-operator chain is flattened into an operand list and
	 * re-bracketed into a fixed set of candidate shapes: the original
	 * bracketing, left-deep in source order, left-deep heaviest first,
	 * balanced in source order and balanced heaviest first. Every binary node
	 * of a candidate also tries both operand orders, keeping the original on a
	 * tie. The candidate with the lowest estimated label wins, then the one
	 * with fewer distinct nodes, then the earliest. Flattening stops at nodes
	 * with several parents so shared subexpressions stay shared.
	 *
	 * The search is a local heuristic: a constant number of shapes per chain
	 * and a bounded depth keep it linear in the DAG size.
	 */
	class Rearranger
	{
	public:
		Rearranger(const Dag &dag, RearrangeOptions opts);

		/**
		 * @return Labeled rewritten DAG in a fresh arena, or a labeled copy of
		 *         the input when no rewrite lowers the root label
		 */
		Dag run();

		/**
		 * @return true if the last `run` kept a rewrite rather than falling back
		 */
		[[nodiscard]] bool improved() const
		{
			return rewritten;
		}

	private:
		/**
		 * @brief A node already placed in the target arena
		 */
		struct Built
		{
			NodeIndex idx = INVALID_NODE;
			/** @brief Estimated label; only meaningful for operations */
			std::uint32_t weight = 0;
			bool leaf = false;
		};

		/**
		 * @brief Candidate bracketing of one chain's operand list
		 *
		 * `nodes[k]` with `operand >= 0` stands for the chain operand of that
		 * position; otherwise it joins two earlier nodes.
		 */
		struct Shape
		{
			struct Element
			{
				int operand = -1;
				int lhs = -1;
				int rhs = -1;
				bool swapped = false;
				bool leaf = false;
				std::uint32_t weight = 0;
			};

			std::vector<Element> nodes;
			int root = -1;
		};

		const Dag &source;
		RearrangeOptions options;
		Dag target;
		std::vector<std::optional<Built>> memo;
		bool rewritten = false;

		Built visit(NodeIndex idx, std::uint32_t depth);
		Built copy(NodeIndex idx);
		Built chain(NodeIndex idx, std::uint32_t depth);

		int flatten(NodeIndex idx, Operator op, bool top, Shape &original, std::vector<NodeIndex> &operands) const;

		static int add_operand(Shape &shape, int position);
		static int join(Shape &shape, int lhs, int rhs);
		static Shape left_deep(const std::vector<int> &order, const std::vector<Built> &operands);
		static Shape balanced(const std::vector<int> &order, const std::vector<Built> &operands);
		static int balanced_range(Shape &shape, const std::vector<int> &order, std::size_t begin, std::size_t end);
		/** @brief Fill in weights and operand swaps bottom-up */
		static void score(Shape &shape, const std::vector<Built> &operands);
		static std::size_t distinct_nodes(const Shape &shape, const std::vector<Built> &operands);

		NodeIndex materialize(Operator op, const Shape &shape, int at, const std::vector<Built> &operands);
		Built place(Operator op, const std::vector<Built> &children);
	};

	/**
	 * @brief Convenience wrapper around Rearranger; never fails
	 */
	Dag rearrange(const Dag &dag, const RearrangeOptions &options = {});
}
