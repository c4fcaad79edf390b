/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <ershov/foundation/expression.hpp>
#include <ershov/support/symbol-table.hpp>

namespace ershov
{
	using NodeIndex = std::uint32_t;
	static constexpr NodeIndex INVALID_NODE = std::numeric_limits<NodeIndex>::max();

	/**
	 * @brief Type of DAG node
	 */
	enum class NodeKind : std::uint8_t
	{
		/** @brief Named input read from memory */
		VARIABLE,
		/** @brief Numeric literal */
		CONSTANT,
		/** @brief Operator applied to earlier nodes */
		OPERATION
	};

	/**
	 * @brief DAG node representation
	 *
	 * Nodes live in the arena of their Dag and refer to each other only by
	 * arena index. Operand indices are always lower than the node's own index.
	 */
	struct DAGNode
	{
		/** @brief Arena index; stable for the lifetime of the Dag */
		NodeIndex id = INVALID_NODE;
		NodeKind kind = NodeKind::VARIABLE;
		/** @brief Operator, OPERATION nodes only */
		Operator op = Operator::NONE;
		/** @brief Interned spelling, leaves only */
		SymbolTable::SymbolId symbol = 0;
		/** @brief Ordered operands; order matters for non-commutative operators */
		std::vector<NodeIndex> operands;
		/** @brief Sethi-Ullman number, filled in by `label` */
		std::uint32_t label = 0;
		/** @brief Number of operand slots across the DAG that reference this node */
		std::uint32_t parent_count = 0;
		/** @brief Result register, filled in from a Listing */
		std::optional<std::uint32_t> reg;

		[[nodiscard]] bool is_leaf() const
		{
			return kind != NodeKind::OPERATION;
		}

		[[nodiscard]] bool is_operation() const
		{
			return kind == NodeKind::OPERATION;
		}
	};

	/**
	 * @brief Arena of hash-consed expression nodes
	 *
	 * Every constructor goes through one structural lookup, so two nodes with
	 * the same kind, operator and operands (operand multiset for commutative
	 * operators) can never coexist. A new OPERATION node bumps the parent count
	 * of every operand slot it fills; a lookup hit changes nothing.
	 */
	class Dag
	{
	public:
		Dag() = default;

		NodeIndex variable(std::string_view name);
		NodeIndex constant(std::string_view literal);

		/**
		 * @brief Get or create a binary operation node
		 * @throws std::invalid_argument if `op` is not binary
		 * @throws std::out_of_range if an operand index is not in the arena
		 */
		NodeIndex operation(Operator op, NodeIndex lhs, NodeIndex rhs);

		/**
		 * @brief Get or create a unary operation node
		 * @throws std::invalid_argument if `op` is not unary
		 */
		NodeIndex operation(Operator op, NodeIndex operand);

		/**
		 * @throws std::out_of_range for an index outside the arena
		 */
		[[nodiscard]] const DAGNode &node(NodeIndex idx) const;
		[[nodiscard]] DAGNode &node(NodeIndex idx);

		[[nodiscard]] const DAGNode &operator[](const NodeIndex idx) const
		{
			return arena[idx];
		}

		[[nodiscard]] DAGNode &operator[](const NodeIndex idx)
		{
			return arena[idx];
		}

		[[nodiscard]] const std::vector<DAGNode> &nodes() const
		{
			return arena;
		}

		[[nodiscard]] std::size_t size() const
		{
			return arena.size();
		}

		[[nodiscard]] bool empty() const
		{
			return arena.empty();
		}

		/**
		 * @return Number of OPERATION nodes, i.e. instructions a full evaluation emits
		 */
		[[nodiscard]] std::size_t operation_count() const;

		[[nodiscard]] NodeIndex root() const
		{
			return top;
		}

		void set_root(NodeIndex idx);

		/**
		 * @return Spelling of a leaf, operator spelling for an operation
		 */
		[[nodiscard]] std::string_view spelling(NodeIndex idx) const;

		/**
		 * @brief Render the subexpression rooted at `idx`, e.g. `a + (b * c)`
		 */
		[[nodiscard]] std::string expression(NodeIndex idx) const;

		[[nodiscard]] const SymbolTable &symbols() const
		{
			return table;
		}

	private:
		struct NodeKey
		{
			NodeKind kind = NodeKind::VARIABLE;
			Operator op = Operator::NONE;
			SymbolTable::SymbolId symbol = 0;
			NodeIndex first = INVALID_NODE;
			NodeIndex second = INVALID_NODE;

			bool operator==(const NodeKey &) const = default;
		};

		struct NodeKeyHash
		{
			std::size_t operator()(const NodeKey &key) const;
		};

		std::vector<DAGNode> arena;
		std::unordered_map<NodeKey, NodeIndex, NodeKeyHash> lookup;
		SymbolTable table;
		NodeIndex top = INVALID_NODE;

		NodeIndex leaf(NodeKind kind, std::string_view spelling);
		NodeIndex intern(const NodeKey &key, DAGNode candidate);
	};

	/**
	 * @brief Build a DAG from a syntax tree, sharing identical subexpressions
	 * @param expr Tree to convert
	 * @return DAG whose root is the node for `expr`
	 */
	Dag build(const Expression &expr);
}
