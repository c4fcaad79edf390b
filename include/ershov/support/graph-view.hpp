/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <ershov/foundation/dag.hpp>

namespace ershov
{
	struct Listing;

	/**
	 * @brief Presentation-neutral projection of a Dag for graph renderers
	 */
	struct GraphView
	{
		struct Node
		{
			NodeIndex id = INVALID_NODE;
			/** @brief Leaf spelling or operator spelling */
			std::string label;
			/** @brief `variable` for leaves, `operation` otherwise */
			std::string group;
			/** @brief Sethi-Ullman number */
			std::uint32_t rank = 0;
			/** @brief Result register, e.g. `R2`, when projected with a Listing */
			std::optional<std::string> reg;
		};

		/** @brief Data-flow edge from an operand to the node using it */
		struct Edge
		{
			NodeIndex from = INVALID_NODE;
			NodeIndex to = INVALID_NODE;

			bool operator==(const Edge &) const = default;
		};

		std::vector<Node> nodes;
		std::vector<Edge> edges;
	};

	/**
	 * @brief Project a Dag, optionally annotated with the registers of a Listing
	 *
	 * Nodes appear in arena order. An operand used twice by the same node
	 * (`a * a`) yields one edge.
	 */
	GraphView project(const Dag &dag, const Listing *listing = nullptr);
}
