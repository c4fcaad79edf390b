/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <iostream>

namespace ershov
{
	class Dag;
	struct Listing;
	struct GraphView;
	struct Report;

	/**
	 * @brief Dump every node of a DAG with its label and parent count
	 * @param dag DAG to dump
	 * @param os Output stream (defaults to stdout)
	 */
	void dump(const Dag &dag, std::ostream &os = std::cout);

	/**
	 * @brief Dump the instructions of a Listing, each followed by its allocation step
	 * @param listing Listing to dump
	 * @param os Output stream (defaults to stdout)
	 */
	void dump(const Listing &listing, std::ostream &os = std::cout);

	/**
	 * @brief Dump graph nodes and edges
	 */
	void dump(const GraphView &view, std::ostream &os = std::cout);

	/**
	 * @brief Dump both halves of a compilation report, or its error
	 */
	void dump(const Report &report, std::ostream &os = std::cout);

	/**
	 * @brief Debug dump to stderr (convenience functions)
	 */
	void dump_dbg(const Dag &dag);
	void dump_dbg(const Listing &listing);
}
