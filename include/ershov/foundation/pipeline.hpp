/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <ershov/support/graph-view.hpp>

namespace ershov
{
	enum class ExecutionPolicy : std::uint8_t
	{
		/** @brief Original half, then rearranged half, on the calling thread */
		SEQUENTIAL,
		/** @brief One worker thread per half */
		PARALLEL
	};

	struct Options
	{
		/** @brief Hard register limit for both halves; unset means as many as needed */
		std::optional<std::uint32_t> register_budget;
		/** @brief When false the rearranged half mirrors the original */
		bool rearrange = true;
		/** @brief Operator levels the rearranger may rewrite */
		std::uint32_t rearrange_depth = 32;
		ExecutionPolicy policy = ExecutionPolicy::SEQUENTIAL;
	};

	/**
	 * @brief Everything a presentation layer needs about one evaluation of the input
	 */
	struct Result
	{
		GraphView graph;
		/** @brief Root label, the fewest registers any evaluation order needs */
		std::uint32_t min_registers = 0;
		std::vector<std::string> three_address_code;
		/** @brief One allocation step per instruction, in emission order */
		std::vector<std::string> steps;
	};

	struct Report
	{
		bool success = false;
		/** @brief Failure message; empty on success */
		std::string error;
		Result original;
		Result rearranged;
	};

	/**
	 * @brief Parse, build, label and generate code for an expression, with
	 *        and without algebraic rearrangement
	 *
	 * Parse errors and register budget failures are reported through
	 * `Report::error` with both bundles left empty. Anything else propagates.
	 *
	 * @param text Expression source
	 * @param options Budget, rearrangement and threading knobs
	 * @return Report for both halves
	 */
	Report compile(std::string_view text, const Options &options = {});
}
