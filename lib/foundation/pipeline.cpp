/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <array>
#include <exception>
#include <thread>
#include <vector>
#include <ershov/analysis/label.hpp>
#include <ershov/codegen/codegen.hpp>
#include <ershov/codegen/regalloc.hpp>
#include <ershov/foundation/dag.hpp>
#include <ershov/foundation/lexer.hpp>
#include <ershov/foundation/parser.hpp>
#include <ershov/foundation/pipeline.hpp>
#include <ershov/support/log.hpp>
#include <ershov/transform/rearrange.hpp>

namespace ershov
{
	namespace
	{
		/* each half works on its own copy of the built DAG */
		Result run_half(const Dag &built, const bool rewrite, const Options &options)
		{
			Dag dag = rewrite ? rearrange(built, { .max_depth = options.rearrange_depth }) : built;
			label(dag);

			const Listing listing = generate(dag, { .register_budget = options.register_budget });
			annotate(dag, listing);

			Result result;
			result.graph = project(dag, &listing);
			result.min_registers = listing.min_registers;
			result.three_address_code = listing.code();
			result.steps = listing.trace();
			return result;
		}

		void run_parallel(const Dag &built, const Options &options, Report &report)
		{
			std::array<Result, 2> results;
			std::array<std::exception_ptr, 2> errors;
			std::vector<std::thread> workers;

			for (std::size_t i = 0; i < results.size(); ++i)
			{
				workers.emplace_back([&, i]()
				{
					try
					{
						results[i] = run_half(built, i == 1 && options.rearrange, options);
					}
					catch (...)
					{
						errors[i] = std::current_exception();
					}
				});
			}

			/* wait for both halves before surfacing any failure */
			for (auto &worker: workers)
				worker.join();

			for (const auto &error: errors)
			{
				if (error)
					std::rethrow_exception(error);
			}

			report.original = std::move(results[0]);
			report.rearranged = std::move(results[1]);
		}
	}

	Report compile(const std::string_view text, const Options &options)
	{
		Report report;
		try
		{
			const auto tree = parse(text);
			const Dag built = build(*tree);
			log_debug("built {} nodes ({} operations) from '{}'", built.size(), built.operation_count(), text);

			if (options.policy == ExecutionPolicy::PARALLEL)
				run_parallel(built, options, report);
			else
			{
				report.original = run_half(built, false, options);
				report.rearranged = run_half(built, options.rearrange, options);
			}

			report.success = true;
			log_debug("compiled '{}': {} registers, {} after rearrangement", text,
			          report.original.min_registers, report.rearranged.min_registers);
		}
		catch (const ParseError &e)
		{
			log_info("rejected '{}': {}", text, e.what());
			report = Report {};
			report.error = e.what();
		}
		catch (const RegisterBudgetExceeded &e)
		{
			log_warn("{}", e.what());
			report = Report {};
			report.error = e.what();
		}
		return report;
	}
}
