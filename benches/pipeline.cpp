/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <random>
#include <string>
#include <ershov/analysis/label.hpp>
#include <ershov/codegen/codegen.hpp>
#include <ershov/foundation/dag.hpp>
#include <ershov/foundation/parser.hpp>
#include <ershov/foundation/pipeline.hpp>
#include <ershov/transform/rearrange.hpp>
#include <benchmark/benchmark.h>

class ExpressionBenchmark
{
public:
    ExpressionBenchmark() : rng(42) {}

    /* random bracketing over a small alphabet so larger inputs share subexpressions */
    std::string expression(std::uint32_t leaves, std::uint32_t alphabet)
    {
        if (leaves == 1) {
            std::uniform_int_distribution<std::uint32_t> pick(0, alphabet - 1);
            return "v" + std::to_string(pick(rng));
        }

        static constexpr const char* ops[] = { " + ", " * ", " - ", " + ", " * ", " / " };
        std::uniform_int_distribution<std::uint32_t> split(1, leaves - 1);
        std::uniform_int_distribution<int> op(0, 5);

        const std::uint32_t left = split(rng);
        std::string lhs = expression(left, alphabet);
        std::string rhs = expression(leaves - left, alphabet);
        return "(" + lhs + ops[op(rng)] + rhs + ")";
    }

    ershov::Dag labeled(std::uint32_t leaves, std::uint32_t alphabet)
    {
        ershov::Dag dag = ershov::build(*ershov::parse(expression(leaves, alphabet)));
        ershov::label(dag);
        return dag;
    }

private:
    std::mt19937 rng;
};

static void BM_Parse(benchmark::State& state)
{
    ExpressionBenchmark bench;
    const std::string text = bench.expression(state.range(0), 16);

    for (auto _ : state) {
        auto tree = ershov::parse(text);
        benchmark::DoNotOptimize(tree);
    }
    state.counters["bytes"] = static_cast<double>(text.size());
}

static void BM_Build(benchmark::State& state)
{
    ExpressionBenchmark bench;
    const auto tree = ershov::parse(bench.expression(state.range(0), 16));

    for (auto _ : state) {
        ershov::Dag dag = ershov::build(*tree);
        benchmark::DoNotOptimize(dag);
        state.counters["nodes"] = static_cast<double>(dag.size());
    }
}

static void BM_Label(benchmark::State& state)
{
    ExpressionBenchmark bench;
    ershov::Dag dag = bench.labeled(state.range(0), 16);

    for (auto _ : state) {
        benchmark::DoNotOptimize(ershov::label(dag));
    }
    state.counters["root_label"] = dag[dag.root()].label;
}

static void BM_Rearrange(benchmark::State& state)
{
    ExpressionBenchmark bench;
    const ershov::Dag dag = bench.labeled(state.range(0), 16);

    for (auto _ : state) {
        ershov::Dag rewritten = ershov::rearrange(dag);
        state.counters["before"] = dag[dag.root()].label;
        state.counters["after"] = rewritten[rewritten.root()].label;
        benchmark::DoNotOptimize(rewritten);
    }
}

static void BM_Generate(benchmark::State& state)
{
    ExpressionBenchmark bench;
    const ershov::Dag dag = bench.labeled(state.range(0), 16);

    for (auto _ : state) {
        auto listing = ershov::generate(dag);
        state.counters["instructions"] = static_cast<double>(listing.instructions.size());
        state.counters["peak"] = listing.peak;
        benchmark::DoNotOptimize(listing);
    }
}

static void BM_Compile(benchmark::State& state)
{
    ExpressionBenchmark bench;
    const std::string text = bench.expression(state.range(0), 8);
    const ershov::Options options = {
        .policy = state.range(1) ? ershov::ExecutionPolicy::PARALLEL : ershov::ExecutionPolicy::SEQUENTIAL
    };

    for (auto _ : state) {
        auto report = ershov::compile(text, options);
        state.counters["original"] = report.original.min_registers;
        state.counters["rearranged"] = report.rearranged.min_registers;
        benchmark::DoNotOptimize(report);
    }
}

BENCHMARK(BM_Parse)->Range(8, 1024)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_Build)->Range(8, 1024)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_Label)->Range(8, 1024)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_Rearrange)->Range(8, 1024)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_Generate)->Range(8, 1024)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_Compile)->Ranges({{8, 512}, {0, 1}})->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
