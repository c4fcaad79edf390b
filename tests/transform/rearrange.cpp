/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <algorithm>
#include <cmath>
#include <random>
#include <string>
#include <ershov/analysis/label.hpp>
#include <ershov/codegen/codegen.hpp>
#include <ershov/foundation/dag.hpp>
#include <ershov/foundation/parser.hpp>
#include <ershov/transform/rearrange.hpp>
#include <gtest/gtest.h>

class RearrangeFixture : public testing::Test
{
protected:
	void SetUp() override {}

	void TearDown() override {}

	static ershov::Dag labeled(const std::string_view text)
	{
		ershov::Dag dag = ershov::build(*ershov::parse(text));
		ershov::label(dag);
		return dag;
	}

	static double value(const ershov::Dag &dag, const ershov::NodeIndex idx, const ershov::Bindings &bindings) // NOLINT(*-no-recursion)
	{
		const ershov::DAGNode &n = dag[idx];
		if (n.kind == ershov::NodeKind::CONSTANT)
			return std::stod(std::string(dag.spelling(idx)));
		if (n.is_leaf())
			return bindings.at(std::string(dag.spelling(idx)));
		if (n.operands.size() == 1)
			return ershov::apply(n.op, value(dag, n.operands[0], bindings));
		return ershov::apply(n.op, value(dag, n.operands[0], bindings), value(dag, n.operands[1], bindings));
	}

	void expect_same_value(const ershov::Dag &before, const ershov::Dag &after, const std::string &text) const
	{
		for (const auto &values: bindings)
		{
			const double expected = value(before, before.root(), values);
			if (!std::isfinite(expected))
				continue;
			EXPECT_NEAR(value(after, after.root(), values), expected, 1e-6 * std::max(1.0, std::fabs(expected)))
				<< text;
		}
	}

	static std::string random_expression(std::mt19937 &rng, const int leaves)
	{
		if (leaves == 1)
		{
			constexpr const char *names[] = { "a", "b", "c", "d", "e", "2" };
			return names[std::uniform_int_distribution<int>(0, 5)(rng)];
		}

		/* weighted towards the rewritable operators */
		constexpr const char *ops[] = { " + ", " + ", " * ", " * ", " - ", " / " };
		const int left = std::uniform_int_distribution<int>(1, leaves - 1)(rng);
		std::string text = "(" + random_expression(rng, left) + ops[std::uniform_int_distribution<int>(0, 5)(rng)] +
		                   random_expression(rng, leaves - left) + ")";
		if (std::uniform_int_distribution<int>(0, 7)(rng) == 0)
			text = "-" + text;
		return text;
	}

	const ershov::Bindings bindings[3] = {
		{ { "a", 2.0 }, { "b", 3.0 }, { "c", 5.0 }, { "d", 7.0 }, { "e", 11.0 } },
		{ { "a", -4.0 }, { "b", 0.5 }, { "c", 1.5 }, { "d", -8.0 }, { "e", 2.25 } },
		{ { "a", 13.0 }, { "b", -1.0 }, { "c", 6.0 }, { "d", 0.125 }, { "e", -9.0 } },
	};
};

TEST_F(RearrangeFixture, EmptyDag)
{
	const ershov::Dag empty {};
	ershov::Rearranger rearranger(empty, {});
	EXPECT_TRUE(rearranger.run().empty());
	EXPECT_FALSE(rearranger.improved());
}

TEST_F(RearrangeFixture, MixedExpressionDropsToOneRegister)
{
	const ershov::Dag dag = labeled("a + b * (c + d) - e");
	ASSERT_EQ(dag[dag.root()].label, 2);

	ershov::Rearranger rearranger(dag, {});
	const ershov::Dag out = rearranger.run();

	EXPECT_TRUE(rearranger.improved());
	EXPECT_EQ(out[out.root()].label, 1);
	EXPECT_EQ(out.operation_count(), dag.operation_count());
	EXPECT_EQ(out.expression(out.root()), "(((c + d) * b) + a) - e");

	/* subtraction is never reordered */
	const ershov::DAGNode &root = out[out.root()];
	EXPECT_EQ(root.op, ershov::Operator::SUB);
	EXPECT_EQ(out.spelling(root.operands[1]), "e");
	expect_same_value(dag, out, "a + b * (c + d) - e");
}

TEST_F(RearrangeFixture, RightDeepChainDropsToOneRegister)
{
	const ershov::Dag dag = labeled("a * (b * (c * d))");
	ASSERT_EQ(dag[dag.root()].label, 2);

	const ershov::Dag out = ershov::rearrange(dag);
	EXPECT_EQ(out[out.root()].label, 1);
	EXPECT_EQ(out.size(), dag.size());
	expect_same_value(dag, out, "a * (b * (c * d))");
}

TEST_F(RearrangeFixture, OriginalBracketingWinsTies)
{
	/* left-deep in source order also scores 1, but the original shape with
	 * its operands swapped comes first */
	const ershov::Dag out = ershov::rearrange(labeled("a * (b * (c * d))"));
	EXPECT_EQ(out.expression(out.root()), "((c * d) * b) * a");
}

TEST_F(RearrangeFixture, OptimalInputIsKept)
{
	const ershov::Dag dag = labeled("a * b + c");

	ershov::Rearranger rearranger(dag, {});
	const ershov::Dag out = rearranger.run();

	EXPECT_FALSE(rearranger.improved());
	EXPECT_EQ(out[out.root()].label, 1);
	EXPECT_EQ(out.expression(out.root()), dag.expression(dag.root()));
	EXPECT_EQ(out.size(), dag.size());
}

TEST_F(RearrangeFixture, NonAssociativeOperatorsAreUntouched)
{
	const ershov::Dag dag = labeled("a - (b - (c - d))");

	ershov::Rearranger rearranger(dag, {});
	const ershov::Dag out = rearranger.run();

	EXPECT_FALSE(rearranger.improved());
	EXPECT_EQ(out[out.root()].label, 2);
	EXPECT_EQ(out.expression(out.root()), "a - (b - (c - d))");

	const ershov::Dag powers = ershov::rearrange(labeled("a ^ (b ^ (c ^ d))"));
	EXPECT_EQ(powers.expression(powers.root()), "a ^ (b ^ (c ^ d))");
}

TEST_F(RearrangeFixture, SharedSubexpressionStaysShared)
{
	const ershov::Dag square = ershov::rearrange(labeled("(a + b) * (a + b)"));
	EXPECT_EQ(square.size(), 4);
	EXPECT_EQ(square.operation_count(), 2);
	EXPECT_EQ(square[square.root()].label, 2);

	/* the shared product is rewritten once and both operands still point at it */
	const ershov::Dag dag = labeled("x * (y * (z * w)) - x * (y * (z * w))");
	ASSERT_EQ(dag[dag.root()].label, 3);

	ershov::Rearranger rearranger(dag, {});
	const ershov::Dag out = rearranger.run();

	EXPECT_TRUE(rearranger.improved());
	EXPECT_EQ(out[out.root()].label, 2);
	EXPECT_EQ(out.size(), dag.size());
	const ershov::DAGNode &root = out[out.root()];
	EXPECT_EQ(root.operands[0], root.operands[1]);
	EXPECT_EQ(out[root.operands[0]].parent_count, 2);
}

TEST_F(RearrangeFixture, DepthBoundStopsRewriting)
{
	const ershov::Dag dag = labeled("a + b * (c + d) - e");

	ershov::Rearranger frozen(dag, { .max_depth = 0 });
	const ershov::Dag out = frozen.run();
	EXPECT_FALSE(frozen.improved());
	EXPECT_EQ(out.expression(out.root()), dag.expression(dag.root()));

	/* the product sits two levels down; below that nothing moves */
	ershov::Rearranger shallow(dag, { .max_depth = 2 });
	(void) shallow.run();
	EXPECT_FALSE(shallow.improved());

	ershov::Rearranger deep(dag, { .max_depth = 3 });
	const ershov::Dag rewritten = deep.run();
	EXPECT_TRUE(deep.improved());
	EXPECT_EQ(rewritten[rewritten.root()].label, 1);
}

TEST_F(RearrangeFixture, SecondPassFindsNothingBelowOne)
{
	const ershov::Dag once = ershov::rearrange(labeled("a + b * (c + d) - e"));

	ershov::Rearranger again(once, {});
	const ershov::Dag twice = again.run();
	EXPECT_FALSE(again.improved());
	EXPECT_EQ(twice.expression(twice.root()), once.expression(once.root()));
}

TEST_F(RearrangeFixture, RearrangingIsIdempotent)
{
	for (const char *text: { "a + b * (c + d) - e", "a * (b * (c * d))", "x * (y * (z * w)) - x * (y * (z * w))",
	                         "(a + b) * (c + d) * (e + 2)" })
	{
		const ershov::Dag once = ershov::rearrange(labeled(text));
		const ershov::Dag twice = ershov::rearrange(once);

		EXPECT_EQ(twice[twice.root()].label, once[once.root()].label) << text;
		EXPECT_EQ(ershov::generate(twice).code(), ershov::generate(once).code()) << text;
	}
}

TEST_F(RearrangeFixture, RandomExpressionsNeverGetWorse)
{
	std::mt19937 rng(7);
	std::size_t improved = 0;
	for (int trial = 0; trial < 200; ++trial)
	{
		const std::string text = random_expression(rng, 2 + trial % 9);
		const ershov::Dag dag = labeled(text);

		ershov::Rearranger rearranger(dag, {});
		const ershov::Dag out = rearranger.run();

		EXPECT_LE(out[out.root()].label, dag[dag.root()].label) << text;
		EXPECT_EQ(rearranger.improved(), out[out.root()].label < dag[dag.root()].label) << text;
		expect_same_value(dag, out, text);
		if (rearranger.improved())
			++improved;
	}
	EXPECT_GT(improved, 0u);
}
