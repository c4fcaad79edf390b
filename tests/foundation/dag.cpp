/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <stdexcept>
#include <ershov/foundation/dag.hpp>
#include <ershov/foundation/parser.hpp>
#include <gtest/gtest.h>

class DagFixture : public testing::Test
{
protected:
	void SetUp() override {}

	void TearDown() override {}

	ershov::Dag dag;

	static ershov::Dag from(const std::string_view text)
	{
		return ershov::build(*ershov::parse(text));
	}
};

TEST_F(DagFixture, LeavesAreInterned)
{
	const auto a = dag.variable("a");
	const auto b = dag.variable("b");
	EXPECT_EQ(dag.variable("a"), a);
	EXPECT_NE(a, b);
	EXPECT_EQ(dag.size(), 2);
	EXPECT_EQ(dag.spelling(a), "a");
	EXPECT_EQ(dag[a].kind, ershov::NodeKind::VARIABLE);
}

TEST_F(DagFixture, ConstantsAndVariablesNeverMerge)
{
	/* the same spelling under a different kind is a different leaf */
	const auto k = dag.constant("2");
	EXPECT_EQ(dag.constant("2"), k);
	EXPECT_NE(dag.constant("2.0"), k);
	EXPECT_EQ(dag[k].kind, ershov::NodeKind::CONSTANT);
	EXPECT_THROW((void) dag.variable(""), std::invalid_argument);
}

TEST_F(DagFixture, OperationsAreHashConsed)
{
	const auto a = dag.variable("a");
	const auto b = dag.variable("b");
	const auto sum = dag.operation(ershov::Operator::ADD, a, b);

	EXPECT_EQ(dag.operation(ershov::Operator::ADD, a, b), sum);
	EXPECT_NE(dag.operation(ershov::Operator::MUL, a, b), sum);
	EXPECT_EQ(dag[a].parent_count, 2);
	EXPECT_EQ(dag[sum].operands, (std::vector<ershov::NodeIndex> { a, b }));
}

TEST_F(DagFixture, CommutativeOperandsShareNode)
{
	const auto a = dag.variable("a");
	const auto b = dag.variable("b");
	const auto ab = dag.operation(ershov::Operator::ADD, a, b);
	const auto ba = dag.operation(ershov::Operator::ADD, b, a);

	EXPECT_EQ(ab, ba);
	/* the first occurrence keeps its operand order */
	EXPECT_EQ(dag[ab].operands, (std::vector<ershov::NodeIndex> { a, b }));
	/* a lookup hit does not add parents */
	EXPECT_EQ(dag[a].parent_count, 1);
	EXPECT_EQ(dag[b].parent_count, 1);
}

TEST_F(DagFixture, NonCommutativeOrderMatters)
{
	const auto a = dag.variable("a");
	const auto b = dag.variable("b");

	EXPECT_NE(dag.operation(ershov::Operator::SUB, a, b), dag.operation(ershov::Operator::SUB, b, a));
	EXPECT_NE(dag.operation(ershov::Operator::DIV, a, b), dag.operation(ershov::Operator::DIV, b, a));
	EXPECT_NE(dag.operation(ershov::Operator::POW, a, b), dag.operation(ershov::Operator::POW, b, a));
}

TEST_F(DagFixture, ArityIsChecked)
{
	const auto a = dag.variable("a");
	EXPECT_THROW((void) dag.operation(ershov::Operator::NEG, a, a), std::invalid_argument);
	EXPECT_THROW((void) dag.operation(ershov::Operator::ADD, a), std::invalid_argument);
	EXPECT_THROW((void) dag.operation(ershov::Operator::ADD, a, 42), std::out_of_range);
	EXPECT_THROW((void) dag.node(42), std::out_of_range);
	EXPECT_THROW(dag.set_root(42), std::out_of_range);
}

TEST_F(DagFixture, RepeatedSubexpressionIsShared)
{
	const ershov::Dag shared = from("(a+b)*(a+b)");

	ASSERT_EQ(shared.size(), 4);
	EXPECT_EQ(shared.operation_count(), 2);

	const ershov::DAGNode &root = shared.node(shared.root());
	EXPECT_EQ(root.op, ershov::Operator::MUL);
	ASSERT_EQ(root.operands.size(), 2);
	EXPECT_EQ(root.operands[0], root.operands[1]);

	const ershov::DAGNode &sum = shared.node(root.operands[0]);
	EXPECT_EQ(sum.op, ershov::Operator::ADD);
	EXPECT_EQ(sum.parent_count, 2);
	EXPECT_EQ(root.parent_count, 0);
}

TEST_F(DagFixture, OperandsPrecedeUsers)
{
	const ershov::Dag built = from("a * (b - c) + -(a * (b - c)) / 2");

	for (const ershov::DAGNode &n: built.nodes())
	{
		for (const ershov::NodeIndex o: n.operands)
			EXPECT_LT(o, n.id);
	}
	/* a, b, c, b - c, a * (b - c), negation, 2, quotient, sum */
	EXPECT_EQ(built.size(), 9);
	EXPECT_EQ(built.root(), 8);
}

TEST_F(DagFixture, ParentCountCountsSlots)
{
	const ershov::Dag squared = from("x * x + x");
	const auto x = *squared.symbols().find("x");

	for (const ershov::DAGNode &n: squared.nodes())
	{
		if (n.is_leaf() && n.symbol == x)
			EXPECT_EQ(n.parent_count, 3);
	}
}

TEST_F(DagFixture, ExpressionRendersSubtrees)
{
	const ershov::Dag built = from("a + b * (c + d) - e");

	EXPECT_EQ(built.expression(built.root()), "(a + (b * (c + d))) - e");
	EXPECT_EQ(built.expression(0), "a");

	const ershov::Dag negated = from("-(x + y)");
	EXPECT_EQ(negated.expression(negated.root()), "-(x + y)");
}

TEST_F(DagFixture, CopiesAreIndependent)
{
	const ershov::Dag original = from("a + b");
	ershov::Dag copy = original;
	copy.operation(ershov::Operator::MUL, copy.root(), copy.variable("c"));

	EXPECT_EQ(original.size(), 3);
	EXPECT_EQ(copy.size(), 5);
	EXPECT_FALSE(original.symbols().contains("c"));
}
