/* this project is part of the Ershov project; licensed under the MIT license. see LICENSE for more info */

#include <ershov/foundation/lexer.hpp>
#include <gtest/gtest.h>

class LexerFixture : public testing::Test
{
protected:
	void SetUp() override {}

	void TearDown() override {}

	static std::vector<ershov::Token> lex(const std::string_view text)
	{
		return ershov::Lexer(text).tokenize();
	}

	static std::size_t error_position(const std::string_view text)
	{
		try
		{
			(void) lex(text);
		}
		catch (const ershov::ParseError &e)
		{
			return e.position();
		}
		ADD_FAILURE() << "expected a parse error for '" << text << "'";
		return 0;
	}
};

TEST_F(LexerFixture, EmptyInputYieldsEnd)
{
	const auto tokens = lex("   ");
	ASSERT_EQ(tokens.size(), 1);
	EXPECT_EQ(tokens[0].kind, ershov::TokenKind::END);
	EXPECT_EQ(tokens[0].position, 3);
}

TEST_F(LexerFixture, MixedTokens)
{
	const auto tokens = lex("(alpha_1 + 2.5) * .5^x");
	const std::vector<std::pair<ershov::TokenKind, std::string>> expected = {
		{ ershov::TokenKind::LPAREN, "(" },
		{ ershov::TokenKind::IDENTIFIER, "alpha_1" },
		{ ershov::TokenKind::OPERATOR, "+" },
		{ ershov::TokenKind::NUMBER, "2.5" },
		{ ershov::TokenKind::RPAREN, ")" },
		{ ershov::TokenKind::OPERATOR, "*" },
		{ ershov::TokenKind::NUMBER, ".5" },
		{ ershov::TokenKind::OPERATOR, "^" },
		{ ershov::TokenKind::IDENTIFIER, "x" },
		{ ershov::TokenKind::END, "" },
	};

	ASSERT_EQ(tokens.size(), expected.size());
	for (std::size_t i = 0; i < tokens.size(); ++i)
	{
		EXPECT_EQ(tokens[i].kind, expected[i].first) << "token " << i;
		EXPECT_EQ(tokens[i].text, expected[i].second) << "token " << i;
	}
}

TEST_F(LexerFixture, PositionsAreByteOffsets)
{
	const auto tokens = lex("a  +\tbc");
	ASSERT_EQ(tokens.size(), 4);
	EXPECT_EQ(tokens[0].position, 0);
	EXPECT_EQ(tokens[1].position, 3);
	EXPECT_EQ(tokens[2].position, 5);
	EXPECT_EQ(tokens[3].position, 7);
}

TEST_F(LexerFixture, MinusIsAlwaysAnOperator)
{
	/* sign folding belongs to the parser */
	const auto tokens = lex("-3");
	ASSERT_EQ(tokens.size(), 3);
	EXPECT_EQ(tokens[0].kind, ershov::TokenKind::OPERATOR);
	EXPECT_EQ(tokens[1].kind, ershov::TokenKind::NUMBER);
	EXPECT_EQ(tokens[1].text, "3");
}

TEST_F(LexerFixture, RejectsUnknownCharacters)
{
	EXPECT_THROW((void) lex("a % b"), ershov::ParseError);
	EXPECT_EQ(error_position("a % b"), 2);
	EXPECT_EQ(error_position("x = 1"), 2);
}

TEST_F(LexerFixture, RejectsMalformedNumbers)
{
	EXPECT_EQ(error_position("1. + a"), 0);
	EXPECT_EQ(error_position("a + ."), 4);
	EXPECT_EQ(error_position("2x"), 1);
	EXPECT_EQ(error_position("1.2.3"), 3);
}

TEST_F(LexerFixture, ErrorMessageNamesPosition)
{
	try
	{
		(void) lex("a $");
		FAIL() << "expected a parse error";
	}
	catch (const ershov::ParseError &e)
	{
		EXPECT_STREQ(e.what(), "parse error at 2: unknown character '$'");
		EXPECT_EQ(e.reason(), "unknown character '$'");
	}
}
