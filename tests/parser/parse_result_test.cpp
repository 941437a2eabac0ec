/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */
#include <gtest/gtest.h>

#include <ParseResult.hpp>
#include <string>

TEST(CursorPosition, LineAndColumn)
{
    std::string text = "first\nsecond line\nthird";
    Cursor at(text, 13);  // the 'l' of "line"
    EXPECT_EQ(at.line(), 2);
    EXPECT_EQ(at.column(), 8u);
    EXPECT_EQ(at.lineText(), "second line");
    EXPECT_EQ(at.restOfLine(), "line");
}

TEST(CursorPosition, AdvanceStopsAtEnd)
{
    std::string text = "abc";
    Cursor at(text);
    Cursor end = at.advance(10);
    EXPECT_TRUE(end.atEnd());
    EXPECT_EQ(end.offset(), 3u);
    EXPECT_EQ(end.peek(), '\0');
    // The source cursor is untouched.
    EXPECT_EQ(at.peek(), 'a');
}

TEST(CursorMatch, StartsWithNoCase)
{
    std::string text = ".Subckt inv";
    Cursor at(text);
    EXPECT_TRUE(at.startsWithNoCase(".SUBCKT"));
    EXPECT_FALSE(at.startsWith(".SUBCKT"));
    EXPECT_FALSE(at.startsWithNoCase(".SUBCKT inverter"));
}

TEST(ParseStatus, CommitPromotesError)
{
    std::string text = "x";
    Cursor at(text);
    auto rejected = ParseResult<int>::reject(at, "digit");
    EXPECT_TRUE(rejected.isError());

    auto committed = commit(rejected, at, "value");
    EXPECT_TRUE(committed.isFailure());
    ASSERT_EQ(committed.getError().getEntries().size(), 2u);
    EXPECT_EQ(committed.getError().getEntries()[0].label, "digit");
    EXPECT_EQ(committed.getError().getEntries()[1].label, "value");
}

TEST(ParseStatus, CommitLeavesSuccessAlone)
{
    std::string text = "x";
    Cursor at(text);
    auto ok = commit(ParseResult<int>::success(at, 7), at, "value");
    EXPECT_TRUE(ok.ok());
    EXPECT_EQ(ok.value(), 7);
    EXPECT_TRUE(ok.getError().empty());
}

TEST(ParseStatus, ContextKeepsStatus)
{
    std::string text = "x";
    Cursor at(text);
    auto error = context(ParseResult<int>::reject(at, "a"), at, "b");
    EXPECT_TRUE(error.isError());
    EXPECT_EQ(error.getError().getEntries().size(), 2u);

    auto failure = context(ParseResult<int>::fail(at, "a"), at, "b");
    EXPECT_TRUE(failure.isFailure());
}

TEST(ParseStatus, PropagateKeepsTrace)
{
    std::string text = "abc";
    Cursor at(text, 2);
    auto inner = ParseResult<std::string>::fail(at, "inner");
    auto outer = ParseResult<int>::propagate(inner);
    EXPECT_TRUE(outer.isFailure());
    EXPECT_EQ(outer.rest().offset(), 2u);
    EXPECT_EQ(outer.getError().firstOffset(), 2u);
}

TEST(ParseErrorRender, OneBlockPerLabel)
{
    std::string text = "R1 a\nR2 b c";
    ParseError error;
    error.add(Cursor(text, 9), "value");
    error.add(Cursor(text, 5), "resistor");

    std::string rendered = error.render(text);
    EXPECT_EQ(rendered,
              "0: at line 2, in value:\n"
              "R2 b c\n"
              "    ^\n"
              "1: at line 2, in resistor:\n"
              "R2 b c\n"
              "^\n");
}
