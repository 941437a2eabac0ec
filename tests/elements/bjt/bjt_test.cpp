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

#include <Bjt.hpp>
#include <memory>
#include <string>
#include <vector>

TEST(BjtParse, ValidBjt)
{
  std::string line = "Q1 c b e npn1";
  auto result = Bjt::parse(Cursor(line));
  ASSERT_TRUE(result.ok());
  auto el = std::dynamic_pointer_cast<Bjt>(result.value());
  ASSERT_NE(el, nullptr);
  EXPECT_EQ(el->getType(), ComponentType::Bjt);
  EXPECT_EQ(el->getCollector(), "c");
  EXPECT_EQ(el->getBase(), "b");
  EXPECT_EQ(el->getEmitter(), "e");
  EXPECT_EQ(el->getModel(), "npn1");
  EXPECT_EQ(el->getNodes(), (std::vector<std::string>{"c", "b", "e"}));
}

TEST(BjtParse, MissingEmitterIsFatal)
{
  std::string line = "Q1 c b";
  auto result = Bjt::parse(Cursor(line));
  EXPECT_TRUE(result.isFailure());
  EXPECT_NE(result.getError().render(line).find("in emitter"),
            std::string::npos);
}

TEST(BjtWrite, ToSpice)
{
  std::string line = "qout vcc in gnd bc547";
  auto result = Bjt::parse(Cursor(line));
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value()->toSpice(), "Qout vcc in gnd bc547");
}
