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

#include <Inductor.hpp>
#include <memory>
#include <string>

TEST(InductorParse, ValidInductor)
{
  std::string line = "L1 a b 10nH";
  auto result = Inductor::parse(Cursor(line));
  ASSERT_TRUE(result.ok());
  auto el = std::dynamic_pointer_cast<Inductor>(result.value());
  ASSERT_NE(el, nullptr);
  EXPECT_EQ(el->getName(), "1");
  EXPECT_EQ(el->getType(), ComponentType::Inductor);
  EXPECT_EQ(el->getInductance().getUnit(), Unit::Henry);
  EXPECT_DOUBLE_EQ(el->getInductance().toDouble(), 10e-9);
}

TEST(InductorParse, NonNumericValueIsFatal)
{
  std::string line = "L1 a b big";
  auto result = Inductor::parse(Cursor(line));
  EXPECT_TRUE(result.isFailure());
}

TEST(InductorWrite, ToSpiceDropsUnitLetter)
{
  std::string line = "L2 x y 3mH";
  auto result = Inductor::parse(Cursor(line));
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value()->toSpice(), "L2 x y 3m");
}
