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

#include <Source.hpp>
#include <memory>
#include <string>

TEST(CurrentParse, DcCurrentInMilliamps)
{
  std::string line = "I1 a b 1mA";
  auto result = Source::parse(Cursor(line));
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value()->getKind(), SourceKind::Current);
  auto dc = std::dynamic_pointer_cast<DcValue>(result.value()->getValue());
  ASSERT_NE(dc, nullptr);
  EXPECT_EQ(dc->getType(), SourceValueType::DcCurrent);
  EXPECT_EQ(dc->getValue().getUnit(), Unit::Ampere);
  EXPECT_DOUBLE_EQ(dc->getValue().toDouble(), 1e-3);
}

TEST(CurrentParse, AcCurrent)
{
  std::string line = "I2 a b AC 1m 0";
  auto result = Source::parse(Cursor(line));
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value()->getValue()->getType(), SourceValueType::AcCurrent);
}

TEST(CurrentParse, PulseCurrent)
{
  std::string line = "Iclk a 0 PULSE(0 1m 0 1n 1n 5n 10n)";
  auto result = Source::parse(Cursor(line));
  ASSERT_TRUE(result.ok());
  auto pulse =
      std::dynamic_pointer_cast<PulseValue>(result.value()->getValue());
  ASSERT_NE(pulse, nullptr);
  EXPECT_EQ(pulse->getPulsed().getUnit(), Unit::Ampere);
  EXPECT_EQ(result.value()->toSpice(), "Iclk a 0 PULSE(0 1m 0 1n 1n 5n 10n)");
}

TEST(CurrentParse, MissingDesignator)
{
  std::string line = "I a b 1";
  auto result = Source::parse(Cursor(line));
  EXPECT_TRUE(result.isFailure());
}
