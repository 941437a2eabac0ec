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

#include <SimCommand.hpp>
#include <memory>
#include <string>

/*
 * Analysis command tests: .DC, .AC (all three sweep types) and .TRAN with
 * its optional start, maximum step and UIC flag.
 */

TEST(DcCommandParse, SweepOverSource)
{
  std::string line = ".DC Vin 0 1.8 10m";
  auto result = SimCommand::parse(Cursor(line));
  ASSERT_TRUE(result.ok());
  auto dc = std::dynamic_pointer_cast<DcCommand>(result.value());
  ASSERT_NE(dc, nullptr);
  EXPECT_EQ(dc->getType(), SimCommandType::Dc);
  EXPECT_EQ(dc->getSource(), "Vin");
  EXPECT_DOUBLE_EQ(dc->getStart().toDouble(), 0.0);
  EXPECT_DOUBLE_EQ(dc->getStop().toDouble(), 1.8);
  EXPECT_DOUBLE_EQ(dc->getStep().toDouble(), 10e-3);
  EXPECT_EQ(dc->toSpice(), ".DC Vin 0 1.8 10m");
}

TEST(DcCommandParse, MissingStepIsFatal)
{
  std::string line = ".dc V1 0 1";
  auto result = SimCommand::parse(Cursor(line));
  EXPECT_TRUE(result.isFailure());
  EXPECT_NE(result.getError().render(line).find("step_value"),
            std::string::npos);
}

TEST(AcCommandParse, SweepTypes)
{
  std::string dec = ".AC DEC 10 1 1G";
  auto first = SimCommand::parse(Cursor(dec));
  ASSERT_TRUE(first.ok());
  auto ac = std::dynamic_pointer_cast<AcCommand>(first.value());
  ASSERT_NE(ac, nullptr);
  EXPECT_EQ(ac->getSweep(), AcSweepType::Dec);
  EXPECT_EQ(ac->getPoints(), 10u);
  EXPECT_DOUBLE_EQ(ac->getStart().toDouble(), 1.0);
  EXPECT_DOUBLE_EQ(ac->getStop().toDouble(), 1e6);

  std::string oct = ".ac oct 5 10Hz 1kHz";
  auto second = SimCommand::parse(Cursor(oct));
  ASSERT_TRUE(second.ok());
  auto octave = std::dynamic_pointer_cast<AcCommand>(second.value());
  ASSERT_NE(octave, nullptr);
  EXPECT_EQ(octave->getSweep(), AcSweepType::Oct);
  EXPECT_DOUBLE_EQ(octave->getStop().toDouble(), 1e3);

  std::string lin = ".AC LIN 100 1k 2k";
  auto third = SimCommand::parse(Cursor(lin));
  ASSERT_TRUE(third.ok());
  EXPECT_EQ(third.value()->toSpice(), ".AC LIN 100 1k 2k");
}

TEST(AcCommandParse, BadSweepTypeIsFatal)
{
  std::string line = ".AC LOG 10 1 1k";
  auto result = SimCommand::parse(Cursor(line));
  EXPECT_TRUE(result.isFailure());
  EXPECT_NE(result.getError().render(line).find("sweep_type"),
            std::string::npos);
}

TEST(TranCommandParse, StepAndStopOnly)
{
  std::string line = ".TRAN 1n 100n";
  auto result = SimCommand::parse(Cursor(line));
  ASSERT_TRUE(result.ok());
  auto tran = std::dynamic_pointer_cast<TranCommand>(result.value());
  ASSERT_NE(tran, nullptr);
  EXPECT_DOUBLE_EQ(tran->getStep().toDouble(), 1e-9);
  EXPECT_DOUBLE_EQ(tran->getStop().toDouble(), 100e-9);
  EXPECT_FALSE(tran->getStart().has_value());
  EXPECT_FALSE(tran->getMaxStep().has_value());
  EXPECT_FALSE(tran->getUic());
}

TEST(TranCommandParse, AllOptionalFields)
{
  std::string line = ".tran 1ns 100ns 10ns 0.5ns uic";
  auto result = SimCommand::parse(Cursor(line));
  ASSERT_TRUE(result.ok());
  auto tran = std::dynamic_pointer_cast<TranCommand>(result.value());
  ASSERT_NE(tran, nullptr);
  ASSERT_TRUE(tran->getStart().has_value());
  EXPECT_DOUBLE_EQ(tran->getStart()->toDouble(), 10e-9);
  ASSERT_TRUE(tran->getMaxStep().has_value());
  EXPECT_DOUBLE_EQ(tran->getMaxStep()->toDouble(), 0.5e-9);
  EXPECT_TRUE(tran->getUic());
  EXPECT_EQ(tran->toSpice(), ".TRAN 1n 100n 10n 0.5n UIC");
}

TEST(TranCommandParse, UnknownTrailingWordIsFatal)
{
  std::string line = ".TRAN 1n 10n fast";
  auto result = SimCommand::parse(Cursor(line));
  EXPECT_TRUE(result.isFailure());
}

TEST(TranCommandWrite, MaxStepWithoutStart)
{
  TranCommand tran(UnitNumber(1, Suffix::Nano, Unit::Second),
                   UnitNumber(10, Suffix::Nano, Unit::Second), std::nullopt,
                   UnitNumber(2, Suffix::Pico, Unit::Second));
  EXPECT_EQ(tran.toSpice(), ".TRAN 1n 10n 0 2p");
}

TEST(SimCommandParse, OtherDotCommandsAreNotAnalyses)
{
  std::string line = ".MODEL d1 D ()";
  EXPECT_TRUE(SimCommand::parse(Cursor(line)).isError());
}
