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

#include <MeasureCommand.hpp>
#include <memory>
#include <string>

/*
 * .MEAS tests cover the three measurement forms, output variable parsing
 * (differential voltages, branch currents, suffix sniffing) and the
 * committed failures after the analysis keyword.
 */

TEST(OutputVariableParse, SingleAndDifferentialVoltage)
{
  std::string single = "V(out)";
  auto first = OutputVariable::parse(Cursor(single));
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(first.value().kind, OutputKind::Voltage);
  EXPECT_EQ(first.value().node1, "out");
  EXPECT_FALSE(first.value().node2.has_value());
  EXPECT_EQ(first.value().suffix, OutputSuffix::None);

  std::string pair = "V(a, b)";
  auto second = OutputVariable::parse(Cursor(pair));
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(second.value().node1, "a");
  ASSERT_TRUE(second.value().node2.has_value());
  EXPECT_EQ(*second.value().node2, "b");
  EXPECT_EQ(second.value().toSpice(), "V(a,b)");
}

TEST(OutputVariableParse, BranchCurrent)
{
  std::string text = "I(Vdd)";
  auto result = OutputVariable::parse(Cursor(text));
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value().kind, OutputKind::Current);
  EXPECT_EQ(result.value().elementName, "Vdd");
  EXPECT_EQ(result.value().toSpice(), "I(Vdd)");
}

TEST(OutputVariableParse, UnclosedParenthesis)
{
  std::string text = "V(out";
  EXPECT_TRUE(OutputVariable::parse(Cursor(text)).isError());
}

TEST(OutputVariableSuffix, PriorityOrder)
{
  EXPECT_EQ(OutputVariable::sniffSuffix("outM"), OutputSuffix::Magnitude);
  EXPECT_EQ(OutputVariable::sniffSuffix("outDB"), OutputSuffix::Decibel);
  EXPECT_EQ(OutputVariable::sniffSuffix("outP"), OutputSuffix::Phase);
  EXPECT_EQ(OutputVariable::sniffSuffix("outR"), OutputSuffix::Real);
  EXPECT_EQ(OutputVariable::sniffSuffix("outI"), OutputSuffix::Imag);
  EXPECT_EQ(OutputVariable::sniffSuffix("out"), OutputSuffix::None);
  // "DB" is checked before the single letters, "M" before everything.
  EXPECT_EQ(OutputVariable::sniffSuffix("DBM"), OutputSuffix::Magnitude);
}

TEST(MeasureParse, TrigTargDelay)
{
  std::string line =
      ".MEAS TRAN tpd TRIG V(in) VAL=0.9 RISE=1 TARG V(out) VAL=0.9 FALL=2";
  auto result = MeasureCommand::parse(Cursor(line));
  ASSERT_TRUE(result.ok());
  auto rise = std::dynamic_pointer_cast<MeasureRise>(result.value());
  ASSERT_NE(rise, nullptr);
  EXPECT_EQ(rise->getName(), "tpd");
  EXPECT_EQ(rise->getAnalysis(), AnalysisType::Tran);
  EXPECT_EQ(rise->getType(), MeasureType::Rise);
  EXPECT_EQ(rise->getTrig().variable.node1, "in");
  EXPECT_EQ(rise->getTrig().edge, EdgeType::Rise);
  EXPECT_EQ(rise->getTrig().number, 1u);
  EXPECT_DOUBLE_EQ(rise->getTarg().value.toDouble(), 0.9);
  EXPECT_EQ(rise->getTarg().edge, EdgeType::Fall);
  EXPECT_EQ(rise->getTarg().number, 2u);
  EXPECT_EQ(rise->toSpice(), line);
}

TEST(MeasureParse, BasicStatistic)
{
  std::string line = ".measure tran vavg avg V(out) FROM=10n TO=20ns";
  auto result = MeasureCommand::parse(Cursor(line));
  ASSERT_TRUE(result.ok());
  auto stat = std::dynamic_pointer_cast<MeasureBasicStat>(result.value());
  ASSERT_NE(stat, nullptr);
  EXPECT_EQ(stat->getStat(), MeasureStat::Avg);
  EXPECT_DOUBLE_EQ(stat->getFrom().toDouble(), 10e-9);
  EXPECT_DOUBLE_EQ(stat->getTo().toDouble(), 20e-9);
  EXPECT_EQ(stat->toSpice(), ".MEAS TRAN vavg AVG V(out) FROM=10n TO=20n");
}

TEST(MeasureParse, PeakToPeakCurrent)
{
  std::string line = ".MEAS TRAN ipp PP I(Vdd) FROM=0 TO=1u";
  auto result = MeasureCommand::parse(Cursor(line));
  ASSERT_TRUE(result.ok());
  auto stat = std::dynamic_pointer_cast<MeasureBasicStat>(result.value());
  ASSERT_NE(stat, nullptr);
  EXPECT_EQ(stat->getStat(), MeasureStat::Pp);
  EXPECT_EQ(stat->getVariable().kind, OutputKind::Current);
}

TEST(MeasureParse, FindWhen)
{
  std::string line = ".MEAS AC gain FIND V(out) WHEN V(in)=1";
  auto result = MeasureCommand::parse(Cursor(line));
  ASSERT_TRUE(result.ok());
  auto find = std::dynamic_pointer_cast<MeasureFindWhen>(result.value());
  ASSERT_NE(find, nullptr);
  EXPECT_EQ(find->getAnalysis(), AnalysisType::Ac);
  EXPECT_EQ(find->getVariable().node1, "out");
  EXPECT_EQ(find->getWhen().variable.node1, "in");
  EXPECT_DOUBLE_EQ(find->getWhen().value.toDouble(), 1.0);
  EXPECT_EQ(find->toSpice(), line);
}

TEST(MeasureParse, BadAnalysisIsFatal)
{
  std::string line = ".MEAS OP x AVG V(out) FROM=0 TO=1";
  auto result = MeasureCommand::parse(Cursor(line));
  EXPECT_TRUE(result.isFailure());
  EXPECT_NE(result.getError().render(line).find("analysis"),
            std::string::npos);
}

TEST(MeasureParse, UnknownFormIsFatal)
{
  std::string line = ".MEAS TRAN x MEDIAN V(out)";
  auto result = MeasureCommand::parse(Cursor(line));
  EXPECT_TRUE(result.isFailure());
  EXPECT_NE(result.getError().render(line).find("TRIG"), std::string::npos);
}

TEST(MeasureParse, MissingTargIsFatal)
{
  std::string line = ".MEAS TRAN tpd TRIG V(in) VAL=0.9 RISE=1";
  auto result = MeasureCommand::parse(Cursor(line));
  EXPECT_TRUE(result.isFailure());
  EXPECT_NE(result.getError().render(line).find("in TARG"),
            std::string::npos);
}
