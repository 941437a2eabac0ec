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
#include <cmath>
#include <vector>

/*
 * Time-domain evaluation of SIN, PWL and PULSE values, and the clock
 * helper. Times are in seconds, amplitudes in volts.
 */

namespace {
UnitNumber volts(double v) { return UnitNumber(v, Suffix::None, Unit::Volt); }
UnitNumber seconds(double t)
{
  return UnitNumber(t, Suffix::None, Unit::Second);
}
UnitNumber hertz(double f) { return UnitNumber(f, Suffix::None, Unit::Hertz); }
UnitNumber degrees(double d)
{
  return UnitNumber(d, Suffix::None, Unit::Degree);
}
}  // namespace

TEST(SinEvaluate, QuarterPeriodPeak)
{
  SinValue sin(volts(0.5), volts(1.0), hertz(1.0), seconds(0.0), hertz(0.0),
               degrees(0.0));
  EXPECT_NEAR(sin.valueAt(0.0), 0.5, 1e-12);
  EXPECT_NEAR(sin.valueAt(0.25), 1.5, 1e-12);
  EXPECT_NEAR(sin.valueAt(0.75), -0.5, 1e-12);
}

TEST(SinEvaluate, DelayDampingAndPhase)
{
  SinValue sin(volts(0.0), volts(2.0), hertz(1.0), seconds(1.0), hertz(1.0),
               degrees(90.0));
  // Before the delay only the offset is seen.
  EXPECT_DOUBLE_EQ(sin.valueAt(0.5), 0.0);
  // At the delay the 90 degree phase gives the full amplitude.
  EXPECT_NEAR(sin.valueAt(1.0), 2.0, 1e-12);
  // One period later the envelope has decayed by e^-1.
  EXPECT_NEAR(sin.valueAt(2.0), 2.0 * std::exp(-1.0), 1e-12);
}

TEST(PwlEvaluate, InterpolatesAndHolds)
{
  std::vector<PwlValue::Point> points = {{seconds(1.0), volts(0.0)},
                                         {seconds(2.0), volts(2.0)},
                                         {seconds(4.0), volts(1.0)}};
  PwlValue pwl(points);
  EXPECT_DOUBLE_EQ(pwl.valueAt(0.0), 0.0);
  EXPECT_DOUBLE_EQ(pwl.valueAt(1.5), 1.0);
  EXPECT_DOUBLE_EQ(pwl.valueAt(3.0), 1.5);
  EXPECT_DOUBLE_EQ(pwl.valueAt(10.0), 1.0);
}

TEST(PwlEvaluate, VerticalStep)
{
  std::vector<PwlValue::Point> points = {{seconds(0.0), volts(0.0)},
                                         {seconds(1.0), volts(0.0)},
                                         {seconds(1.0), volts(5.0)}};
  PwlValue pwl(points);
  EXPECT_DOUBLE_EQ(pwl.valueAt(0.5), 0.0);
  EXPECT_DOUBLE_EQ(pwl.valueAt(2.0), 5.0);
}

TEST(PulseEvaluate, OnePeriodAndRepeat)
{
  PulseValue pulse(volts(0.0), volts(1.0), seconds(0.0), seconds(1.0),
                   seconds(1.0), seconds(2.0), seconds(10.0));
  EXPECT_DOUBLE_EQ(pulse.valueAt(0.0), 0.0);
  EXPECT_DOUBLE_EQ(pulse.valueAt(0.5), 0.5);
  EXPECT_DOUBLE_EQ(pulse.valueAt(2.0), 1.0);
  EXPECT_DOUBLE_EQ(pulse.valueAt(3.5), 0.5);
  EXPECT_DOUBLE_EQ(pulse.valueAt(5.0), 0.0);
  EXPECT_DOUBLE_EQ(pulse.valueAt(10.5), 0.5);
}

TEST(PulseEvaluate, DelayHoldsInitialValue)
{
  PulseValue pulse(volts(0.2), volts(1.0), seconds(3.0), seconds(1.0),
                   seconds(1.0), seconds(1.0), seconds(0.0));
  EXPECT_DOUBLE_EQ(pulse.valueAt(2.0), 0.2);
  EXPECT_DOUBLE_EQ(pulse.valueAt(4.5), 1.0);
}

TEST(PulseClock, SymmetricDutyCycle)
{
  auto clock = PulseValue::clock(
      UnitNumber(1.8, Suffix::None, Unit::Volt),
      UnitNumber(10.0, Suffix::Nano, Unit::Second),
      UnitNumber(1.0, Suffix::Nano, Unit::Second));
  ASSERT_NE(clock, nullptr);
  EXPECT_DOUBLE_EQ(clock->getInitial().toDouble(), 0.0);
  EXPECT_DOUBLE_EQ(clock->getPulsed().toDouble(), 1.8);
  EXPECT_DOUBLE_EQ(clock->getDelay().toDouble(), 0.0);
  EXPECT_DOUBLE_EQ(clock->getRise().toDouble(), 1e-9);
  EXPECT_DOUBLE_EQ(clock->getFall().toDouble(), 1e-9);
  EXPECT_NEAR(clock->getWidth().toDouble(), 4e-9, 1e-18);
  EXPECT_DOUBLE_EQ(clock->getPeriod().toDouble(), 10e-9);
  EXPECT_EQ(clock->getWidth().getUnit(), Unit::Second);
}
