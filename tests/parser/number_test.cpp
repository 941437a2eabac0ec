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

#include <Number.hpp>
#include <sstream>

TEST(NumberScale, SuffixScales)
{
    EXPECT_DOUBLE_EQ(suffixScale(Suffix::None), 1.0);
    EXPECT_DOUBLE_EQ(suffixScale(Suffix::Mega), 1e6);
    EXPECT_DOUBLE_EQ(suffixScale(Suffix::Kilo), 1e3);
    EXPECT_DOUBLE_EQ(suffixScale(Suffix::Milli), 1e-3);
    EXPECT_DOUBLE_EQ(suffixScale(Suffix::Micro), 1e-6);
    EXPECT_DOUBLE_EQ(suffixScale(Suffix::Nano), 1e-9);
    EXPECT_DOUBLE_EQ(suffixScale(Suffix::Pico), 1e-12);
}

TEST(NumberScale, ToDoubleKeepsMagnitudeAndSuffix)
{
    Number n(4.7, Suffix::Kilo);
    EXPECT_DOUBLE_EQ(n.getValue(), 4.7);
    EXPECT_EQ(n.getSuffix(), Suffix::Kilo);
    EXPECT_DOUBLE_EQ(n.toDouble(), 4700.0);
}

TEST(NumberFormat, ToSpicePrintsSuffixLetters)
{
    EXPECT_EQ(Number(1.5, Suffix::Mega).toSpice(), "1.5Meg");
    EXPECT_EQ(Number(10, Suffix::Pico).toSpice(), "10p");
    EXPECT_EQ(Number(3.3).toSpice(), "3.3");

    std::ostringstream oss;
    oss << UnitNumber(2.0, Suffix::Milli, Unit::Volt);
    EXPECT_EQ(oss.str(), "2mV");
}

TEST(NumberCompare, EqualityIsOnScaledValue)
{
    // 1000 and 1k are the same quantity.
    EXPECT_TRUE(Number(1000.0) == Number(1.0, Suffix::Kilo));
    EXPECT_TRUE(Number(1.0, Suffix::Milli) != Number(1.0, Suffix::Micro));
    EXPECT_TRUE(Number(1.0, Suffix::Nano) < Number(1.0, Suffix::Micro));
    EXPECT_FALSE(Number(1.0, Suffix::Kilo) < Number(1000.0));
}

TEST(NumberArithmetic, SumAndScale)
{
    Number sum = Number(1.0, Suffix::Kilo) + Number(500.0);
    EXPECT_DOUBLE_EQ(sum.toDouble(), 1500.0);

    Number diff = Number(1.0, Suffix::Micro) - Number(250.0, Suffix::Nano);
    EXPECT_NEAR(diff.toDouble(), 750e-9, 1e-18);

    // Scaling keeps the suffix.
    Number scaled = Number(2.0, Suffix::Nano) * 3.0;
    EXPECT_EQ(scaled.getSuffix(), Suffix::Nano);
    EXPECT_DOUBLE_EQ(scaled.getValue(), 6.0);
}

TEST(UnitNumberCompare, UnitTakesPart)
{
    UnitNumber volts(1.0, Suffix::None, Unit::Volt);
    UnitNumber amps(1.0, Suffix::None, Unit::Ampere);
    EXPECT_NE(volts, amps);
    EXPECT_EQ(volts, UnitNumber(Number(1000.0, Suffix::Milli), Unit::Volt));
}
