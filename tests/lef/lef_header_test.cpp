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

#include <LefTechLibrary.hpp>
#include <string>

/*
 * LEF header tests: the mandatory VERSION / BUSBITCHARS / DIVIDERCHAR /
 * UNITS sequence and the optional MANUFACTURINGGRID and USEMINSPACING
 * statements.
 */

namespace {
const std::string kHeader =
    "VERSION 5.8 ;\n"
    "BUSBITCHARS \"[]\" ;\n"
    "DIVIDERCHAR \"/\" ;\n"
    "UNITS\n"
    "    DATABASE MICRONS 2000 ;\n"
    "END UNITS\n";
}  // namespace

TEST(LefHeader, MandatoryStatements)
{
    auto result = LefTechLibrary::parse(Cursor(kHeader));
    ASSERT_TRUE(result.ok());
    const LefTechLibrary& lib = result.value();
    EXPECT_DOUBLE_EQ(lib.version, 5.8);
    EXPECT_EQ(lib.busBitChars, "[]");
    EXPECT_EQ(lib.dividerChar, "/");
    ASSERT_TRUE(lib.units.databaseMicrons.has_value());
    EXPECT_EQ(*lib.units.databaseMicrons, 2000u);
    EXPECT_FALSE(lib.manufacturingGrid.has_value());
    EXPECT_FALSE(lib.useMinSpacing.has_value());
    EXPECT_TRUE(lib.layers.empty());
    EXPECT_TRUE(result.rest().atEnd());
}

TEST(LefHeader, OtherDelimiterChoices)
{
    std::string text =
        "VERSION 5.7 ;\nBUSBITCHARS \"<>\" ;\nDIVIDERCHAR \"%\" ;\n"
        "UNITS DATABASE MICRONS 100 ; END UNITS\n";
    auto result = LefTechLibrary::parse(Cursor(text));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().busBitChars, "<>");
    EXPECT_EQ(result.value().dividerChar, "%");
}

TEST(LefHeader, UnsupportedBusBitCharsIsFatal)
{
    std::string text =
        "VERSION 5.8 ;\nBUSBITCHARS \"()\" ;\nDIVIDERCHAR \"/\" ;\n";
    auto result = LefTechLibrary::parse(Cursor(text));
    EXPECT_TRUE(result.isFailure());
    EXPECT_NE(result.getError().render(text).find("in BUSBITCHARS"),
              std::string::npos);
}

TEST(LefHeader, VersionIsRequired)
{
    std::string text = "BUSBITCHARS \"[]\" ;\n";
    auto result = LefTechLibrary::parse(Cursor(text));
    EXPECT_FALSE(result.ok());
    EXPECT_NE(result.getError().render(text).find("VERSION"),
              std::string::npos);
}

TEST(LefUnitsParse, ClausesInAnyOrder)
{
    std::string text =
        "UNITS\n"
        "  TIME NANOSECONDS 100 ;\n"
        "  DATABASE MICRONS 1000 ;\n"
        "  CAPACITANCE PICOFARADS 1 ;\n"
        "  FREQUENCY MEGAHERTZ 10 ;\n"
        "  RESISTANCE OHMS 10000 ;\n"
        "END UNITS\n";
    auto result = LefUnits::parse(Cursor(text));
    ASSERT_TRUE(result.ok());
    const LefUnits& units = result.value();
    EXPECT_EQ(*units.databaseMicrons, 1000u);
    EXPECT_DOUBLE_EQ(*units.time, 100.0);
    EXPECT_DOUBLE_EQ(*units.capacitance, 1.0);
    EXPECT_DOUBLE_EQ(*units.frequency, 10.0);
    EXPECT_DOUBLE_EQ(*units.resistance, 10000.0);
    EXPECT_FALSE(units.power.has_value());
    EXPECT_FALSE(units.voltage.has_value());
}

TEST(LefUnitsParse, WrongUnitNameIsFatal)
{
    std::string text = "UNITS TIME SECONDS 1 ; END UNITS";
    auto result = LefUnits::parse(Cursor(text));
    EXPECT_TRUE(result.isFailure());
    EXPECT_NE(result.getError().render(text).find("NANOSECONDS"),
              std::string::npos);
}

TEST(LefUnitsParse, UnknownClauseIsFatal)
{
    std::string text = "UNITS AREA SQUAREMICRONS 1 ; END UNITS";
    auto result = LefUnits::parse(Cursor(text));
    EXPECT_TRUE(result.isFailure());
    EXPECT_NE(result.getError().render(text).find("units clause or END UNITS"),
              std::string::npos);
}

TEST(LefUnitsParse, EndMustCloseUnits)
{
    std::string text = "UNITS DATABASE MICRONS 1000 ; END LIBRARY";
    EXPECT_TRUE(LefUnits::parse(Cursor(text)).isFailure());
}

TEST(LefHeader, ManufacturingGrid)
{
    std::string text = kHeader + "MANUFACTURINGGRID 0.005 ;\n";
    auto result = LefTechLibrary::parse(Cursor(text));
    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.value().manufacturingGrid.has_value());
    EXPECT_DOUBLE_EQ(*result.value().manufacturingGrid, 0.005);

    std::string broken = kHeader + "MANUFACTURINGGRID ;\n";
    EXPECT_TRUE(LefTechLibrary::parse(Cursor(broken)).isFailure());
}

TEST(LefHeader, UseMinSpacingOnAndOff)
{
    std::string on = kHeader + "USEMINSPACING ON ;\n";
    auto first = LefTechLibrary::parse(Cursor(on));
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(first.value().useMinSpacing.has_value());
    EXPECT_EQ(*first.value().useMinSpacing, LefUseMinSpacing::On);

    // OFF is accepted but reads as ON.
    std::string off = kHeader + "USEMINSPACING OFF ;\n";
    auto second = LefTechLibrary::parse(Cursor(off));
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(*second.value().useMinSpacing, LefUseMinSpacing::On);
}

TEST(LefHeader, UseMinSpacingValueIsCaseSensitive)
{
    std::string text = kHeader + "USEMINSPACING on ;\n";
    auto result = LefTechLibrary::parse(Cursor(text));
    EXPECT_TRUE(result.isFailure());
    EXPECT_NE(result.getError().render(text).find("ON or OFF"),
              std::string::npos);
}

TEST(LefHeader, EndLibraryIsConsumed)
{
    std::string text = kHeader + "END LIBRARY\n";
    auto result = LefTechLibrary::parse(Cursor(text));
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.rest().atEnd());
}
