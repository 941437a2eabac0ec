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

#include <LefParser.hpp>
#include <fstream>
#include <string>

namespace {
const std::string kTechLef =
    "# sample technology\n"
    "VERSION 5.8 ;\n"
    "BUSBITCHARS \"[]\" ;\n"
    "DIVIDERCHAR \"/\" ;\n"
    "UNITS\n"
    "  DATABASE MICRONS 1000 ;\n"
    "END UNITS\n"
    "MANUFACTURINGGRID 0.005 ;\n"
    "\n"
    "LAYER nwell\n"
    "  TYPE MASTERSLICE ;\n"
    "  PROPERTY LEF58_TYPE \"TYPE NWELL\" ;\n"
    "END nwell\n"
    "LAYER nimp\n"
    "  TYPE IMPLANT ;\n"
    "  SPACING 0.3 ;\n"
    "END nimp\n"
    "LAYER metal1\n"
    "  TYPE ROUTING ;\n"
    "  DIRECTION HORIZONTAL ;\n"
    "  PITCH 0.2 ;\n"
    "  WIDTH 0.1 ;\n"
    "  SPACING 0.1 ;\n"
    "END metal1\n"
    "LAYER via1\n"
    "  TYPE CUT ;\n"
    "  SPACING 0.1 ;\n"
    "  WIDTH 0.1 ;\n"
    "END via1\n"
    "LAYER metal2\n"
    "  TYPE ROUTING ;\n"
    "  DIRECTION VERTICAL ;\n"
    "  PITCH 0.2 ;\n"
    "  WIDTH 0.1 ;\n"
    "END metal2\n"
    "END LIBRARY\n";
}  // namespace

TEST(LefParserLibrary, LayersInFileOrder)
{
    LefParser parser;
    ASSERT_EQ(parser.parseString(kTechLef), 0);

    const LefTechLibrary& lib = parser.getLibrary();
    EXPECT_DOUBLE_EQ(*lib.manufacturingGrid, 0.005);
    ASSERT_EQ(lib.layers.size(), 5u);
    EXPECT_EQ(lib.layers[0]->getName(), "nwell");
    EXPECT_EQ(lib.layers[0]->getKind(), LefLayerKind::Special);
    EXPECT_EQ(lib.layers[1]->getKind(), LefLayerKind::Implant);
    EXPECT_EQ(lib.layers[2]->getKind(), LefLayerKind::Routing);
    EXPECT_EQ(lib.layers[3]->getKind(), LefLayerKind::Cut);
    EXPECT_EQ(lib.layers[4]->getName(), "metal2");
    EXPECT_TRUE(parser.getLastError().empty());
}

TEST(LefParserLibrary, EndLibraryIsOptional)
{
    std::string text = kTechLef.substr(0, kTechLef.find("END LIBRARY"));
    LefParser parser;
    ASSERT_EQ(parser.parseString(text), 0);
    EXPECT_EQ(parser.getLibrary().layers.size(), 5u);
}

TEST(LefParserErrors, TrailingContentIsReported)
{
    LefParser parser;
    testing::internal::CaptureStderr();
    int rc = parser.parseString(kTechLef + "SITE core\n");
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(rc, 1);
    EXPECT_NE(err.find("Unexpected content: SITE core"), std::string::npos);
    EXPECT_TRUE(parser.getLibrary().layers.empty());
}

TEST(LefParserErrors, BrokenLayerReportsLine)
{
    std::string text =
        "VERSION 5.8 ;\nBUSBITCHARS \"[]\" ;\nDIVIDERCHAR \"/\" ;\n"
        "UNITS DATABASE MICRONS 100 ; END UNITS\n"
        "LAYER m1\n  TYPE CUT ;\nEND m2\n";
    LefParser parser;
    testing::internal::CaptureStderr();
    int rc = parser.parseString(text);
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(rc, 1);
    EXPECT_NE(err.find("Error at line 7:"), std::string::npos);
    EXPECT_NE(err.find("un match end name"), std::string::npos);
    EXPECT_EQ(parser.getLastError().rfind("Error at line 7:", 0), 0u);
}

TEST(LefParserErrors, MissingFile)
{
    LefParser parser;
    testing::internal::CaptureStderr();
    int rc = parser.parse("/nonexistent/tech.lef");
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(rc, 1);
    EXPECT_NE(err.find("Error: Unable to open LEF file '/nonexistent/tech.lef'"),
              std::string::npos);
}

TEST(LefParserFile, ReadsFromDisk)
{
    std::string path = testing::TempDir() + "edaparse_tech.lef";
    {
        std::ofstream out(path);
        out << kTechLef;
    }
    LefParser parser;
    ASSERT_EQ(parser.parse(path), 0);
    EXPECT_EQ(parser.getLibrary().layers.size(), 5u);
}

TEST(LefParserSummary, CountsPerKind)
{
    LefParser parser;
    ASSERT_EQ(parser.parseString(kTechLef), 0);
    testing::internal::CaptureStdout();
    parser.printSummary();
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("LEF Version: 5.8"), std::string::npos);
    EXPECT_NE(out.find("Database Units: 1000 per micron"), std::string::npos);
    EXPECT_NE(out.find("Total Layers: 5"), std::string::npos);
    EXPECT_NE(out.find("Total Routing Layers: 2"), std::string::npos);
    EXPECT_NE(out.find("Total Cut Layers: 1"), std::string::npos);
    EXPECT_NE(out.find("Total Implant Layers: 1"), std::string::npos);
    EXPECT_NE(out.find("Total Masterslice/Overlap Layers: 1"),
              std::string::npos);
}
