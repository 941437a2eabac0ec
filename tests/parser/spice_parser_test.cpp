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

#include <Capacitor.hpp>
#include <Resistor.hpp>
#include <SpiceParser.hpp>
#include <fstream>
#include <memory>
#include <string>

/*
 * Document-level tests for SpiceParser:
 *  - a complete netlist lands in the right document buckets
 *  - the writer output parses back to the same text
 *  - unknown statements and committed failures are reported with their line
 *  - `.END` stops the reader
 *  - file access errors
 */

namespace {
const std::string kInverterNetlist =
    ".TITLE inverter test\n"
    ".INCLUDE \"models.lib\"\n"
    "* device models\n"
    ".MODEL nch NMOS (VTO=0.7 KP=110u)\n"
    ".MODEL pch PMOS (VTO=-0.7 KP=50u)\n"
    ".SUBCKT inv in out vdd gnd\n"
    "M1 out in gnd gnd nch L=1u W=2u\n"
    "M2 out in vdd vdd pch L=1u W=4u\n"
    ".ENDS inv\n"
    "\n"
    "R1 in mid 1k\n"
    "C1 out 0 10p\n"
    "V1 vdd 0 DC 1.8\n"
    "Vin in 0 PULSE(0 1.8 1n 100p 100p 5n 10n)\n"
    "Xinv1 mid out vdd 0 inv\n"
    ".TRAN 10p 20n\n"
    ".MEAS TRAN delay TRIG V(in) VAL=0.9 RISE=1 TARG V(out) VAL=0.9 FALL=1\n"
    ".END\n";
}  // namespace

TEST(SpiceParserDocument, InverterNetlist)
{
    SpiceParser parser;
    ASSERT_EQ(parser.parseString(kInverterNetlist), 0);

    const SpiceDocument& doc = parser.getDocument();
    EXPECT_EQ(doc.title, "inverter test");
    ASSERT_EQ(doc.includes.size(), 1u);
    EXPECT_EQ(doc.includes[0], "models.lib");
    EXPECT_EQ(doc.models.size(), 2u);
    ASSERT_EQ(doc.subckts.size(), 1u);
    EXPECT_EQ(doc.subckts[0]->getComponents().size(), 2u);
    EXPECT_EQ(doc.components.size(), 2u);
    EXPECT_EQ(doc.sources.size(), 2u);
    ASSERT_EQ(doc.instances.size(), 1u);
    EXPECT_EQ(doc.instances[0]->getSubcktName(), "inv");
    EXPECT_EQ(doc.simulations.size(), 1u);
    EXPECT_EQ(doc.measures.size(), 1u);
    EXPECT_TRUE(parser.getLastError().empty());
}

TEST(SpiceParserDocument, RcTransientWithRiseMeasure)
{
    const std::string netlist =
        "R1 in out 10k\n"
        "C1 out 0 1u\n"
        "V1 in 0 DC 5\n"
        ".TRAN 1n 10n\n"
        ".MEAS TRAN rise_time TRIG V(out) VAL=0.2 RISE=1 TARG V(out) VAL=0.8 "
        "RISE=1\n";
    SpiceParser parser;
    ASSERT_EQ(parser.parseString(netlist), 0);
    const SpiceDocument& doc = parser.getDocument();

    ASSERT_EQ(doc.components.size(), 2u);
    auto r1 = std::dynamic_pointer_cast<Resistor>(doc.components[0]);
    ASSERT_NE(r1, nullptr);
    EXPECT_EQ(r1->getResistance().getUnit(), Unit::Ohm);
    EXPECT_DOUBLE_EQ(r1->getResistance().toDouble(), 10e3);
    auto c1 = std::dynamic_pointer_cast<Capacitor>(doc.components[1]);
    ASSERT_NE(c1, nullptr);
    EXPECT_EQ(c1->getCapacitance().getUnit(), Unit::Farad);
    EXPECT_DOUBLE_EQ(c1->getCapacitance().toDouble(), 1e-6);

    ASSERT_EQ(doc.sources.size(), 1u);
    EXPECT_EQ(doc.sources[0]->getName(), "1");
    EXPECT_EQ(doc.sources[0]->getKind(), SourceKind::Voltage);
    auto dc = std::dynamic_pointer_cast<DcValue>(doc.sources[0]->getValue());
    ASSERT_NE(dc, nullptr);
    EXPECT_EQ(dc->getType(), SourceValueType::DcVoltage);
    EXPECT_DOUBLE_EQ(dc->getValue().toDouble(), 5.0);

    ASSERT_EQ(doc.simulations.size(), 1u);
    auto tran = std::dynamic_pointer_cast<TranCommand>(doc.simulations[0]);
    ASSERT_NE(tran, nullptr);
    EXPECT_DOUBLE_EQ(tran->getStep().toDouble(), 1e-9);
    EXPECT_DOUBLE_EQ(tran->getStop().toDouble(), 10e-9);

    ASSERT_EQ(doc.measures.size(), 1u);
    EXPECT_EQ(doc.measures[0]->getType(), MeasureType::Rise);
    EXPECT_EQ(doc.measures[0]->getName(), "rise_time");
}

TEST(SpiceParserErrors, InvalidSecondLineIsUnknown)
{
    SpiceParser parser;
    testing::internal::CaptureStderr();
    int rc = parser.parseString("R1 in out 1k\nTHIS_IS_INVALID");
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(rc, 1);
    EXPECT_EQ(parser.getLastError(),
              "At line 2: Unknown statement: THIS_IS_INVALID");
    EXPECT_NE(err.find("THIS_IS_INVALID"), std::string::npos);
}

TEST(SpiceParserDocument, WriterOutputParsesBack)
{
    SpiceParser first;
    ASSERT_EQ(first.parseString(kInverterNetlist), 0);
    std::string emitted = first.getDocument().toSpice();

    EXPECT_NE(emitted.find(".MODEL nch NMOS (KP=110u VTO=0.7)"),
              std::string::npos);
    EXPECT_NE(emitted.find("M1 out in gnd gnd nch L=1u W=2u"),
              std::string::npos);
    EXPECT_NE(emitted.find("Vin in 0 PULSE(0 1.8 1n 100p 100p 5n 10n)"),
              std::string::npos);
    EXPECT_NE(emitted.find(".ENDS inv\n"), std::string::npos);

    SpiceParser second;
    ASSERT_EQ(second.parseString(emitted), 0);
    EXPECT_EQ(second.getDocument().toSpice(), emitted);
}

TEST(SpiceParserDocument, EmptyInputGivesEmptyDocument)
{
    SpiceParser parser;
    EXPECT_EQ(parser.parseString("* only a comment\n\n"), 0);
    EXPECT_TRUE(parser.getDocument().empty());
}

TEST(SpiceParserDocument, StopsAtEnd)
{
    SpiceParser parser;
    ASSERT_EQ(parser.parseString("R1 a b 1\n.end\nthis is not read\n"), 0);
    EXPECT_EQ(parser.getDocument().components.size(), 1u);
}

TEST(SpiceParserDocument, ContinuationAndTrailingComment)
{
    SpiceParser parser;
    ASSERT_EQ(parser.parseString("R1 a b\n+ 2.2k ; load\n"), 0);
    ASSERT_EQ(parser.getDocument().components.size(), 1u);
    EXPECT_EQ(parser.getDocument().components[0]->toSpice(), "R1 a b 2.2k");
}

TEST(SpiceParserErrors, UnknownStatementReportsLine)
{
    SpiceParser parser;
    testing::internal::CaptureStderr();
    int rc = parser.parseString("R1 a b 1k\nfoo bar\n");
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(rc, 1);
    EXPECT_NE(err.find("At line 2: Unknown statement: foo bar"),
              std::string::npos);
    EXPECT_EQ(parser.getLastError(), "At line 2: Unknown statement: foo bar");
    // A failed parse leaves nothing behind.
    EXPECT_TRUE(parser.getDocument().empty());
}

TEST(SpiceParserErrors, TopLevelEndsIsUnknown)
{
    SpiceParser parser;
    testing::internal::CaptureStderr();
    int rc = parser.parseString(".ENDS\n");
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(rc, 1);
    EXPECT_NE(err.find("Unknown statement: .ENDS"), std::string::npos);
}

TEST(SpiceParserErrors, CommittedFailureShowsTrace)
{
    SpiceParser parser;
    testing::internal::CaptureStderr();
    int rc = parser.parseString("* header\nR1 a b\n");
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(rc, 1);
    EXPECT_NE(err.find("Error at line 2:"), std::string::npos);
    EXPECT_NE(err.find("in value"), std::string::npos);
    EXPECT_NE(err.find("in resistor"), std::string::npos);
}

TEST(SpiceParserErrors, MosfetWithoutGeometry)
{
    SpiceParser parser;
    testing::internal::CaptureStderr();
    int rc = parser.parseString("M1 d g s b nch L=1u\n");
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(rc, 1);
    EXPECT_NE(err.find("no w/l given"), std::string::npos);
}

TEST(SpiceParserErrors, MissingFile)
{
    SpiceParser parser;
    testing::internal::CaptureStderr();
    int rc = parser.parse("/nonexistent/dir/netlist.sp");
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(rc, 1);
    EXPECT_NE(err.find("Unable to open netlist file"), std::string::npos);
}

TEST(SpiceParserFile, ReadsFromDisk)
{
    std::string path = testing::TempDir() + "edaparse_rc.sp";
    {
        std::ofstream out(path);
        out << "* rc filter\nR1 in out 1k\nC1 out 0 1u\n.AC DEC 10 1 1meg\n";
    }
    SpiceParser parser;
    ASSERT_EQ(parser.parse(path), 0);
    EXPECT_EQ(parser.getDocument().components.size(), 2u);
    ASSERT_EQ(parser.getDocument().simulations.size(), 1u);
    EXPECT_EQ(parser.getDocument().simulations[0]->getType(),
              SimCommandType::Ac);
}

TEST(SpiceParserSummary, CountsPerKind)
{
    SpiceParser parser;
    ASSERT_EQ(parser.parseString(kInverterNetlist), 0);
    testing::internal::CaptureStdout();
    parser.printSummary();
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("Title: inverter test"), std::string::npos);
    EXPECT_NE(out.find("Total Resistors: 1"), std::string::npos);
    EXPECT_NE(out.find("Total Voltage Sources: 2"), std::string::npos);
    EXPECT_NE(out.find("Total Subcircuits: 1"), std::string::npos);
    EXPECT_NE(out.find("Total Models: 2"), std::string::npos);
}

TEST(SpiceStatementDispatch, EachKindIsRecognized)
{
    struct Case
    {
        std::string text;
        StatementType type;
    };
    const Case cases[] = {
        {"C1 a b 1u", StatementType::Component},
        {"I1 a b 1mA", StatementType::Source},
        {".DC V1 0 1 0.1", StatementType::Simulation},
        {".MEASURE TRAN avg1 AVG V(out) FROM=0 TO=10n",
         StatementType::Measure},
        {"X1 a b sub", StatementType::Instance},
        {".MODEL dmod D (IS=1e-14)", StatementType::Model},
        {".TITLE hello", StatementType::Title},
        {".inc lib.sp", StatementType::Include},
    };
    for (const Case& c : cases) {
        auto statement = SpiceParser::parseStatement(Cursor(c.text));
        ASSERT_TRUE(statement.ok()) << c.text;
        EXPECT_EQ(statement.value().type, c.type) << c.text;
    }
}
