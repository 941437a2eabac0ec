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

/**
 * @file SimCommand.cpp
 * @brief Parsing and SPICE output of `.DC`, `.AC` and `.TRAN`.
 */

#include "SimCommand.hpp"

#include <memory>
#include <sstream>
#include <string>

#include "Lexer.hpp"

ParseResult<SimCommandPtr> SimCommand::parse(const Cursor& input)
{
    using Production = ParseResult<SimCommandPtr> (*)(const Cursor&);
    static const Production commands[] = {DcCommand::parse, AcCommand::parse,
                                          TranCommand::parse};

    for (Production command : commands) {
        auto result = command(input);
        if (!result.isError())
            return result;
    }
    return ParseResult<SimCommandPtr>::reject(input, "sim_command");
}

/* ------------------------------------ .DC -------------------------------- */

ParseResult<SimCommandPtr> DcCommand::parse(const Cursor& input)
{
    auto keyword = SpiceLexer::keyword(input, ".DC");
    if (!keyword.ok())
        return context(ParseResult<SimCommandPtr>::propagate(keyword), input,
                       "keyword");
    Cursor in = keyword.rest();

    auto source =
        commit(SpiceLexer::identifierToken(in), in, "source_name");
    if (!source.ok())
        return ParseResult<SimCommandPtr>::propagate(source);
    in = source.rest();

    UnitNumber values[3];
    const char* labels[3] = {"start_value", "stop_value", "step_value"};
    for (int i = 0; i < 3; ++i) {
        auto value =
            commit(SpiceLexer::quantityToken(in, Unit::Volt), in, labels[i]);
        if (!value.ok())
            return ParseResult<SimCommandPtr>::propagate(value);
        values[i] = value.value();
        in = value.rest();
    }

    SimCommandPtr command = std::make_shared<DcCommand>(
        source.value(), values[0], values[1], values[2]);
    return ParseResult<SimCommandPtr>::success(in, command);
}

std::string DcCommand::toSpice() const
{
    return ".DC " + source + " " + start.toSpice() + " " + stop.toSpice() +
           " " + step.toSpice();
}

/* ------------------------------------ .AC -------------------------------- */

ParseResult<SimCommandPtr> AcCommand::parse(const Cursor& input)
{
    auto keyword = SpiceLexer::keyword(input, ".AC");
    if (!keyword.ok())
        return context(ParseResult<SimCommandPtr>::propagate(keyword), input,
                       "keyword");
    Cursor in = keyword.rest();

    auto sweepToken = commit(
        SpiceLexer::keywordOf(in, {"LIN", "DEC", "OCT"}, "LIN, DEC or OCT"),
        in, "sweep_type");
    if (!sweepToken.ok())
        return ParseResult<SimCommandPtr>::propagate(sweepToken);
    in = sweepToken.rest();

    AcSweepType sweep = AcSweepType::Lin;
    if (sweepToken.value() == "DEC")
        sweep = AcSweepType::Dec;
    else if (sweepToken.value() == "OCT")
        sweep = AcSweepType::Oct;

    auto points = commit(SpiceLexer::unsignedToken(in), in, "points");
    if (!points.ok())
        return ParseResult<SimCommandPtr>::propagate(points);
    in = points.rest();

    auto fstart =
        commit(SpiceLexer::quantityToken(in, Unit::Hertz), in, "f_start");
    if (!fstart.ok())
        return ParseResult<SimCommandPtr>::propagate(fstart);
    in = fstart.rest();

    auto fstop =
        commit(SpiceLexer::quantityToken(in, Unit::Hertz), in, "f_stop");
    if (!fstop.ok())
        return ParseResult<SimCommandPtr>::propagate(fstop);

    SimCommandPtr command = std::make_shared<AcCommand>(
        sweep, points.value(), fstart.value(), fstop.value());
    return ParseResult<SimCommandPtr>::success(fstop.rest(), command);
}

std::string AcCommand::toSpice() const
{
    std::ostringstream oss;
    oss << ".AC " << sweep << " " << points << " " << fstart.toSpice() << " "
        << fstop.toSpice();
    return oss.str();
}

/* ----------------------------------- .TRAN ------------------------------- */

ParseResult<SimCommandPtr> TranCommand::parse(const Cursor& input)
{
    auto keyword = SpiceLexer::keyword(input, ".TRAN");
    if (!keyword.ok())
        return context(ParseResult<SimCommandPtr>::propagate(keyword), input,
                       "keyword");
    Cursor in = keyword.rest();

    auto step = commit(SpiceLexer::quantityToken(in, Unit::Second), in,
                       "t_step");
    if (!step.ok())
        return ParseResult<SimCommandPtr>::propagate(step);
    in = step.rest();

    auto stop = commit(SpiceLexer::quantityToken(in, Unit::Second), in,
                       "t_stop");
    if (!stop.ok())
        return ParseResult<SimCommandPtr>::propagate(stop);
    in = stop.rest();

    std::optional<UnitNumber> start;
    std::optional<UnitNumber> maxStep;
    auto startValue = SpiceLexer::quantityToken(in, Unit::Second);
    if (startValue.ok()) {
        start = startValue.value();
        in = startValue.rest();
        auto maxValue = SpiceLexer::quantityToken(in, Unit::Second);
        if (maxValue.ok()) {
            maxStep = maxValue.value();
            in = maxValue.rest();
        }
    }

    bool uic = false;
    auto flag = SpiceLexer::identifierToken(in);
    if (flag.ok()) {
        if (Lexer::upper(flag.value()) != "UIC")
            return ParseResult<SimCommandPtr>::fail(
                in, "expected UIC or end of line");
        uic = true;
        in = flag.rest();
    }

    SimCommandPtr command = std::make_shared<TranCommand>(
        step.value(), stop.value(), start, maxStep, uic);
    return ParseResult<SimCommandPtr>::success(in, command);
}

std::string TranCommand::toSpice() const
{
    std::string line = ".TRAN " + step.toSpice() + " " + stop.toSpice();
    if (start)
        line += " " + start->toSpice();
    else if (maxStep)
        line += " 0";
    if (maxStep)
        line += " " + maxStep->toSpice();
    if (uic)
        line += " UIC";
    return line;
}
