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
 * @file MeasureCommand.cpp
 * @brief `.MEAS` parsing and SPICE output.
 *
 * Implementation notes:
 *  - Output variables take everything up to the first `)` as their text;
 *    the suffix is sniffed on that raw text before it is split into nodes.
 *  - Comparison levels (`VAL=`, `WHEN ...=`) are read with the unit table of
 *    the probed quantity, so `VAL=0.5V` and `VAL=1mA` are accepted.
 */

#include "MeasureCommand.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "Lexer.hpp"

namespace {
bool endsWith(const std::string& text, const std::string& tail)
{
    return text.size() >= tail.size() &&
           text.compare(text.size() - tail.size(), tail.size(), tail) == 0;
}

ParseResult<Number> level(const Cursor& input, OutputKind kind)
{
    Unit unit = kind == OutputKind::Voltage ? Unit::Volt : Unit::Ampere;
    auto value = SpiceLexer::quantityToken(input, unit);
    if (!value.ok())
        return ParseResult<Number>::propagate(value);
    return ParseResult<Number>::success(value.rest(), value.value().getNumber());
}
}  // namespace

/* ----------------------------- Output variables -------------------------- */

OutputSuffix OutputVariable::sniffSuffix(const std::string& text)
{
    if (endsWith(text, "M"))
        return OutputSuffix::Magnitude;
    if (endsWith(text, "DB"))
        return OutputSuffix::Decibel;
    if (endsWith(text, "P"))
        return OutputSuffix::Phase;
    if (endsWith(text, "R"))
        return OutputSuffix::Real;
    if (endsWith(text, "I"))
        return OutputSuffix::Imag;
    return OutputSuffix::None;
}

ParseResult<OutputVariable> OutputVariable::parse(const Cursor& input)
{
    auto kindToken = SpiceLexer::keywordOf(input, {"V", "I"}, "V or I");
    if (!kindToken.ok())
        return ParseResult<OutputVariable>::propagate(kindToken);

    auto open = SpiceLexer::keyword(kindToken.rest(), "(");
    if (!open.ok())
        return ParseResult<OutputVariable>::propagate(open);
    Cursor in = open.rest();

    size_t length = 0;
    while (length < in.remaining() && in.peek(length) != ')')
        ++length;
    if (length >= in.remaining())
        return ParseResult<OutputVariable>::reject(in, ")");
    std::string text = in.take(length);

    OutputVariable variable;
    variable.suffix = sniffSuffix(text);
    if (kindToken.value() == "V") {
        variable.kind = OutputKind::Voltage;
        size_t comma = text.find(',');
        variable.node1 = Lexer::trim(text.substr(0, comma));
        if (comma != std::string::npos)
            variable.node2 = Lexer::trim(text.substr(comma + 1));
    } else {
        variable.kind = OutputKind::Current;
        variable.elementName = text;
    }

    Cursor after = SpiceLexer::skipSpace(in.advance(length + 1));
    return ParseResult<OutputVariable>::success(after, variable);
}

std::string OutputVariable::toSpice() const
{
    if (kind == OutputKind::Current)
        return "I(" + elementName + ")";
    std::string text = "V(" + node1;
    if (node2)
        text += "," + *node2;
    return text + ")";
}

/* -------------------------------- Conditions ----------------------------- */

ParseResult<TrigTargCondition> TrigTargCondition::parse(const Cursor& input)
{
    auto variable = OutputVariable::parse(input);
    if (!variable.ok())
        return ParseResult<TrigTargCondition>::propagate(variable);

    auto val = SpiceLexer::keyword(variable.rest(), "VAL=");
    if (!val.ok())
        return ParseResult<TrigTargCondition>::propagate(val);

    auto value = level(val.rest(), variable.value().kind);
    if (!value.ok())
        return ParseResult<TrigTargCondition>::propagate(value);

    auto edge =
        SpiceLexer::keywordOf(value.rest(), {"RISE", "FALL"}, "RISE or FALL");
    if (!edge.ok())
        return ParseResult<TrigTargCondition>::propagate(edge);

    auto equals = SpiceLexer::keyword(edge.rest(), "=");
    if (!equals.ok())
        return ParseResult<TrigTargCondition>::propagate(equals);

    auto count = SpiceLexer::unsignedToken(equals.rest());
    if (!count.ok())
        return ParseResult<TrigTargCondition>::propagate(count);

    TrigTargCondition condition;
    condition.variable = variable.value();
    condition.value = value.value();
    condition.edge = edge.value() == "RISE" ? EdgeType::Rise : EdgeType::Fall;
    condition.number = count.value();
    return ParseResult<TrigTargCondition>::success(count.rest(), condition);
}

std::string TrigTargCondition::toSpice() const
{
    std::ostringstream oss;
    oss << variable.toSpice() << " VAL=" << value.toSpice() << " "
        << (edge == EdgeType::Rise ? "RISE" : "FALL") << "=" << number;
    return oss.str();
}

ParseResult<FindWhenCondition> FindWhenCondition::parse(const Cursor& input)
{
    auto variable = OutputVariable::parse(input);
    if (!variable.ok())
        return ParseResult<FindWhenCondition>::propagate(variable);

    auto equals = SpiceLexer::keyword(variable.rest(), "=");
    if (!equals.ok())
        return ParseResult<FindWhenCondition>::propagate(equals);

    auto value = level(equals.rest(), variable.value().kind);
    if (!value.ok())
        return ParseResult<FindWhenCondition>::propagate(value);

    FindWhenCondition condition;
    condition.variable = variable.value();
    condition.value = value.value();
    return ParseResult<FindWhenCondition>::success(value.rest(), condition);
}

std::string FindWhenCondition::toSpice() const
{
    return variable.toSpice() + "=" + value.toSpice();
}

/* --------------------------------- Commands ------------------------------ */

namespace {
ParseResult<MeasureCommandPtr> parseRise(const Cursor& input,
                                         const std::string& name,
                                         AnalysisType analysis)
{
    auto trigKeyword = SpiceLexer::keyword(input, "TRIG");
    if (!trigKeyword.ok())
        return ParseResult<MeasureCommandPtr>::propagate(trigKeyword);
    Cursor in = trigKeyword.rest();

    auto trig = commit(TrigTargCondition::parse(in), in, "trig");
    if (!trig.ok())
        return ParseResult<MeasureCommandPtr>::propagate(trig);
    in = trig.rest();

    auto targKeyword = commit(SpiceLexer::keyword(in, "TARG"), in, "TARG");
    if (!targKeyword.ok())
        return ParseResult<MeasureCommandPtr>::propagate(targKeyword);
    in = targKeyword.rest();

    auto targ = commit(TrigTargCondition::parse(in), in, "targ");
    if (!targ.ok())
        return ParseResult<MeasureCommandPtr>::propagate(targ);

    MeasureCommandPtr command = std::make_shared<MeasureRise>(
        name, analysis, trig.value(), targ.value());
    return ParseResult<MeasureCommandPtr>::success(targ.rest(), command);
}

ParseResult<MeasureCommandPtr> parseBasicStat(const Cursor& input,
                                              const std::string& name,
                                              AnalysisType analysis)
{
    static const std::vector<std::string> functions = {
        "AVG", "RMS", "MIN", "MAX", "PP", "DERIV", "INTEGRATE"};
    static const MeasureStat stats[] = {
        MeasureStat::Avg, MeasureStat::Rms,   MeasureStat::Min,
        MeasureStat::Max, MeasureStat::Pp,    MeasureStat::Deriv,
        MeasureStat::Integrate};

    auto function =
        SpiceLexer::keywordOf(input, functions, "measure function");
    if (!function.ok())
        return ParseResult<MeasureCommandPtr>::propagate(function);
    Cursor in = function.rest();

    MeasureStat stat = MeasureStat::Avg;
    for (size_t i = 0; i < functions.size(); ++i)
        if (functions[i] == function.value())
            stat = stats[i];

    auto variable = commit(OutputVariable::parse(in), in, "variable");
    if (!variable.ok())
        return ParseResult<MeasureCommandPtr>::propagate(variable);
    in = variable.rest();

    auto fromKeyword = commit(SpiceLexer::keyword(in, "FROM="), in, "FROM=");
    if (!fromKeyword.ok())
        return ParseResult<MeasureCommandPtr>::propagate(fromKeyword);
    in = fromKeyword.rest();

    auto from = commit(SpiceLexer::quantityToken(in, Unit::Second), in, "from");
    if (!from.ok())
        return ParseResult<MeasureCommandPtr>::propagate(from);
    in = from.rest();

    auto toKeyword = commit(SpiceLexer::keyword(in, "TO="), in, "TO=");
    if (!toKeyword.ok())
        return ParseResult<MeasureCommandPtr>::propagate(toKeyword);
    in = toKeyword.rest();

    auto to = commit(SpiceLexer::quantityToken(in, Unit::Second), in, "to");
    if (!to.ok())
        return ParseResult<MeasureCommandPtr>::propagate(to);

    MeasureCommandPtr command = std::make_shared<MeasureBasicStat>(
        name, analysis, stat, variable.value(), from.value(), to.value());
    return ParseResult<MeasureCommandPtr>::success(to.rest(), command);
}

ParseResult<MeasureCommandPtr> parseFindWhen(const Cursor& input,
                                             const std::string& name,
                                             AnalysisType analysis)
{
    auto findKeyword = SpiceLexer::keyword(input, "FIND");
    if (!findKeyword.ok())
        return ParseResult<MeasureCommandPtr>::propagate(findKeyword);
    Cursor in = findKeyword.rest();

    auto variable = commit(OutputVariable::parse(in), in, "variable");
    if (!variable.ok())
        return ParseResult<MeasureCommandPtr>::propagate(variable);
    in = variable.rest();

    auto whenKeyword = commit(SpiceLexer::keyword(in, "WHEN"), in, "WHEN");
    if (!whenKeyword.ok())
        return ParseResult<MeasureCommandPtr>::propagate(whenKeyword);
    in = whenKeyword.rest();

    auto when = commit(FindWhenCondition::parse(in), in, "when");
    if (!when.ok())
        return ParseResult<MeasureCommandPtr>::propagate(when);

    MeasureCommandPtr command = std::make_shared<MeasureFindWhen>(
        name, analysis, variable.value(), when.value());
    return ParseResult<MeasureCommandPtr>::success(when.rest(), command);
}
}  // namespace

ParseResult<MeasureCommandPtr> MeasureCommand::parse(const Cursor& input)
{
    auto keyword =
        SpiceLexer::keywordOf(input, {".MEASURE", ".MEAS"}, ".MEAS");
    if (!keyword.ok())
        return context(ParseResult<MeasureCommandPtr>::propagate(keyword),
                       input, "measure");
    Cursor in = keyword.rest();

    auto analysisToken = commit(
        SpiceLexer::keywordOf(in, {"TRAN", "AC", "DC"}, "TRAN, AC or DC"), in,
        "analysis");
    if (!analysisToken.ok())
        return ParseResult<MeasureCommandPtr>::propagate(analysisToken);
    in = analysisToken.rest();

    AnalysisType analysis = AnalysisType::Tran;
    if (analysisToken.value() == "AC")
        analysis = AnalysisType::Ac;
    else if (analysisToken.value() == "DC")
        analysis = AnalysisType::Dc;

    auto name = commit(SpiceLexer::identifierToken(in), in, "name");
    if (!name.ok())
        return ParseResult<MeasureCommandPtr>::propagate(name);
    in = name.rest();

    using Form = ParseResult<MeasureCommandPtr> (*)(
        const Cursor&, const std::string&, AnalysisType);
    static const Form forms[] = {parseRise, parseBasicStat, parseFindWhen};
    for (Form form : forms) {
        auto result = form(in, name.value(), analysis);
        if (!result.isError())
            return result;
    }
    return ParseResult<MeasureCommandPtr>::fail(
        in, "expected TRIG, a statistic function or FIND");
}

std::string MeasureCommand::header() const
{
    std::ostringstream oss;
    oss << ".MEAS " << analysis << " " << name;
    return oss.str();
}

std::string MeasureRise::toSpice() const
{
    return header() + " TRIG " + trig.toSpice() + " TARG " + targ.toSpice();
}

std::string MeasureBasicStat::toSpice() const
{
    std::ostringstream oss;
    oss << header() << " " << stat << " " << variable.toSpice()
        << " FROM=" << from.toSpice() << " TO=" << to.toSpice();
    return oss.str();
}

std::string MeasureFindWhen::toSpice() const
{
    return header() + " FIND " + variable.toSpice() + " WHEN " +
           when.toSpice();
}
