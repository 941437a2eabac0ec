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
 * @file Source.cpp
 * @brief Source line parsing and the DC/AC value forms.
 *
 * The waveform forms (SIN, PWL, PULSE) live in Waveforms.cpp.
 */

#include "Source.hpp"

#include <cctype>
#include <memory>
#include <string>

#include "Lexer.hpp"

namespace {
Unit amplitudeUnit(SourceKind kind)
{
    return kind == SourceKind::Voltage ? Unit::Volt : Unit::Ampere;
}
}  // namespace

ParseResult<SourceValuePtr> DcValue::parse(const Cursor& input, SourceKind kind)
{
    auto keyword = SpiceLexer::keywordOf(input, {"DC=", "DC"}, "DC");
    ParseResult<UnitNumber> value =
        keyword.ok()
            ? commit(SpiceLexer::quantityToken(keyword.rest(),
                                               amplitudeUnit(kind)),
                     keyword.rest(), "dc_value")
            : context(SpiceLexer::quantityToken(input, amplitudeUnit(kind)),
                      input, "dc_value");
    if (!value.ok())
        return ParseResult<SourceValuePtr>::propagate(value);

    SourceValuePtr dc = std::make_shared<DcValue>(kind, value.value());
    return ParseResult<SourceValuePtr>::success(value.rest(), dc);
}

std::string DcValue::toSpice() const { return "DC " + value.toSpice(); }

ParseResult<SourceValuePtr> AcValue::parse(const Cursor& input, SourceKind kind)
{
    auto keyword = SpiceLexer::keywordOf(input, {"AC=", "AC"}, "AC");
    bool committed = keyword.ok();
    Cursor in = committed ? keyword.rest() : input;

    auto magnitude = SpiceLexer::quantityToken(in, amplitudeUnit(kind));
    magnitude = committed ? commit(magnitude, in, "ac_magnitude")
                          : context(magnitude, in, "ac_magnitude");
    if (!magnitude.ok())
        return ParseResult<SourceValuePtr>::propagate(magnitude);
    in = magnitude.rest();

    auto phase = SpiceLexer::quantityToken(in, Unit::Degree);
    phase = committed ? commit(phase, in, "ac_phase")
                      : context(phase, in, "ac_phase");
    if (!phase.ok())
        return ParseResult<SourceValuePtr>::propagate(phase);

    SourceValuePtr ac =
        std::make_shared<AcValue>(kind, magnitude.value(), phase.value());
    return ParseResult<SourceValuePtr>::success(phase.rest(), ac);
}

std::string AcValue::toSpice() const
{
    return "AC " + magnitude.toSpice() + " " + phase.toSpice();
}

ParseResult<SourceValuePtr> Source::parseValue(const Cursor& input,
                                               SourceKind kind)
{
    using Production =
        ParseResult<SourceValuePtr> (*)(const Cursor&, SourceKind);
    static const Production forms[] = {DcValue::parse, AcValue::parse,
                                       SinValue::parse, PwlValue::parse,
                                       PulseValue::parse};

    for (Production form : forms) {
        auto value = form(input, kind);
        if (!value.isError())
            return value;
    }
    return ParseResult<SourceValuePtr>::reject(input, "source_value");
}

ParseResult<SourcePtr> Source::parse(const Cursor& input)
{
    auto id = SpiceLexer::identifierToken(input);
    if (!id.ok())
        return context(ParseResult<SourcePtr>::propagate(id), input, "source");

    SourceKind kind;
    switch (std::toupper(static_cast<unsigned char>(id.value()[0]))) {
        case 'V':
            kind = SourceKind::Voltage;
            break;
        case 'I':
            kind = SourceKind::Current;
            break;
        default:
            return ParseResult<SourcePtr>::reject(
                input, "Source must begin with V or I");
    }

    std::string name = id.value().substr(1);
    if (name.empty())
        return ParseResult<SourcePtr>::fail(input, "missing designator");
    Cursor in = id.rest();

    auto nodePos = commit(SpiceLexer::nodeToken(in), in, "node_pos");
    if (!nodePos.ok())
        return ParseResult<SourcePtr>::propagate(nodePos);
    in = nodePos.rest();

    auto nodeNeg = commit(SpiceLexer::nodeToken(in), in, "node_neg");
    if (!nodeNeg.ok())
        return ParseResult<SourcePtr>::propagate(nodeNeg);
    in = nodeNeg.rest();

    auto value = commit(parseValue(in, kind), in, "source_value");
    if (!value.ok())
        return ParseResult<SourcePtr>::propagate(value);

    SourcePtr source = std::make_shared<Source>(
        name, kind, nodePos.value(), nodeNeg.value(), value.value());
    return ParseResult<SourcePtr>::success(value.rest(), source);
}

std::string Source::toSpice() const
{
    std::string letter = kind == SourceKind::Voltage ? "V" : "I";
    return letter + name + " " + nodePos + " " + nodeNeg + " " +
           value->toSpice();
}
