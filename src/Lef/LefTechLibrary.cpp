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
 * @file LefTechLibrary.cpp
 * @brief LEF header statements and the library production.
 */

#include "LefTechLibrary.hpp"

#include <optional>
#include <string>
#include <vector>

#include "Lexer.hpp"

namespace {
/** `<word> <number> ;` with the number read by `value`. */
template <typename Fn>
auto keyedStatement(const Cursor& input, const std::string& word, Fn value)
    -> decltype(value(input))
{
    using Result = decltype(value(input));

    auto keyword = commit(LefLexer::keyword(input, word), input, word);
    if (!keyword.ok())
        return Result::propagate(keyword);
    Cursor in = keyword.rest();

    auto result = commit(value(in), in, word);
    if (!result.ok())
        return result;
    in = result.rest();

    auto semicolon = commit(LefLexer::keyword(in, ";"), in, ";");
    if (!semicolon.ok())
        return Result::propagate(semicolon);
    result.setRest(semicolon.rest());
    return result;
}

/** `<keyword> "<choice>" ;` returning the choice without its quotes. */
ParseResult<std::string> quotedChoice(const Cursor& input,
                                      const std::string& word,
                                      const std::vector<std::string>& choices)
{
    auto keyword = commit(LefLexer::keyword(input, word), input, word);
    if (!keyword.ok())
        return keyword;
    Cursor in = keyword.rest();

    auto choice = commit(LefLexer::keywordOf(in, choices, word), in, word);
    if (!choice.ok())
        return choice;
    in = choice.rest();

    auto semicolon = commit(LefLexer::keyword(in, ";"), in, ";");
    if (!semicolon.ok())
        return semicolon;

    const std::string& quoted = choice.value();
    return ParseResult<std::string>::success(
        semicolon.rest(), quoted.substr(1, quoted.size() - 2));
}

struct UnitsClause
{
    const char* keyword;
    const char* unit;
    std::optional<double> LefUnits::*field;
};
}  // namespace

ParseResult<LefUnits> LefUnits::parse(const Cursor& input)
{
    static const UnitsClause clauses[] = {
        {"TIME", "NANOSECONDS", &LefUnits::time},
        {"CAPACITANCE", "PICOFARADS", &LefUnits::capacitance},
        {"RESISTANCE", "OHMS", &LefUnits::resistance},
        {"POWER", "MILLIWATTS", &LefUnits::power},
        {"CURRENT", "MILLIAMPS", &LefUnits::current},
        {"VOLTAGE", "VOLTS", &LefUnits::voltage},
        {"FREQUENCY", "MEGAHERTZ", &LefUnits::frequency}};

    auto keyword = commit(LefLexer::keyword(input, "UNITS"), input, "UNITS");
    if (!keyword.ok())
        return ParseResult<LefUnits>::propagate(keyword);
    Cursor in = keyword.rest();

    LefUnits units;
    while (true) {
        auto end = LefLexer::keyword(in, "END");
        if (end.ok()) {
            Cursor at = end.rest();
            auto closing =
                commit(LefLexer::keyword(at, "UNITS"), at, "END UNITS");
            if (!closing.ok())
                return ParseResult<LefUnits>::propagate(closing);
            return ParseResult<LefUnits>::success(closing.rest(), units);
        }

        auto database = LefLexer::keyword(in, "DATABASE");
        if (database.ok()) {
            auto microns = keyedStatement(database.rest(), "MICRONS",
                                          LefLexer::unsignedInt);
            if (!microns.ok())
                return ParseResult<LefUnits>::propagate(microns);
            units.databaseMicrons = microns.value();
            in = microns.rest();
            continue;
        }

        bool matched = false;
        for (const UnitsClause& clause : clauses) {
            auto name = LefLexer::keyword(in, clause.keyword);
            if (!name.ok())
                continue;
            auto factor =
                keyedStatement(name.rest(), clause.unit, LefLexer::number);
            if (!factor.ok())
                return ParseResult<LefUnits>::propagate(factor);
            units.*clause.field = factor.value();
            in = factor.rest();
            matched = true;
            break;
        }
        if (!matched)
            return ParseResult<LefUnits>::fail(LefLexer::skipSpace(in),
                                               "units clause or END UNITS");
    }
}

ParseResult<LefTechLibrary> LefTechLibrary::parse(const Cursor& input)
{
    LefTechLibrary library;

    auto version = keyedStatement(input, "VERSION", LefLexer::number);
    if (!version.ok())
        return ParseResult<LefTechLibrary>::propagate(version);
    library.version = version.value();
    Cursor in = version.rest();

    auto busBit = quotedChoice(in, "BUSBITCHARS",
                               {"\"[]\"", "\"{}\"", "\"<>\""});
    if (!busBit.ok())
        return ParseResult<LefTechLibrary>::propagate(busBit);
    library.busBitChars = busBit.value();
    in = busBit.rest();

    auto divider = quotedChoice(in, "DIVIDERCHAR",
                                {"\"/\"", "\"\\\"", "\"%\"", "\"$\""});
    if (!divider.ok())
        return ParseResult<LefTechLibrary>::propagate(divider);
    library.dividerChar = divider.value();
    in = divider.rest();

    auto units = LefUnits::parse(in);
    if (!units.ok())
        return ParseResult<LefTechLibrary>::propagate(units);
    library.units = units.value();
    in = units.rest();

    auto grid = LefLexer::valueStatement(in, "MANUFACTURINGGRID");
    if (grid.isFailure())
        return ParseResult<LefTechLibrary>::propagate(grid);
    if (grid.ok()) {
        library.manufacturingGrid = grid.value();
        in = grid.rest();
    }

    auto minSpacing = LefLexer::keyword(in, "USEMINSPACING");
    if (minSpacing.ok()) {
        Cursor at = LefLexer::skipSpace(minSpacing.rest());
        auto value = commit(LefLexer::identifier(at), at, "USEMINSPACING");
        if (!value.ok())
            return ParseResult<LefTechLibrary>::propagate(value);
        if (value.value() != "ON" && value.value() != "OFF")
            return ParseResult<LefTechLibrary>::fail(
                at, "expected USEMINSPACING ON or OFF");
        library.useMinSpacing = LefUseMinSpacing::On;
        in = value.rest();

        auto semicolon = commit(LefLexer::keyword(in, ";"), in, ";");
        if (!semicolon.ok())
            return ParseResult<LefTechLibrary>::propagate(semicolon);
        in = semicolon.rest();
    }

    while (true) {
        auto layer = LefLayer::parse(in);
        if (layer.isError())
            break;
        if (layer.isFailure())
            return ParseResult<LefTechLibrary>::propagate(layer);
        library.layers.push_back(layer.value());
        in = layer.rest();
    }

    auto end = LefLexer::keyword(in, "END");
    if (end.ok()) {
        auto name = LefLexer::keyword(end.rest(), "LIBRARY");
        if (name.ok())
            in = name.rest();
    }

    return ParseResult<LefTechLibrary>::success(in, library);
}
