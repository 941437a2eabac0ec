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
 * @file Lexer.cpp
 * @brief Shared primitives and the SPICE lexical layer.
 *
 * Implementation notes:
 *  - Numbers are recognized by scanning the literal's characters and then
 *    converting the cleaned text with `std::strtod`, so the magnitude is
 *    exactly what the text says.
 *  - Suffix tables are built once per unit from the generic scale table;
 *    unit-qualified forms come first so that e.g. `mv` is never read as `m`.
 */

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "Lexer.hpp"

using SuffixTable = std::vector<std::pair<std::string, Suffix>>;

ParseResult<double> Lexer::floatLiteral(const Cursor& input,
                                        bool allowUnderscores)
{
    std::string text;
    size_t i = 0;

    auto readDigits = [&]() {
        size_t start = i;
        while (isDigit(input.peek(i))) {
            text += input.peek(i);
            ++i;
            while (allowUnderscores && input.peek(i) == '_')
                ++i;
        }
        return i > start;
    };

    if (input.peek(i) == '-') {
        text += '-';
        ++i;
    }
    if (!readDigits())
        return ParseResult<double>::reject(input, "float");

    if (input.peek(i) == '.') {
        text += '.';
        ++i;
        readDigits();
    }

    if (input.peek(i) == 'e' || input.peek(i) == 'E') {
        size_t j = i + 1;
        char sign = input.peek(j);
        if (sign == '+' || sign == '-')
            ++j;
        if (isDigit(input.peek(j))) {
            text += 'e';
            if (sign == '+' || sign == '-')
                text += sign;
            i = j;
            readDigits();
        }
    }

    double value = std::strtod(text.c_str(), nullptr);
    return ParseResult<double>::success(input.advance(i), value);
}

ParseResult<unsigned> Lexer::unsignedInt(const Cursor& input)
{
    size_t i = 0;
    unsigned long long value = 0;
    bool overflow = false;
    while (isDigit(input.peek(i))) {
        value = value * 10 + static_cast<unsigned>(input.peek(i) - '0');
        if (value > 0xFFFFFFFFULL)
            overflow = true;
        ++i;
        if (overflow)
            break;
    }
    if (i == 0)
        return ParseResult<unsigned>::reject(input, "unsigned integer");
    if (overflow)
        return ParseResult<unsigned>::reject(input, "unsigned integer overflow");
    return ParseResult<unsigned>::success(input.advance(i),
                                          static_cast<unsigned>(value));
}

ParseResult<std::string> Lexer::oneOf(const Cursor& input,
                                      const std::vector<std::string>& choices,
                                      bool ignoreCase, const std::string& label)
{
    for (const auto& choice : choices) {
        bool match = ignoreCase ? input.startsWithNoCase(choice)
                                : input.startsWith(choice);
        if (match)
            return ParseResult<std::string>::success(
                input.advance(choice.size()), choice);
    }
    return ParseResult<std::string>::reject(input, label);
}

std::string Lexer::upper(const std::string& text)
{
    std::string out(text);
    for (auto& c : out)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

std::string Lexer::trim(const std::string& text)
{
    const char* ws = " \t\r\n\f\v";
    size_t start = text.find_first_not_of(ws);
    if (start == std::string::npos)
        return std::string();
    size_t end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

Cursor Lexer::skipAllSpace(const Cursor& input)
{
    Cursor c = input;
    while (!c.atEnd() && std::isspace(static_cast<unsigned char>(c.peek())))
        c = c.advance(1);
    return c;
}

/* ------------------------------------------------------------------------ */

Cursor SpiceLexer::skipSpace(const Cursor& input)
{
    Cursor c = input;
    while (!c.atEnd()) {
        char ch = c.peek();
        if (Lexer::isBlank(ch)) {
            c = c.advance(1);
        } else if (ch == '\n' && c.peek(1) == '+') {
            // Continuation line: the newline and the '+' are elided, the
            // blanks after it are skipped by the next iterations.
            c = c.advance(2);
        } else {
            break;
        }
    }
    return c;
}

ParseResult<std::string> SpiceLexer::identifier(const Cursor& input)
{
    char first = input.peek();
    if (!(Lexer::isAlpha(first) || first == '_'))
        return ParseResult<std::string>::reject(input, "identifier");

    size_t i = 1;
    for (char c = input.peek(i);
         Lexer::isAlpha(c) || Lexer::isDigit(c) || c == '_' || c == '.';
         c = input.peek(i))
        ++i;
    return ParseResult<std::string>::success(input.advance(i),
                                             input.take(i));
}

ParseResult<std::string> SpiceLexer::node(const Cursor& input)
{
    size_t i = 0;
    for (char c = input.peek(i);
         Lexer::isAlpha(c) || Lexer::isDigit(c) || c == '_' || c == '.';
         c = input.peek(i))
        ++i;
    if (i == 0)
        return ParseResult<std::string>::reject(input, "node");
    return ParseResult<std::string>::success(input.advance(i),
                                             input.take(i));
}

const SuffixTable& SpiceLexer::suffixTable(Unit unit)
{
    static const SuffixTable generic = {
        {"g", Suffix::Mega},  {"meg", Suffix::Mega},  {"k", Suffix::Kilo},
        {"m", Suffix::Milli}, {"u", Suffix::Micro},   {"n", Suffix::Nano},
        {"p", Suffix::Pico}};

    auto qualified = [](const std::vector<std::string>& letters) {
        SuffixTable table;
        for (const auto& scale : generic)
            for (const auto& letter : letters)
                table.emplace_back(scale.first + letter, scale.second);
        table.insert(table.end(), generic.begin(), generic.end());
        for (const auto& letter : letters)
            table.emplace_back(letter, Suffix::None);
        return table;
    };

    static const SuffixTable volt = qualified({"v"});
    static const SuffixTable ampere = qualified({"a"});
    static const SuffixTable ohm = qualified({"\xCE\xA9", "ohm"});
    static const SuffixTable farad = qualified({"f"});
    static const SuffixTable henry = qualified({"h"});
    static const SuffixTable second = qualified({"s"});
    static const SuffixTable hertz = qualified({"hz"});

    switch (unit) {
        case Unit::Volt:
            return volt;
        case Unit::Ampere:
            return ampere;
        case Unit::Ohm:
            return ohm;
        case Unit::Farad:
            return farad;
        case Unit::Henry:
            return henry;
        case Unit::Second:
            return second;
        case Unit::Hertz:
            return hertz;
        default:
            return generic;
    }
}

namespace {
std::pair<Cursor, Suffix> readSuffix(const Cursor& input,
                                     const SuffixTable& table)
{
    for (const auto& entry : table) {
        if (input.startsWithNoCase(entry.first))
            return {input.advance(entry.first.size()), entry.second};
    }
    return {input, Suffix::None};
}
}  // namespace

ParseResult<Number> SpiceLexer::number(const Cursor& input)
{
    auto magnitude = Lexer::floatLiteral(input, false);
    if (!magnitude.ok())
        return context(ParseResult<Number>::propagate(magnitude), input,
                       "number");
    auto suffix = readSuffix(magnitude.rest(), suffixTable(Unit::None));
    return ParseResult<Number>::success(
        suffix.first, Number(magnitude.value(), suffix.second));
}

ParseResult<UnitNumber> SpiceLexer::quantity(const Cursor& input, Unit unit)
{
    auto magnitude = Lexer::floatLiteral(input, false);
    if (!magnitude.ok()) {
        std::ostringstream label;
        label << "number [" << unit << "]";
        return context(ParseResult<UnitNumber>::propagate(magnitude), input,
                       label.str());
    }
    auto suffix = readSuffix(magnitude.rest(), suffixTable(unit));
    return ParseResult<UnitNumber>::success(
        suffix.first, UnitNumber(magnitude.value(), suffix.second, unit));
}

ParseResult<std::string> SpiceLexer::comment(const Cursor& input)
{
    char lead = input.peek();
    if (lead != '*' && lead != ';')
        return ParseResult<std::string>::reject(input, "comment");

    Cursor c = input.advance(1);
    std::string text = c.restOfLine();
    size_t length = 0;
    while (length < c.remaining() && c.peek(length) != '\n')
        ++length;
    c = c.advance(length);
    if (c.peek() == '\n')
        c = c.advance(1);
    return ParseResult<std::string>::success(c, Lexer::trim(text));
}

Cursor SpiceLexer::skipLines(const Cursor& input)
{
    Cursor in = Lexer::skipAllSpace(input);
    for (auto note = comment(in); note.ok(); note = comment(in))
        in = Lexer::skipAllSpace(note.rest());
    return in;
}

ParseResult<std::string> SpiceLexer::keyword(const Cursor& input,
                                             const std::string& word)
{
    return token(input, [&word](const Cursor& in) {
        if (in.startsWithNoCase(word))
            return ParseResult<std::string>::success(in.advance(word.size()),
                                                     word);
        return ParseResult<std::string>::reject(in, word);
    });
}

ParseResult<std::string> SpiceLexer::keywordOf(
    const Cursor& input, const std::vector<std::string>& words,
    const std::string& label)
{
    return token(input, [&](const Cursor& in) {
        return Lexer::oneOf(in, words, true, label);
    });
}

ParseResult<std::string> SpiceLexer::identifierToken(const Cursor& input)
{
    return token(input, identifier);
}

ParseResult<std::string> SpiceLexer::nodeToken(const Cursor& input)
{
    return token(input, node);
}

ParseResult<Number> SpiceLexer::numberToken(const Cursor& input)
{
    return token(input, number);
}

ParseResult<unsigned> SpiceLexer::unsignedToken(const Cursor& input)
{
    return token(input, Lexer::unsignedInt);
}

ParseResult<UnitNumber> SpiceLexer::quantityToken(const Cursor& input,
                                                  Unit unit)
{
    return token(input,
                 [unit](const Cursor& in) { return quantity(in, unit); });
}

ParseResult<std::pair<std::string, Number>> SpiceLexer::parameterPair(
    const Cursor& input)
{
    using Pair = std::pair<std::string, Number>;

    auto key = identifierToken(input);
    if (!key.ok())
        return ParseResult<Pair>::propagate(key);
    auto equals = keyword(key.rest(), "=");
    if (!equals.ok())
        return ParseResult<Pair>::propagate(equals);
    auto value = numberToken(equals.rest());
    if (!value.ok())
        return ParseResult<Pair>::propagate(value);
    return ParseResult<Pair>::success(value.rest(),
                                      Pair(key.value(), value.value()));
}
