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
 * @file LefLexer.cpp
 * @brief LEF lexical layer: free-form whitespace, names and quoted strings.
 */

#include <string>
#include <vector>

#include "Lexer.hpp"

Cursor LefLexer::skipSpace(const Cursor& input)
{
    Cursor c = input;
    while (!c.atEnd()) {
        char ch = c.peek();
        if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n') {
            c = c.advance(1);
        } else if (ch == '#') {
            while (!c.atEnd() && c.peek() != '\n')
                c = c.advance(1);
        } else {
            break;
        }
    }
    return c;
}

ParseResult<std::string> LefLexer::identifier(const Cursor& input)
{
    return token(input, [](const Cursor& in) {
        char first = in.peek();
        if (!(Lexer::isAlpha(first) || first == '_'))
            return ParseResult<std::string>::reject(in, "identifier");
        size_t i = 1;
        for (char c = in.peek(i);
             Lexer::isAlpha(c) || Lexer::isDigit(c) || c == '_';
             c = in.peek(i))
            ++i;
        return ParseResult<std::string>::success(in.advance(i), in.take(i));
    });
}

ParseResult<std::string> LefLexer::keyword(const Cursor& input,
                                           const std::string& word)
{
    return token(input, [&word](const Cursor& in) {
        if (in.startsWith(word))
            return ParseResult<std::string>::success(in.advance(word.size()),
                                                     word);
        return ParseResult<std::string>::reject(in, word);
    });
}

ParseResult<std::string> LefLexer::keywordOf(
    const Cursor& input, const std::vector<std::string>& words,
    const std::string& label)
{
    return token(input, [&](const Cursor& in) {
        return Lexer::oneOf(in, words, false, label);
    });
}

ParseResult<double> LefLexer::number(const Cursor& input)
{
    return token(input, [](const Cursor& in) {
        return Lexer::floatLiteral(in, true);
    });
}

ParseResult<unsigned> LefLexer::unsignedInt(const Cursor& input)
{
    return token(input, Lexer::unsignedInt);
}

ParseResult<std::string> LefLexer::quotedString(const Cursor& input)
{
    return token(input, [](const Cursor& in) {
        if (in.peek() != '"')
            return ParseResult<std::string>::reject(in, "quoted string");
        size_t i = 1;
        while (i < in.remaining() && in.peek(i) != '"')
            ++i;
        if (i >= in.remaining())
            return ParseResult<std::string>::reject(in, "closing quote");
        return ParseResult<std::string>::success(in.advance(i + 1),
                                                 in.advance(1).take(i - 1));
    });
}

ParseResult<double> LefLexer::valueStatement(const Cursor& input,
                                             const std::string& word)
{
    auto key = keyword(input, word);
    if (!key.ok())
        return ParseResult<double>::propagate(key);
    Cursor in = key.rest();

    auto value = commit(number(in), in, word);
    if (!value.ok())
        return value;
    in = value.rest();

    auto end = commit(keyword(in, ";"), in, ";");
    if (!end.ok())
        return ParseResult<double>::propagate(end);
    return ParseResult<double>::success(end.rest(), value.value());
}
