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
#pragma once

/**
 * @file Lexer.hpp
 * @brief Lexical primitives of the SPICE and LEF grammars.
 *
 * Every primitive takes a `Cursor`, consumes a prefix of the remaining input
 * and returns the recognized value with the cursor after it, or a plain
 * `Error` when the text does not start with what it looks for. Primitives
 * never fail fatally; the productions calling them decide that with
 * `commit()`.
 *
 * The two languages differ in how they treat whitespace:
 *  - LEF is free-form. `LefLexer::skipSpace()` skips spaces, tabs, CR, LF and
 *    `#` comments.
 *  - SPICE is line oriented. `SpiceLexer::skipSpace()` skips spaces, tabs and
 *    CR but stops at a newline, which ends the statement, unless the next
 *    line starts with `+`. A `\n+` and the blanks after it are skipped as a
 *    line continuation.
 *
 * The `...Token()` helpers wrap a primitive with the language's skipper on
 * both sides.
 */

#include <string>
#include <utility>
#include <vector>

#include "Number.hpp"
#include "ParseResult.hpp"

/**
 * @class Lexer
 * @brief Primitives shared by both languages.
 */
class Lexer
{
   public:
    /**
     * @brief Decimal literal: `-?digits(.digits?)?(e[+-]?digits)?`.
     *
     * A leading `.` is not accepted. The exponent is only consumed when a
     * digit follows it, so `1e` reads as `1` followed by `e`.
     *
     * @param input Read position.
     * @param allowUnderscores Accept `_` after a digit as a separator
     *        (`1_000` is 1000). Only LEF enables this.
     */
    static ParseResult<double> floatLiteral(const Cursor& input,
                                            bool allowUnderscores);

    /** @brief Digit run parsed as a 32-bit unsigned value; Error on overflow. */
    static ParseResult<unsigned> unsignedInt(const Cursor& input);

    /**
     * @brief Match one of `choices` (tried in order) at the cursor.
     *
     * @return The choice that matched, as written in `choices`.
     */
    static ParseResult<std::string> oneOf(const Cursor& input,
                                          const std::vector<std::string>& choices,
                                          bool ignoreCase,
                                          const std::string& label);

    static bool isDigit(char c) { return c >= '0' && c <= '9'; }
    static bool isAlpha(char c)
    {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }
    static bool isBlank(char c) { return c == ' ' || c == '\t' || c == '\r'; }

    /** @brief ASCII uppercase copy of `text`. */
    static std::string upper(const std::string& text);

    /** @brief `text` without leading and trailing whitespace. */
    static std::string trim(const std::string& text);

    /** @brief Skip any run of whitespace, newlines included. */
    static Cursor skipAllSpace(const Cursor& input);
};

/**
 * @class SpiceLexer
 * @brief SPICE primitives: line-aware skipper, names, scaled numbers.
 */
class SpiceLexer
{
   public:
    /** @brief Skip blanks and `\n+` continuations; stop at a bare newline. */
    static Cursor skipSpace(const Cursor& input);

    /** @brief `[A-Za-z_][A-Za-z0-9_.]*` */
    static ParseResult<std::string> identifier(const Cursor& input);

    /** @brief `[A-Za-z0-9_.]+` (may start with a digit, e.g. ground `0`). */
    static ParseResult<std::string> node(const Cursor& input);

    /** @brief Decimal literal followed by an optional generic scale suffix. */
    static ParseResult<Number> number(const Cursor& input);

    /**
     * @brief Decimal literal followed by a suffix from the quantity's table.
     *
     * For a quantity with unit letter `v` the table is tried in the order
     * `gv megv kv mv uv nv pv g meg k m u n p v`, so longer suffixes always
     * win over their prefixes (`1.5meg` is mega, not milli followed by
     * `eg`). Matching is case-insensitive.
     */
    static ParseResult<UnitNumber> quantity(const Cursor& input, Unit unit);

    /**
     * @brief `*` or `;` comment running to the end of the line.
     *
     * Consumes the line ending too. The value is the trimmed comment text.
     */
    static ParseResult<std::string> comment(const Cursor& input);

    /** @brief Skip blank lines and whole-line comments between statements. */
    static Cursor skipLines(const Cursor& input);

    /** @brief Apply `parser` between two `skipSpace()` calls. */
    template <typename Fn>
    static auto token(const Cursor& input, Fn parser)
        -> decltype(parser(input))
    {
        auto result = parser(skipSpace(input));
        if (result.ok())
            result.setRest(skipSpace(result.rest()));
        return result;
    }

    /** @brief Case-insensitive keyword, e.g. `.TRAN`, `DC=`, `SIN`. */
    static ParseResult<std::string> keyword(const Cursor& input,
                                            const std::string& word);

    /** @brief First matching case-insensitive keyword of `words`. */
    static ParseResult<std::string> keywordOf(
        const Cursor& input, const std::vector<std::string>& words,
        const std::string& label);

    static ParseResult<std::string> identifierToken(const Cursor& input);
    static ParseResult<std::string> nodeToken(const Cursor& input);
    static ParseResult<Number> numberToken(const Cursor& input);
    static ParseResult<unsigned> unsignedToken(const Cursor& input);
    static ParseResult<UnitNumber> quantityToken(const Cursor& input,
                                                 Unit unit);

    /**
     * @brief `key = number` parameter pair used by `.MODEL` and MOSFET lines.
     */
    static ParseResult<std::pair<std::string, Number>> parameterPair(
        const Cursor& input);

    /** @brief Ordered suffix table used by `quantity()` for `unit`. */
    static const std::vector<std::pair<std::string, Suffix>>& suffixTable(
        Unit unit);
};

/**
 * @class LefLexer
 * @brief LEF primitives: free-form skipper, names, quoted strings.
 *
 * LEF keywords are case-sensitive.
 */
class LefLexer
{
   public:
    /** @brief Skip whitespace (newlines included) and `#` comments. */
    static Cursor skipSpace(const Cursor& input);

    /** @brief Apply `parser` between two `skipSpace()` calls. */
    template <typename Fn>
    static auto token(const Cursor& input, Fn parser)
        -> decltype(parser(input))
    {
        auto result = parser(skipSpace(input));
        if (result.ok())
            result.setRest(skipSpace(result.rest()));
        return result;
    }

    /** @brief `[A-Za-z_][A-Za-z0-9_]*` surrounded by whitespace. */
    static ParseResult<std::string> identifier(const Cursor& input);

    /** @brief Exact keyword or punctuation, e.g. `LAYER`, `;`. */
    static ParseResult<std::string> keyword(const Cursor& input,
                                            const std::string& word);

    /** @brief First matching keyword of `words`. */
    static ParseResult<std::string> keywordOf(
        const Cursor& input, const std::vector<std::string>& words,
        const std::string& label);

    /** @brief Decimal literal, `_` separators allowed. */
    static ParseResult<double> number(const Cursor& input);

    static ParseResult<unsigned> unsignedInt(const Cursor& input);

    /** @brief `"..."`; the first `"` after the opener closes the string. */
    static ParseResult<std::string> quotedString(const Cursor& input);

    /**
     * @brief `<word> <number> ;` statement such as `WIDTH 0.1 ;`.
     *
     * Error when `word` is absent; fatal once it has been read.
     */
    static ParseResult<double> valueStatement(const Cursor& input,
                                              const std::string& word);
};
