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
 * @file ParseResult.hpp
 * @brief Input cursor and three-outcome result type used by every grammar
 *        production.
 *
 * The SPICE and LEF grammars are written as recursive-descent functions that
 * take a `Cursor` (a read position inside the full input text) and return a
 * `ParseResult<T>`. A result is in one of three states:
 *
 *  - **Ok**: the production matched; `value()` holds what it built and
 *    `rest()` is the cursor just past the consumed text.
 *  - **Error**: the production does not apply at this position. Callers that
 *    try several alternatives move on to the next one.
 *  - **Failure**: the production recognized its leading keyword or type
 *    letter (it "committed") and the text after it is malformed. Failures are
 *    passed straight up to the document driver; no other alternative is
 *    tried.
 *
 * Non-Ok results carry a `ParseError`: the list of context labels collected
 * while the failure travelled outwards, innermost first, each with the input
 * offset where it was recorded. The drivers turn the first offset into a line
 * number and render the whole list as a diagnostic trace.
 *
 * Example:
 * @code
 * auto value = commit(SpiceLexer::quantityToken(in, Unit::Ohm), in, "value");
 * if (!value.ok())
 *     return ParseResult<ComponentPtr>::propagate(value);
 * in = value.rest();
 * @endcode
 */

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

/**
 * @class Cursor
 * @brief Read position inside an input text that outlives all cursors on it.
 */
class Cursor
{
   public:
    Cursor() = default;
    explicit Cursor(const std::string& text, size_t offset = 0)
        : input(&text), pos(offset)
    {
    }

    /** @brief Byte offset from the start of the full input. */
    size_t offset() const { return pos; }

    /** @brief The full input text this cursor points into. */
    const std::string& text() const;

    bool atEnd() const { return input == nullptr || pos >= input->size(); }
    size_t remaining() const { return atEnd() ? 0 : input->size() - pos; }

    /** @brief Character `ahead` positions from here, or '\0' past the end. */
    char peek(size_t ahead = 0) const;

    /** @brief A cursor `count` characters further on (clamped to the end). */
    Cursor advance(size_t count) const;

    /** @brief Everything from here to the end of the input. */
    std::string rest() const;

    /** @brief The next `count` characters (fewer near the end). */
    std::string take(size_t count) const;

    /** @brief Remainder of the current physical line (without the newline). */
    std::string restOfLine() const;

    /** @brief True when the remaining text starts with `prefix` exactly. */
    bool startsWith(const std::string& prefix) const;

    /** @brief ASCII case-insensitive variant of `startsWith()`. */
    bool startsWithNoCase(const std::string& prefix) const;

    /** @brief 1-based line number: one plus the newlines before `offset()`. */
    int line() const;

    /** @brief 1-based column within the current line. */
    size_t column() const;

    /** @brief Text of the physical line containing this position. */
    std::string lineText() const;

   private:
    const std::string* input = nullptr;
    size_t pos = 0;
};

/**
 * @enum ParseStatus
 * @brief Outcome of a grammar production.
 */
enum class ParseStatus
{
    Ok,      /**< Matched */
    Error,   /**< Did not apply; try the next alternative */
    Failure  /**< Committed and malformed; stop parsing */
};

/**
 * @struct ParseErrorEntry
 * @brief One breadcrumb of a parse error.
 */
struct ParseErrorEntry
{
    size_t offset;     /**< Input offset where the label was recorded */
    std::string label; /**< Human-readable context label */
};

/**
 * @class ParseError
 * @brief Context labels gathered while an Error or Failure propagated.
 */
class ParseError
{
   public:
    void add(const Cursor& at, const std::string& label)
    {
        entries.push_back({at.offset(), label});
    }

    bool empty() const { return entries.empty(); }
    const std::vector<ParseErrorEntry>& getEntries() const { return entries; }

    /** @brief Offset of the innermost entry (0 when empty). */
    size_t firstOffset() const
    {
        return entries.empty() ? 0 : entries.front().offset;
    }

    /**
     * @brief Render the trace against the full input text.
     *
     * One block per entry, innermost first:
     * @code
     * 0: at line 2, in float:
     * R1 in out _
     *           ^
     * @endcode
     */
    std::string render(const std::string& input) const;

   private:
    std::vector<ParseErrorEntry> entries;
};

/**
 * @class ParseResult
 * @brief Success value or recoverable/fatal error of a grammar production.
 *
 * @tparam T Value built by the production. Must be default constructible.
 */
template <typename T>
class ParseResult
{
   public:
    /** @brief Matched; the input continues at `rest`. */
    static ParseResult success(const Cursor& rest, T value)
    {
        ParseResult result(ParseStatus::Ok);
        result.remaining = rest;
        result.val = std::move(value);
        return result;
    }

    /** @brief Recoverable mismatch at `at`. */
    static ParseResult reject(const Cursor& at, const std::string& label)
    {
        ParseResult result(ParseStatus::Error);
        result.remaining = at;
        result.err.add(at, label);
        return result;
    }

    /** @brief Fatal failure at `at`. */
    static ParseResult fail(const Cursor& at, const std::string& label)
    {
        ParseResult result(ParseStatus::Failure);
        result.remaining = at;
        result.err.add(at, label);
        return result;
    }

    /** @brief Re-type a non-Ok result of another production. */
    template <typename U>
    static ParseResult propagate(const ParseResult<U>& other)
    {
        ParseResult result(other.getStatus());
        result.remaining = other.rest();
        result.err = other.getError();
        return result;
    }

    bool ok() const { return status == ParseStatus::Ok; }
    bool isError() const { return status == ParseStatus::Error; }
    bool isFailure() const { return status == ParseStatus::Failure; }
    ParseStatus getStatus() const { return status; }

    const Cursor& rest() const { return remaining; }
    void setRest(const Cursor& rest) { remaining = rest; }

    T& value() { return val; }
    const T& value() const { return val; }

    const ParseError& getError() const { return err; }

    /** @brief Record a breadcrumb on a non-Ok result. */
    void addContext(const Cursor& at, const std::string& label)
    {
        err.add(at, label);
    }

    /** @brief Turn a recoverable Error into a Failure. */
    void promote()
    {
        if (status == ParseStatus::Error)
            status = ParseStatus::Failure;
    }

   private:
    explicit ParseResult(ParseStatus status) : status(status) {}

    ParseStatus status;
    Cursor remaining;
    T val{};
    ParseError err;
};

/**
 * @brief Label a non-Ok result without changing its status.
 *
 * Used for productions that have not committed yet: the label shows up in the
 * trace but alternation still sees a plain Error.
 */
template <typename T>
ParseResult<T> context(ParseResult<T> result, const Cursor& at,
                       const std::string& label)
{
    if (!result.ok())
        result.addContext(at, label);
    return result;
}

/**
 * @brief Promote an Error to a Failure and label it.
 *
 * Wraps every step a production takes after it has committed, so a mismatch
 * there stops parsing instead of letting the caller try another alternative.
 */
template <typename T>
ParseResult<T> commit(ParseResult<T> result, const Cursor& at,
                      const std::string& label)
{
    if (!result.ok()) {
        result.promote();
        result.addContext(at, label);
    }
    return result;
}
