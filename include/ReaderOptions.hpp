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
 * @file ReaderOptions.hpp
 * @brief Command-line options of the `edaparse` reader.
 *
 * `ReaderOptions` carries the settings parsed by `main` to `runReader()`.
 * Fields are public so they can be filled in directly from CLI flags or in
 * tests; `validate()` must be called before the options are used.
 */

#include <iostream>
#include <stdexcept>
#include <string>

#include "Lexer.hpp"

/**
 * @enum InputFormat
 * @brief Grammar used to read the input file.
 */
enum class InputFormat
{
    Auto,  /**< Chosen from the file extension */
    Spice, /**< SPICE netlist */
    Lef    /**< LEF technology file */
};

inline std::ostream& operator<<(std::ostream& os, InputFormat format)
{
    switch (format) {
        case InputFormat::Auto:
            os << "auto";
            break;
        case InputFormat::Spice:
            os << "spice";
            break;
        case InputFormat::Lef:
            os << "lef";
            break;
        default:
            os << "?";
            break;
    }
    return os;
}

/**
 * @struct ReaderOptions
 * @brief What to read and what to print.
 */
struct ReaderOptions
{
    /** @brief Input grammar; `Auto` looks at the extension of `inputFile`. */
    InputFormat format = InputFormat::Auto;

    /** @brief Print the parsed netlist back as SPICE text (SPICE only). */
    bool emit = false;

    /** @brief Suppress the per-kind summary. */
    bool quiet = false;

    /** @brief Path of the file to read. */
    std::string inputFile;

    /**
     * @brief Concrete format for `inputFile`.
     *
     * In `Auto` mode a `.lef` or `.tlef` extension (any case) selects LEF;
     * anything else is read as SPICE.
     */
    InputFormat resolvedFormat() const
    {
        if (format != InputFormat::Auto)
            return format;
        size_t dot = inputFile.find_last_of('.');
        if (dot == std::string::npos)
            return InputFormat::Spice;
        std::string extension = Lexer::upper(inputFile.substr(dot + 1));
        if (extension == "LEF" || extension == "TLEF")
            return InputFormat::Lef;
        return InputFormat::Spice;
    }

    /**
     * @brief Check the option combination.
     *
     * Throws:
     *   - std::invalid_argument if no input file is given
     *   - std::invalid_argument if `emit` is requested for a LEF input
     */
    void validate() const
    {
        if (inputFile.empty())
            throw std::invalid_argument("no input file given");
        if (emit && resolvedFormat() == InputFormat::Lef)
            throw std::invalid_argument("--emit is only supported for SPICE");
    }
};

/**
 * @brief Read `options.inputFile` and print what was requested.
 *
 * @return 0 on success, 1 when the file could not be read or parsed.
 */
int runReader(const ReaderOptions& options);
