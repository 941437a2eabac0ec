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
 * @file LefParser.hpp
 * @brief Document-level driver for LEF technology files.
 *
 * Reads the whole file, parses it with `LefTechLibrary::parse()` and checks
 * that nothing but whitespace and comments follows the library. Errors are
 * stored for `getLastError()` and printed to `std::cerr`; the library is
 * left empty after a failure.
 */

#include <string>

#include "LefTechLibrary.hpp"

class LefParser
{
   public:
    /** @return 0 on success, 1 when the file cannot be read or parsed. */
    int parse(const std::string& file);

    /** @brief Parse LEF text held in memory. Same result as `parse()`. */
    int parseString(const std::string& text);

    const LefTechLibrary& getLibrary() const { return library; }
    const std::string& getLastError() const { return lastError; }

    /** @brief Print version, database units and layer counts per kind. */
    void printSummary() const;

   private:
    int report(const std::string& message);

    LefTechLibrary library;
    std::string lastError;
};
