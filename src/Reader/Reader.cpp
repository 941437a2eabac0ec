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
 * @file Reader.cpp
 * @brief Reader entry point shared by `main` and the tests.
 */

#include <iostream>

#include "LefParser.hpp"
#include "ReaderOptions.hpp"
#include "SpiceParser.hpp"

int runReader(const ReaderOptions& options)
{
    if (options.resolvedFormat() == InputFormat::Lef) {
        LefParser parser;
        int errors = parser.parse(options.inputFile);
        if (errors != 0)
            return 1;
        if (!options.quiet)
            parser.printSummary();
        return 0;
    }

    SpiceParser parser;
    int errors = parser.parse(options.inputFile);
    if (errors != 0)
        return 1;
    if (!options.quiet)
        parser.printSummary();
    if (options.emit)
        std::cout << parser.getDocument().toSpice();
    return 0;
}
