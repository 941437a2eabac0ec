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
 * @file LefParser.cpp
 * @brief LEF file reading and diagnostics.
 */

#include "LefParser.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "Lexer.hpp"

int LefParser::parse(const std::string& file)
{
    std::ifstream fileStream(file);
    if (!fileStream)
        return report("Error: Unable to open LEF file '" + file + "'");

    std::stringstream buffer;
    buffer << fileStream.rdbuf();
    return parseString(buffer.str());
}

int LefParser::parseString(const std::string& text)
{
    library = LefTechLibrary();
    lastError.clear();

    Cursor start(text);
    auto parsed = LefTechLibrary::parse(LefLexer::skipSpace(start));
    if (!parsed.ok()) {
        // The header has no optional alternatives, so a plain Error is as
        // final as a Failure here.
        const ParseError& error = parsed.getError();
        Cursor at(text, error.firstOffset());
        return report("Error at line " + std::to_string(at.line()) + ":\n" +
                      error.render(text));
    }

    Cursor rest = LefLexer::skipSpace(parsed.rest());
    if (!rest.atEnd())
        return report("At line " + std::to_string(rest.line()) +
                      ": Unexpected content: " +
                      Lexer::trim(rest.restOfLine()));

    library = parsed.value();
    return 0;
}

int LefParser::report(const std::string& message)
{
    library = LefTechLibrary();
    lastError = message;
    std::cerr << message << std::endl;
    return 1;
}

void LefParser::printSummary() const
{
    int cut = 0, implant = 0, routing = 0, special = 0;
    for (const auto& layer : library.layers) {
        switch (layer->getKind()) {
            case LefLayerKind::Cut:
                ++cut;
                break;
            case LefLayerKind::Implant:
                ++implant;
                break;
            case LefLayerKind::Routing:
                ++routing;
                break;
            case LefLayerKind::Special:
                ++special;
                break;
            default:
                break;
        }
    }

    std::cout << "LEF Version: " << library.version << std::endl;
    if (library.units.databaseMicrons)
        std::cout << "Database Units: " << *library.units.databaseMicrons
                  << " per micron" << std::endl;
    std::cout << "Total Layers: " << library.layers.size() << std::endl;
    std::cout << "Total Routing Layers: " << routing << std::endl;
    std::cout << "Total Cut Layers: " << cut << std::endl;
    std::cout << "Total Implant Layers: " << implant << std::endl;
    std::cout << "Total Masterslice/Overlap Layers: " << special << std::endl;
}
