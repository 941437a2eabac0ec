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
 * @file SpiceParser.hpp
 * @brief Document-level driver for SPICE netlists.
 *
 * The driver reads statements one after another until the input is
 * exhausted or a `.END` line is reached. Blank lines and `*`/`;` comment
 * lines between statements are skipped. Each statement is handed to
 * `parseStatement()`, which tries every statement production in a fixed
 * order.
 *
 * Parsing stops at the first problem:
 *  - a committed (fatal) failure is reported with its line number and the
 *    full context trace;
 *  - a line no production accepts is reported as an unknown statement.
 *
 * In both cases the document is left empty and the message is stored for
 * `getLastError()` as well as printed to `std::cerr`.
 *
 * Example usage:
 * @code
 * SpiceParser parser;
 * if (parser.parse("inverter.sp") == 0) {
 *     const SpiceDocument& netlist = parser.getDocument();
 *     std::cout << netlist.toSpice();
 * }
 * @endcode
 */

#include <iostream>
#include <string>

#include "ParseResult.hpp"
#include "SpiceDocument.hpp"

/**
 * @enum StatementType
 * @brief Which kind of statement `parseStatement()` recognized.
 */
enum class StatementType
{
    Component,
    Source,
    Simulation,
    Measure,
    Instance,
    Subckt,
    Model,
    Title,
    Include
};

inline std::ostream& operator<<(std::ostream& os, StatementType type)
{
    switch (type) {
        case StatementType::Component:
            os << "Component";
            break;
        case StatementType::Source:
            os << "Source";
            break;
        case StatementType::Simulation:
            os << "Simulation";
            break;
        case StatementType::Measure:
            os << "Measure";
            break;
        case StatementType::Instance:
            os << "Instance";
            break;
        case StatementType::Subckt:
            os << "Subckt";
            break;
        case StatementType::Model:
            os << "Model";
            break;
        case StatementType::Title:
            os << "Title";
            break;
        case StatementType::Include:
            os << "Include";
            break;
        default:
            os << "UnknownStatement";
            break;
    }
    return os;
}

/**
 * @struct SpiceStatement
 * @brief One parsed top-level statement.
 *
 * Only the member matching `type` is set. `text` holds the title or include
 * path.
 */
struct SpiceStatement
{
    StatementType type = StatementType::Component;
    ComponentPtr component;
    SourcePtr source;
    SimCommandPtr simulation;
    MeasureCommandPtr measure;
    InstancePtr instance;
    SubcktPtr subckt;
    ModelPtr model;
    std::string text;
};

/**
 * @class SpiceParser
 * @brief Reads a netlist into a `SpiceDocument`.
 */
class SpiceParser
{
   public:
    /**
     * @brief Parse the netlist stored in `file`.
     *
     * @return Number of errors (0 on success, 1 when the file cannot be
     *         opened or parsing stopped).
     */
    int parse(const std::string& file);

    /** @brief Parse netlist text held in memory. Same result as `parse()`. */
    int parseString(const std::string& text);

    /**
     * @brief Parse one top-level statement at `input`.
     *
     * Productions are tried in the order component, source, analysis,
     * measure, instance, subckt, model, `.TITLE`, `.INCLUDE`. The first one
     * that does not return a plain Error decides the result.
     */
    static ParseResult<SpiceStatement> parseStatement(const Cursor& input);

    /** @brief Document built by the last successful parse. */
    const SpiceDocument& getDocument() const { return document; }

    /** @brief Message of the last failed parse, empty after a success. */
    const std::string& getLastError() const { return lastError; }

    /** @brief Print statement counts of the current document. */
    void printSummary() const;

   private:
    /** @brief Store and print `message`, drop the document. */
    int report(const std::string& message);

    SpiceDocument document;
    std::string lastError;
};
