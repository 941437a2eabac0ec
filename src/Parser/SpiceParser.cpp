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
 * @file SpiceParser.cpp
 * @brief Netlist statement dispatch and the document driver loop.
 *
 * Implementation notes:
 *  - The file is read whole into memory. Every cursor points into that one
 *    string, so line numbers and the context trace can be computed from
 *    offsets after a failure.
 *  - `.END` is only recognized as a whole word; `.ENDS` at top level is an
 *    unknown statement.
 */

#include "SpiceParser.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "Lexer.hpp"

namespace {
void assign(SpiceStatement& statement, const ComponentPtr& value)
{
    statement.component = value;
}
void assign(SpiceStatement& statement, const SourcePtr& value)
{
    statement.source = value;
}
void assign(SpiceStatement& statement, const SimCommandPtr& value)
{
    statement.simulation = value;
}
void assign(SpiceStatement& statement, const MeasureCommandPtr& value)
{
    statement.measure = value;
}
void assign(SpiceStatement& statement, const InstancePtr& value)
{
    statement.instance = value;
}
void assign(SpiceStatement& statement, const SubcktPtr& value)
{
    statement.subckt = value;
}
void assign(SpiceStatement& statement, const ModelPtr& value)
{
    statement.model = value;
}

template <typename T>
ParseResult<SpiceStatement> toStatement(const ParseResult<T>& result,
                                        StatementType type)
{
    if (!result.ok())
        return ParseResult<SpiceStatement>::propagate(result);
    SpiceStatement statement;
    statement.type = type;
    assign(statement, result.value());
    return ParseResult<SpiceStatement>::success(result.rest(), statement);
}

/** Text from the cursor to the end of its line, trimmed. */
ParseResult<std::string> lineArgument(const Cursor& input,
                                      const std::string& label)
{
    std::string text = input.restOfLine();
    std::string argument = Lexer::trim(text);
    if (argument.empty())
        return ParseResult<std::string>::reject(input, label);
    return ParseResult<std::string>::success(input.advance(text.size()),
                                             argument);
}

ParseResult<SpiceStatement> parseTitle(const Cursor& input)
{
    auto keyword = SpiceLexer::keyword(input, ".TITLE");
    if (!keyword.ok())
        return ParseResult<SpiceStatement>::propagate(keyword);

    auto text = commit(lineArgument(keyword.rest(), "title"), keyword.rest(),
                       "title");
    if (!text.ok())
        return ParseResult<SpiceStatement>::propagate(text);

    SpiceStatement statement;
    statement.type = StatementType::Title;
    statement.text = text.value();
    return ParseResult<SpiceStatement>::success(text.rest(), statement);
}

ParseResult<SpiceStatement> parseInclude(const Cursor& input)
{
    auto keyword =
        SpiceLexer::keywordOf(input, {".INCLUDE", ".INC"}, ".INCLUDE");
    if (!keyword.ok())
        return ParseResult<SpiceStatement>::propagate(keyword);

    auto path = commit(lineArgument(keyword.rest(), "path"), keyword.rest(),
                       "include_path");
    if (!path.ok())
        return ParseResult<SpiceStatement>::propagate(path);

    SpiceStatement statement;
    statement.type = StatementType::Include;
    statement.text = path.value();
    if (statement.text.size() >= 2 && statement.text.front() == '"' &&
        statement.text.back() == '"')
        statement.text = statement.text.substr(1, statement.text.size() - 2);
    return ParseResult<SpiceStatement>::success(path.rest(), statement);
}

bool isEndStatement(const Cursor& input)
{
    if (!input.startsWithNoCase(".END"))
        return false;
    char next = input.peek(4);
    return next == '\0' || next == '\n' || Lexer::isBlank(next);
}

void store(SpiceDocument& document, const SpiceStatement& statement)
{
    switch (statement.type) {
        case StatementType::Component:
            document.components.push_back(statement.component);
            break;
        case StatementType::Source:
            document.sources.push_back(statement.source);
            break;
        case StatementType::Simulation:
            document.simulations.push_back(statement.simulation);
            break;
        case StatementType::Measure:
            document.measures.push_back(statement.measure);
            break;
        case StatementType::Instance:
            document.instances.push_back(statement.instance);
            break;
        case StatementType::Subckt:
            document.subckts.push_back(statement.subckt);
            break;
        case StatementType::Model:
            document.models.push_back(statement.model);
            break;
        case StatementType::Title:
            document.title = statement.text;
            break;
        case StatementType::Include:
            document.includes.push_back(statement.text);
            break;
        default:
            break;
    }
}
}  // namespace

ParseResult<SpiceStatement> SpiceParser::parseStatement(const Cursor& input)
{
    auto component = Component::parse(input);
    if (!component.isError())
        return toStatement(component, StatementType::Component);

    auto source = Source::parse(input);
    if (!source.isError())
        return toStatement(source, StatementType::Source);

    auto simulation = SimCommand::parse(input);
    if (!simulation.isError())
        return toStatement(simulation, StatementType::Simulation);

    auto measure = MeasureCommand::parse(input);
    if (!measure.isError())
        return toStatement(measure, StatementType::Measure);

    auto instance = Instance::parse(input);
    if (!instance.isError())
        return toStatement(instance, StatementType::Instance);

    auto subckt = Subckt::parse(input);
    if (!subckt.isError())
        return toStatement(subckt, StatementType::Subckt);

    auto model = Model::parse(input);
    if (!model.isError())
        return toStatement(model, StatementType::Model);

    auto title = parseTitle(input);
    if (!title.isError())
        return title;

    auto include = parseInclude(input);
    if (!include.isError())
        return include;

    return ParseResult<SpiceStatement>::reject(input, "statement");
}

int SpiceParser::parse(const std::string& file)
{
    std::ifstream fileStream(file);
    if (!fileStream)
        return report("Error: Unable to open netlist file '" + file + "'");

    std::stringstream buffer;
    buffer << fileStream.rdbuf();
    return parseString(buffer.str());
}

int SpiceParser::parseString(const std::string& text)
{
    document = SpiceDocument();
    lastError.clear();

    SpiceDocument parsed;
    Cursor in(text);
    while (true) {
        in = SpiceLexer::skipLines(in);
        if (in.atEnd() || isEndStatement(in))
            break;

        auto statement = parseStatement(in);
        if (statement.isFailure()) {
            const ParseError& error = statement.getError();
            Cursor at(text, error.firstOffset());
            return report("Error at line " + std::to_string(at.line()) +
                          ":\n" + error.render(text));
        }
        if (statement.isError())
            return report("At line " + std::to_string(in.line()) +
                          ": Unknown statement: " +
                          Lexer::trim(in.restOfLine()));

        store(parsed, statement.value());
        in = statement.rest();
    }

    document = parsed;
    return 0;
}

int SpiceParser::report(const std::string& message)
{
    document = SpiceDocument();
    lastError = message;
    std::cerr << message << std::endl;
    return 1;
}

void SpiceParser::printSummary() const
{
    int resistors = 0, capacitors = 0, inductors = 0;
    int diodes = 0, bjts = 0, mosfets = 0;
    for (const auto& component : document.components) {
        switch (component->getType()) {
            case ComponentType::Resistor:
                ++resistors;
                break;
            case ComponentType::Capacitor:
                ++capacitors;
                break;
            case ComponentType::Inductor:
                ++inductors;
                break;
            case ComponentType::Diode:
                ++diodes;
                break;
            case ComponentType::Bjt:
                ++bjts;
                break;
            case ComponentType::Mosfet:
                ++mosfets;
                break;
            default:
                break;
        }
    }

    int voltageSources = 0, currentSources = 0;
    for (const auto& source : document.sources) {
        if (source->getKind() == SourceKind::Voltage)
            ++voltageSources;
        else
            ++currentSources;
    }

    if (!document.title.empty())
        std::cout << "Title: " << document.title << std::endl;
    std::cout << "Total Resistors: " << resistors << std::endl;
    std::cout << "Total Capacitors: " << capacitors << std::endl;
    std::cout << "Total Inductors: " << inductors << std::endl;
    std::cout << "Total Diodes: " << diodes << std::endl;
    std::cout << "Total BJTs: " << bjts << std::endl;
    std::cout << "Total MOSFETs: " << mosfets << std::endl;
    std::cout << "Total Voltage Sources: " << voltageSources << std::endl;
    std::cout << "Total Current Sources: " << currentSources << std::endl;
    std::cout << "Total Subcircuits: " << document.subckts.size()
              << std::endl;
    std::cout << "Total Instances: " << document.instances.size()
              << std::endl;
    std::cout << "Total Models: " << document.models.size() << std::endl;
    std::cout << "Total Analyses: " << document.simulations.size()
              << std::endl;
    std::cout << "Total Measures: " << document.measures.size() << std::endl;
}
