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
 * @file Component.hpp
 * @brief Base class of the SPICE device lines (R, C, L, D, Q, M).
 *
 * A component line starts with a designator whose first letter selects the
 * device kind, e.g. `R1`, `cload`, `Mpull`. The letter is matched
 * case-insensitively and stripped; the rest of the designator is the
 * component name (`R1` is stored as `1`).
 *
 * Parsing follows the commit rule used throughout the grammar: a line whose
 * first letter belongs to another kind is a plain mismatch, so
 * `Component::parse()` can try the next kind; once the letter matches, every
 * node and value after it is mandatory and a problem there is fatal.
 *
 * Example usage:
 * @code
 * std::string line = "R1 in out 10k";
 * auto result = Component::parse(Cursor(line));
 * if (result.ok()) {
 *     auto r = std::dynamic_pointer_cast<Resistor>(result.value());
 *     double ohms = r->getResistance().toDouble();  // 10000
 * }
 * @endcode
 */

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "Number.hpp"
#include "ParseResult.hpp"

/**
 * @enum ComponentType
 * @brief Device kinds recognized on component lines.
 */
enum class ComponentType
{
    Resistor,  /**< R */
    Capacitor, /**< C */
    Inductor,  /**< L */
    Diode,     /**< D */
    Bjt,       /**< Q */
    Mosfet     /**< M */
};

inline std::ostream& operator<<(std::ostream& os, ComponentType type)
{
    switch (type) {
        case ComponentType::Resistor:
            os << "Resistor";
            break;
        case ComponentType::Capacitor:
            os << "Capacitor";
            break;
        case ComponentType::Inductor:
            os << "Inductor";
            break;
        case ComponentType::Diode:
            os << "Diode";
            break;
        case ComponentType::Bjt:
            os << "BJT";
            break;
        case ComponentType::Mosfet:
            os << "MOSFET";
            break;
        default:
            os << "UnknownComponentType";
            break;
    }
    return os;
}

class Component;
using ComponentPtr = std::shared_ptr<Component>;

/**
 * @class Component
 * @brief Common part of every device line: name, kind and terminals.
 */
class Component
{
   public:
    Component(const std::string& name, ComponentType type)
        : name(name), type(type)
    {
    }
    virtual ~Component() = default;

    /** @brief Designator without its type letter. */
    const std::string& getName() const { return name; }
    ComponentType getType() const { return type; }

    /** @brief Terminal node names in netlist order. */
    virtual std::vector<std::string> getNodes() const = 0;

    /** @brief The component as one SPICE line (no trailing newline). */
    virtual std::string toSpice() const = 0;

    /**
     * @brief Parse any component line.
     *
     * Tries resistor, capacitor, inductor, diode, BJT and MOSFET in that
     * order. Returns the first match, the first Failure, or an Error when no
     * kind applies.
     */
    static ParseResult<ComponentPtr> parse(const Cursor& input);

   protected:
    /**
     * @brief Read a designator and check its type letter.
     *
     * @param input Read position (leading blanks allowed).
     * @param letter Expected uppercase type letter.
     * @return The name with the letter stripped. Error when the identifier is
     *         missing or starts with another letter; Failure when nothing
     *         follows the letter.
     */
    static ParseResult<std::string> parseDesignator(const Cursor& input,
                                                    char letter);

    /**
     * @struct TwoTerminal
     * @brief Fields shared by R, C and L lines.
     */
    struct TwoTerminal
    {
        std::string name;
        std::string nodePos;
        std::string nodeNeg;
        UnitNumber value;
    };

    /**
     * @brief `<letter>name node node value` with the value read as `unit`.
     */
    static ParseResult<TwoTerminal> parseTwoTerminal(const Cursor& input,
                                                     char letter, Unit unit);

    std::string name;
    ComponentType type;
};
