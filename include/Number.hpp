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
 * @file Number.hpp
 * @brief Scale-suffixed numeric values shared by the SPICE and LEF grammars.
 *
 * Every numeric literal in a netlist is kept as the magnitude that was written
 * plus the scale suffix that followed it, so `1.5k` stays `{1.5, Kilo}` and
 * can be printed back exactly as read. `toDouble()` applies the scale when a
 * caller needs the value in base units.
 *
 * `UnitNumber` attaches the physical quantity the grammar expected at that
 * position (volts for a DC value, seconds for a `.TRAN` step, ...). The unit is
 * not used for conversion; it only records what the number means.
 */

#include <iostream>
#include <string>

/**
 * @enum Suffix
 * @brief Decimal scale written after a numeric literal.
 */
enum class Suffix
{
    None,  /**< No scale (x1) */
    Mega,  /**< `meg` (and `g`) : x1e6 */
    Kilo,  /**< `k` : x1e3 */
    Milli, /**< `m` : x1e-3 */
    Micro, /**< `u` : x1e-6 */
    Nano,  /**< `n` : x1e-9 */
    Pico   /**< `p` : x1e-12 */
};

inline std::ostream& operator<<(std::ostream& os, Suffix suffix)
{
    switch (suffix) {
        case Suffix::None:
            break;
        case Suffix::Mega:
            os << "Meg";
            break;
        case Suffix::Kilo:
            os << "k";
            break;
        case Suffix::Milli:
            os << "m";
            break;
        case Suffix::Micro:
            os << "u";
            break;
        case Suffix::Nano:
            os << "n";
            break;
        case Suffix::Pico:
            os << "p";
            break;
        default:
            os << "?";
            break;
    }
    return os;
}

/** @brief Multiplier a suffix stands for. */
double suffixScale(Suffix suffix);

/**
 * @enum Unit
 * @brief Physical quantity a `UnitNumber` was parsed as.
 */
enum class Unit
{
    None,   /**< Dimensionless */
    Volt,   /**< Voltage */
    Ampere, /**< Current */
    Ohm,    /**< Resistance */
    Farad,  /**< Capacitance */
    Henry,  /**< Inductance */
    Second, /**< Time */
    Hertz,  /**< Frequency */
    Degree, /**< Angle */
    Meter   /**< Length (MOSFET geometry) */
};

inline std::ostream& operator<<(std::ostream& os, Unit unit)
{
    switch (unit) {
        case Unit::None:
            break;
        case Unit::Volt:
            os << "V";
            break;
        case Unit::Ampere:
            os << "A";
            break;
        case Unit::Ohm:
            os << "Ohm";
            break;
        case Unit::Farad:
            os << "F";
            break;
        case Unit::Henry:
            os << "H";
            break;
        case Unit::Second:
            os << "s";
            break;
        case Unit::Hertz:
            os << "Hz";
            break;
        case Unit::Degree:
            os << "deg";
            break;
        case Unit::Meter:
            os << "m";
            break;
        default:
            os << "?";
            break;
    }
    return os;
}

/**
 * @class Number
 * @brief A magnitude together with its decimal scale suffix.
 */
class Number
{
   public:
    Number() = default;
    Number(double value, Suffix suffix = Suffix::None)
        : value(value), suffix(suffix)
    {
    }

    /** @brief Magnitude as written in the source text. */
    double getValue() const { return value; }
    Suffix getSuffix() const { return suffix; }

    /** @brief Value in base units (magnitude times scale). */
    double toDouble() const;

    /**
     * @brief SPICE text for this number, e.g. `1.5k`, `10Meg`, `-0.7`.
     *
     * The magnitude is printed with up to 15 significant digits so the text
     * reads back into an equal number.
     */
    std::string toSpice() const;

    Number operator+(const Number& other) const;
    Number operator-(const Number& other) const;
    Number operator*(double factor) const;

    /** @brief Equal when the scaled values agree to a relative 1e-12. */
    bool operator==(const Number& other) const;
    bool operator!=(const Number& other) const { return !(*this == other); }
    bool operator<(const Number& other) const;

   private:
    double value = 0.0;
    Suffix suffix = Suffix::None;
};

std::ostream& operator<<(std::ostream& os, const Number& number);

/**
 * @class UnitNumber
 * @brief A `Number` tagged with the quantity the grammar parsed it as.
 */
class UnitNumber
{
   public:
    UnitNumber() = default;
    UnitNumber(const Number& number, Unit unit) : number(number), unit(unit) {}
    UnitNumber(double value, Suffix suffix, Unit unit)
        : number(value, suffix), unit(unit)
    {
    }

    const Number& getNumber() const { return number; }
    Unit getUnit() const { return unit; }
    double toDouble() const { return number.toDouble(); }

    /** @brief SPICE text of the number; the unit letter is not emitted. */
    std::string toSpice() const { return number.toSpice(); }

    bool operator==(const UnitNumber& other) const
    {
        return unit == other.unit && number == other.number;
    }
    bool operator!=(const UnitNumber& other) const { return !(*this == other); }

   private:
    Number number;
    Unit unit = Unit::None;
};

std::ostream& operator<<(std::ostream& os, const UnitNumber& number);
