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
 * @file LefTechLibrary.hpp
 * @brief Technology section of a LEF file: header statements and layers.
 *
 * Accepted layout:
 *
 *     VERSION <number> ;
 *     BUSBITCHARS {"[]" | "{}" | "<>"} ;
 *     DIVIDERCHAR {"/" | "\" | "%" | "$"} ;
 *     UNITS
 *         [TIME NANOSECONDS <n> ;]  [CAPACITANCE PICOFARADS <n> ;]
 *         [RESISTANCE OHMS <n> ;]   [POWER MILLIWATTS <n> ;]
 *         [CURRENT MILLIAMPS <n> ;] [VOLTAGE VOLTS <n> ;]
 *         [DATABASE MICRONS <n> ;]  [FREQUENCY MEGAHERTZ <n> ;]
 *     END UNITS
 *     [MANUFACTURINGGRID <number> ;]
 *     [USEMINSPACING {ON | OFF} ;]
 *     LAYER ... END <name>  (any number)
 *     [END LIBRARY]
 *
 * The four leading statements are mandatory and come in this order. UNITS
 * sub-clauses may appear in any order.
 */

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "LefLayer.hpp"
#include "ParseResult.hpp"

/**
 * @struct LefUnits
 * @brief Conversion factors from the UNITS block; absent clauses stay empty.
 */
struct LefUnits
{
    std::optional<double> time;               /**< NANOSECONDS */
    std::optional<double> capacitance;        /**< PICOFARADS */
    std::optional<double> resistance;         /**< OHMS */
    std::optional<double> power;              /**< MILLIWATTS */
    std::optional<double> current;            /**< MILLIAMPS */
    std::optional<double> voltage;            /**< VOLTS */
    std::optional<unsigned> databaseMicrons;  /**< Database units per micron */
    std::optional<double> frequency;          /**< MEGAHERTZ */

    /** @brief `UNITS ... END UNITS`; fatal after the `UNITS` keyword. */
    static ParseResult<LefUnits> parse(const Cursor& input);
};

enum class LefUseMinSpacing
{
    On,
    Off
};

inline std::ostream& operator<<(std::ostream& os, LefUseMinSpacing value)
{
    switch (value) {
        case LefUseMinSpacing::On:
            os << "ON";
            break;
        case LefUseMinSpacing::Off:
            os << "OFF";
            break;
        default:
            os << "?";
            break;
    }
    return os;
}

/**
 * @struct LefTechLibrary
 * @brief Header settings and layers of one LEF file.
 */
struct LefTechLibrary
{
    double version = 0.0;
    std::string busBitChars; /**< The two delimiter characters, unquoted */
    std::string dividerChar; /**< The divider character, unquoted */
    LefUnits units;
    std::optional<double> manufacturingGrid;
    /**
     * Both `ON` and `OFF` are stored as `LefUseMinSpacing::On`; files that
     * rely on the difference read as ON.
     */
    std::optional<LefUseMinSpacing> useMinSpacing;
    std::vector<LefLayerPtr> layers;

    /**
     * @brief Parse the header, the layers and an optional `END LIBRARY`.
     *
     * Stops after the last layer block (or `END LIBRARY`); text left after
     * that is for the caller to judge.
     */
    static ParseResult<LefTechLibrary> parse(const Cursor& input);
};
