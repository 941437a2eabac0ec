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
 * @file MeasureCommand.hpp
 * @brief `.MEAS` lines and the output variables they refer to.
 *
 * Three measurement forms are recognized after
 * `.MEAS <TRAN|AC|DC> <name>`:
 *
 *  - Rise/fall timing:
 *    `TRIG <var> VAL=<v> RISE|FALL=<n> TARG <var> VAL=<v> RISE|FALL=<n>`
 *  - Statistic over a window:
 *    `AVG|RMS|MIN|MAX|PP|DERIV|INTEGRATE <var> FROM=<t> TO=<t>`
 *  - Value at an event: `FIND <var> WHEN <var>=<v>`
 *
 * Output variables are `V(node)`, `V(node1,node2)` or `I(element)`. A trailing
 * `M`, `DB`, `P`, `R` or `I` on the text inside the parentheses selects
 * magnitude, decibel, phase, real or imaginary part; the checks are
 * case-sensitive and made in exactly that order.
 *
 * The line commits after `.MEAS`: an unknown analysis, a missing name or a
 * body matching none of the three forms is a fatal error.
 */

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "Number.hpp"
#include "ParseResult.hpp"

enum class AnalysisType
{
    Dc,
    Ac,
    Tran
};

inline std::ostream& operator<<(std::ostream& os, AnalysisType analysis)
{
    switch (analysis) {
        case AnalysisType::Dc:
            os << "DC";
            break;
        case AnalysisType::Ac:
            os << "AC";
            break;
        case AnalysisType::Tran:
            os << "TRAN";
            break;
        default:
            os << "?";
            break;
    }
    return os;
}

/**
 * @enum OutputSuffix
 * @brief Complex-quantity selector sniffed from an output variable.
 */
enum class OutputSuffix
{
    None,
    Magnitude, /**< ends with `M` */
    Decibel,   /**< ends with `DB` */
    Phase,     /**< ends with `P` */
    Real,      /**< ends with `R` */
    Imag       /**< ends with `I` */
};

enum class OutputKind
{
    Voltage, /**< `V(...)` */
    Current  /**< `I(...)` */
};

/**
 * @struct OutputVariable
 * @brief A probed node voltage or element current.
 */
struct OutputVariable
{
    OutputKind kind = OutputKind::Voltage;
    std::string node1;                /**< Voltage: first node */
    std::optional<std::string> node2; /**< Voltage: reference node */
    std::string elementName;          /**< Current: element designator */
    OutputSuffix suffix = OutputSuffix::None;

    std::string toSpice() const;

    /** @brief Suffix for the text between the parentheses. */
    static OutputSuffix sniffSuffix(const std::string& text);

    static ParseResult<OutputVariable> parse(const Cursor& input);
};

enum class EdgeType
{
    Rise,
    Fall
};

/**
 * @struct TrigTargCondition
 * @brief `<var> VAL=<v> RISE|FALL=<n>`: the n-th crossing of a level.
 */
struct TrigTargCondition
{
    OutputVariable variable;
    Number value;
    EdgeType edge = EdgeType::Rise;
    unsigned number = 0;

    std::string toSpice() const;
    static ParseResult<TrigTargCondition> parse(const Cursor& input);
};

/** @brief `<var>=<v>` after `WHEN`. */
struct FindWhenCondition
{
    OutputVariable variable;
    Number value;

    std::string toSpice() const;
    static ParseResult<FindWhenCondition> parse(const Cursor& input);
};

enum class MeasureStat
{
    Avg,
    Rms,
    Min,
    Max,
    Pp,
    Deriv,
    Integrate
};

inline std::ostream& operator<<(std::ostream& os, MeasureStat stat)
{
    switch (stat) {
        case MeasureStat::Avg:
            os << "AVG";
            break;
        case MeasureStat::Rms:
            os << "RMS";
            break;
        case MeasureStat::Min:
            os << "MIN";
            break;
        case MeasureStat::Max:
            os << "MAX";
            break;
        case MeasureStat::Pp:
            os << "PP";
            break;
        case MeasureStat::Deriv:
            os << "DERIV";
            break;
        case MeasureStat::Integrate:
            os << "INTEGRATE";
            break;
        default:
            os << "?";
            break;
    }
    return os;
}

enum class MeasureType
{
    Rise,
    BasicStat,
    FindWhen
};

class MeasureCommand;
using MeasureCommandPtr = std::shared_ptr<MeasureCommand>;

/**
 * @class MeasureCommand
 * @brief Base of the three `.MEAS` forms.
 */
class MeasureCommand
{
   public:
    MeasureCommand(const std::string& name, AnalysisType analysis,
                   MeasureType type)
        : name(name), analysis(analysis), type(type)
    {
    }
    virtual ~MeasureCommand() = default;

    const std::string& getName() const { return name; }
    AnalysisType getAnalysis() const { return analysis; }
    MeasureType getType() const { return type; }

    virtual std::string toSpice() const = 0;

    /**
     * @brief Parse a `.MEAS` (or `.MEASURE`) line.
     *
     * @return Error when the keyword is absent, Failure for any problem after
     *         it.
     */
    static ParseResult<MeasureCommandPtr> parse(const Cursor& input);

   protected:
    /** @brief `.MEAS <analysis> <name>` */
    std::string header() const;

    std::string name;
    AnalysisType analysis;
    MeasureType type;
};

class MeasureRise : public MeasureCommand
{
   public:
    MeasureRise(const std::string& name, AnalysisType analysis,
                const TrigTargCondition& trig, const TrigTargCondition& targ)
        : MeasureCommand(name, analysis, MeasureType::Rise),
          trig(trig),
          targ(targ)
    {
    }

    const TrigTargCondition& getTrig() const { return trig; }
    const TrigTargCondition& getTarg() const { return targ; }
    std::string toSpice() const override;

   private:
    TrigTargCondition trig;
    TrigTargCondition targ;
};

class MeasureBasicStat : public MeasureCommand
{
   public:
    MeasureBasicStat(const std::string& name, AnalysisType analysis,
                     MeasureStat stat, const OutputVariable& variable,
                     const UnitNumber& from, const UnitNumber& to)
        : MeasureCommand(name, analysis, MeasureType::BasicStat),
          stat(stat),
          variable(variable),
          from(from),
          to(to)
    {
    }

    MeasureStat getStat() const { return stat; }
    const OutputVariable& getVariable() const { return variable; }
    const UnitNumber& getFrom() const { return from; }
    const UnitNumber& getTo() const { return to; }
    std::string toSpice() const override;

   private:
    MeasureStat stat;
    OutputVariable variable;
    UnitNumber from;
    UnitNumber to;
};

class MeasureFindWhen : public MeasureCommand
{
   public:
    MeasureFindWhen(const std::string& name, AnalysisType analysis,
                    const OutputVariable& variable,
                    const FindWhenCondition& when)
        : MeasureCommand(name, analysis, MeasureType::FindWhen),
          variable(variable),
          when(when)
    {
    }

    const OutputVariable& getVariable() const { return variable; }
    const FindWhenCondition& getWhen() const { return when; }
    std::string toSpice() const override;

   private:
    OutputVariable variable;
    FindWhenCondition when;
};
