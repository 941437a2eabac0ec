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
 * @file SimCommand.hpp
 * @brief Analysis control lines: `.DC`, `.AC` and `.TRAN`.
 *
 * Syntax:
 *
 *     .DC <source> <start> <stop> <step>
 *     .AC {LIN|DEC|OCT} <points> <fstart> <fstop>
 *     .TRAN <tstep> <tstop> [<tstart> [<tmax>]] [UIC]
 *
 * Each command commits once its keyword has been read. The source named by
 * `.DC` is not looked up; it stays a plain name.
 */

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "Number.hpp"
#include "ParseResult.hpp"

enum class SimCommandType
{
    Dc,
    Ac,
    Tran
};

inline std::ostream& operator<<(std::ostream& os, SimCommandType type)
{
    switch (type) {
        case SimCommandType::Dc:
            os << ".DC";
            break;
        case SimCommandType::Ac:
            os << ".AC";
            break;
        case SimCommandType::Tran:
            os << ".TRAN";
            break;
        default:
            os << "UnknownSimCommand";
            break;
    }
    return os;
}

/**
 * @enum AcSweepType
 * @brief Frequency spacing of an `.AC` sweep.
 */
enum class AcSweepType
{
    Lin, /**< Linear, `points` in total */
    Dec, /**< `points` per decade */
    Oct  /**< `points` per octave */
};

inline std::ostream& operator<<(std::ostream& os, AcSweepType sweep)
{
    switch (sweep) {
        case AcSweepType::Lin:
            os << "LIN";
            break;
        case AcSweepType::Dec:
            os << "DEC";
            break;
        case AcSweepType::Oct:
            os << "OCT";
            break;
        default:
            os << "?";
            break;
    }
    return os;
}

class SimCommand;
using SimCommandPtr = std::shared_ptr<SimCommand>;

/**
 * @class SimCommand
 * @brief Base of the analysis commands.
 */
class SimCommand
{
   public:
    explicit SimCommand(SimCommandType type) : type(type) {}
    virtual ~SimCommand() = default;

    SimCommandType getType() const { return type; }
    virtual std::string toSpice() const = 0;

    /** @brief Try `.DC`, `.AC` and `.TRAN` in that order. */
    static ParseResult<SimCommandPtr> parse(const Cursor& input);

   protected:
    SimCommandType type;
};

/** @brief `.DC` sweep of a source value. */
class DcCommand : public SimCommand
{
   public:
    DcCommand(const std::string& source, const UnitNumber& start,
              const UnitNumber& stop, const UnitNumber& step)
        : SimCommand(SimCommandType::Dc),
          source(source),
          start(start),
          stop(stop),
          step(step)
    {
    }

    const std::string& getSource() const { return source; }
    const UnitNumber& getStart() const { return start; }
    const UnitNumber& getStop() const { return stop; }
    const UnitNumber& getStep() const { return step; }

    std::string toSpice() const override;
    static ParseResult<SimCommandPtr> parse(const Cursor& input);

   private:
    std::string source;
    UnitNumber start;
    UnitNumber stop;
    UnitNumber step;
};

/** @brief `.AC` small-signal frequency sweep. */
class AcCommand : public SimCommand
{
   public:
    AcCommand(AcSweepType sweep, unsigned points, const UnitNumber& fstart,
              const UnitNumber& fstop)
        : SimCommand(SimCommandType::Ac),
          sweep(sweep),
          points(points),
          fstart(fstart),
          fstop(fstop)
    {
    }

    AcSweepType getSweep() const { return sweep; }
    unsigned getPoints() const { return points; }
    const UnitNumber& getStart() const { return fstart; }
    const UnitNumber& getStop() const { return fstop; }

    std::string toSpice() const override;
    static ParseResult<SimCommandPtr> parse(const Cursor& input);

   private:
    AcSweepType sweep;
    unsigned points;
    UnitNumber fstart;
    UnitNumber fstop;
};

/**
 * @class TranCommand
 * @brief `.TRAN` transient analysis.
 *
 * A trailing word after the times must be `UIC` (any case); anything else is
 * a fatal error.
 */
class TranCommand : public SimCommand
{
   public:
    TranCommand(const UnitNumber& step, const UnitNumber& stop,
                const std::optional<UnitNumber>& start = std::nullopt,
                const std::optional<UnitNumber>& maxStep = std::nullopt,
                bool uic = false)
        : SimCommand(SimCommandType::Tran),
          step(step),
          stop(stop),
          start(start),
          maxStep(maxStep),
          uic(uic)
    {
    }

    const UnitNumber& getStep() const { return step; }
    const UnitNumber& getStop() const { return stop; }
    const std::optional<UnitNumber>& getStart() const { return start; }
    const std::optional<UnitNumber>& getMaxStep() const { return maxStep; }

    /** @brief Use initial conditions instead of an operating point. */
    bool getUic() const { return uic; }

    /** @brief A max step without a start time is written with a `0` start. */
    std::string toSpice() const override;
    static ParseResult<SimCommandPtr> parse(const Cursor& input);

   private:
    UnitNumber step;
    UnitNumber stop;
    std::optional<UnitNumber> start;
    std::optional<UnitNumber> maxStep;
    bool uic;
};
