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
 * @file ParseResult.cpp
 * @brief Cursor navigation, line/column bookkeeping and error trace rendering.
 */

#include "ParseResult.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>

namespace {
const std::string emptyText;
}

const std::string& Cursor::text() const
{
    return input ? *input : emptyText;
}

char Cursor::peek(size_t ahead) const
{
    if (input == nullptr || pos + ahead >= input->size())
        return '\0';
    return (*input)[pos + ahead];
}

Cursor Cursor::advance(size_t count) const
{
    Cursor next(*this);
    if (input != nullptr)
        next.pos = std::min(pos + count, input->size());
    return next;
}

std::string Cursor::rest() const
{
    if (atEnd())
        return std::string();
    return input->substr(pos);
}

std::string Cursor::take(size_t count) const
{
    if (atEnd())
        return std::string();
    return input->substr(pos, count);
}

std::string Cursor::restOfLine() const
{
    if (atEnd())
        return std::string();
    size_t end = input->find('\n', pos);
    if (end == std::string::npos)
        end = input->size();
    std::string line = input->substr(pos, end - pos);
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

bool Cursor::startsWith(const std::string& prefix) const
{
    if (remaining() < prefix.size())
        return false;
    return input->compare(pos, prefix.size(), prefix) == 0;
}

bool Cursor::startsWithNoCase(const std::string& prefix) const
{
    if (remaining() < prefix.size())
        return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        unsigned char a = static_cast<unsigned char>((*input)[pos + i]);
        unsigned char b = static_cast<unsigned char>(prefix[i]);
        // Non-ASCII bytes (e.g. the UTF-8 encoding of an Ohm sign) compare
        // exactly.
        if (a < 0x80 && b < 0x80) {
            if (std::tolower(a) != std::tolower(b))
                return false;
        } else if (a != b) {
            return false;
        }
    }
    return true;
}

int Cursor::line() const
{
    if (input == nullptr)
        return 1;
    size_t end = std::min(pos, input->size());
    return 1 + static_cast<int>(
                   std::count(input->begin(), input->begin() + end, '\n'));
}

size_t Cursor::column() const
{
    if (input == nullptr)
        return 1;
    size_t end = std::min(pos, input->size());
    size_t lineStart = end == 0 ? std::string::npos
                                : input->rfind('\n', end - 1);
    lineStart = (lineStart == std::string::npos) ? 0 : lineStart + 1;
    return end - lineStart + 1;
}

std::string Cursor::lineText() const
{
    if (input == nullptr)
        return std::string();
    size_t end = std::min(pos, input->size());
    size_t lineStart = end == 0 ? std::string::npos
                                : input->rfind('\n', end - 1);
    lineStart = (lineStart == std::string::npos) ? 0 : lineStart + 1;
    return Cursor(*input, lineStart).restOfLine();
}

std::string ParseError::render(const std::string& input) const
{
    std::ostringstream oss;
    for (size_t i = 0; i < entries.size(); ++i) {
        Cursor at(input, entries[i].offset);
        oss << i << ": at line " << at.line() << ", in " << entries[i].label
            << ":\n";
        oss << at.lineText() << "\n";
        oss << std::string(at.column() - 1, ' ') << "^\n";
    }
    return oss.str();
}
