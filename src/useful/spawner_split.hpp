/******************************************************************************\
 * spawner_split.hpp - Header file for splitting and tokenizing command output.
 *
 * Copyright 2019-2020 Hewlett Packard Enterprise Development LP.
 *
 *     Redistribution and use in source and binary forms, with or
 *     without modification, are permitted provided that the following
 *     conditions are met:
 *
 *      - Redistributions of source code must retain the above
 *        copyright notice, this list of conditions and the following
 *        disclaimer.
 *
 *      - Redistributions in binary form must reproduce the above
 *        copyright notice, this list of conditions and the following
 *        disclaimer in the documentation and/or other materials
 *        provided with the distribution.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS
 * BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN
 * ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
 * CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 ******************************************************************************/

#pragma once

#include <string>
#include <utility>

namespace spawner {

namespace split {

    static inline std::string removeLeadingWhitespace(const std::string& str, const std::string& whitespace = " \t\r\n") {
        const auto startPos = str.find_first_not_of(whitespace);
        if (startPos == std::string::npos) return "";
        const auto endPos = str.find_last_not_of(whitespace);
        return str.substr(startPos, endPos - startPos + 1);
    }

    /* split string at the first occurrence of delim. usage:
        auto [head, rest] = split::first(line, ';');
       if delim is not present, head is the whole line and rest is empty.
    */
    static inline std::pair<std::string, std::string> first(std::string const& line, char delim) {
        auto const pos = line.find(delim);
        if (pos == std::string::npos) {
            return {line, std::string{}};
        }
        return {line.substr(0, pos), line.substr(pos + 1)};
    }

    // last whitespace-delimited token of line, or empty if there is none
    static inline std::string lastToken(std::string const& line) {
        auto const endPos = line.find_last_not_of(" \t\r\n");
        if (endPos == std::string::npos) return "";
        auto const startPos = line.find_last_of(" \t\r\n", endPos);
        return (startPos == std::string::npos)
            ? line.substr(0, endPos + 1)
            : line.substr(startPos + 1, endPos - startPos);
    }

} /* namespace spawner::split */

// wrap str in single quotes so that the shell passes it through unmodified
static inline std::string shellQuote(std::string const& str) {
    auto result = std::string{"'"};
    for (auto&& c : str) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result.push_back(c);
        }
    }
    result.push_back('\'');
    return result;
}

} /* namespace spawner */
