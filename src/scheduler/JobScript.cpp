/******************************************************************************\
 * JobScript.cpp - Batch script rendering for a spawned session.
 *
 * Copyright 2020 Hewlett Packard Enterprise Development LP.
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

#include <ctype.h>

#include <algorithm>
#include <sstream>
#include <tuple>

#include "spawner_defs.h"

#include "scheduler/JobScript.hpp"
#include "spawner/spawner_error.hpp"

#include "useful/spawner_split.hpp"
#include "useful/spawner_wrappers.hpp"

namespace spawner {

// [A-Za-z_][A-Za-z0-9_]*
static bool
isEnvName(std::string const& name)
{
    if (name.empty() || ::isdigit(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c == '_') || ::isalnum(static_cast<unsigned char>(c));
    });
}

std::string
renderJobScript(SubmissionRequest const& request)
{
    if (request.user.empty()) {
        throw SubmissionError("cannot submit a job without a user");
    }

    // Command may carry a leading export statement, separated by ';'
    auto exportPart = std::string{};
    auto commandPart = split::removeLeadingWhitespace(request.command);
    if ((commandPart.compare(0, 7, "export ") == 0) && (commandPart.find(';') != std::string::npos)) {
        std::tie(exportPart, commandPart) = split::first(commandPart, ';');
        exportPart  = split::removeLeadingWhitespace(exportPart);
        commandPart = split::removeLeadingWhitespace(commandPart);
    }
    if (commandPart.empty()) {
        throw SubmissionError("cannot submit a job without a command");
    }

    auto const workdir = request.workdir.empty()
        ? cstr::asprintf(SLURM_HOME_PATTERN, request.user.c_str())
        : request.workdir;

    auto script = std::stringstream{};
    script
        << "#!/bin/bash\n"
        << "#SBATCH --partition=" << request.partition << "\n"
        << "#SBATCH --time=" << request.hours << ":00:00\n"
        << "#SBATCH -o " << cstr::asprintf(SLURM_LOG_PATTERN, request.user.c_str()) << "\n"
        << "#SBATCH --job-name=" << SLURM_JOB_NAME << "\n"
        << "#SBATCH --workdir=" << workdir << "\n"
        << "#SBATCH --mem=" << request.memory << "\n"
        << "#SBATCH --uid=" << request.user << "\n"
        << "#SBATCH --get-user-env=" << SLURM_USER_ENV_MODE << "\n"
        << "\n";

    if (!exportPart.empty()) {
        script << exportPart << "\n";
    }
    for (auto&& [key, value] : request.env) {
        if (!isEnvName(key)) {
            throw SubmissionError("invalid environment variable name `" + key + "`");
        }
        script << "export " << key << "=" << shellQuote(value) << "\n";
    }

    script << commandPart;
    for (auto&& arg : request.args) {
        script << " " << shellQuote(arg);
    }
    script << "\n";

    return script.str();
}

} /* namespace spawner */
