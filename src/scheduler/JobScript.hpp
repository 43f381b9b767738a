/******************************************************************************\
 * JobScript.hpp - Batch script rendering for a spawned session.
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

#pragma once

#include <map>
#include <string>
#include <vector>

namespace spawner {

// Everything needed to submit one session. Built once per start() and not
// modified afterwards.
struct SubmissionRequest {
    std::string user;
    std::string command;                    // may begin with `export ...;` statements
    std::vector<std::string> args;
    std::string workdir;                    // empty: /home/<user>
    std::map<std::string, std::string> env;

    std::string partition;
    std::string memory;
    std::string hours;
};

// Produce the sbatch script for request. Throws SubmissionError if the
// request has no user or no command.
std::string renderJobScript(SubmissionRequest const& request);

} /* namespace spawner */
