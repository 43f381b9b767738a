/******************************************************************************\
 * Scheduler.cpp - SLURM specific scheduler library functions.
 *
 * Copyright 2014-2020 Hewlett Packard Enterprise Development LP.
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

#include <algorithm>
#include <sstream>

#include <ctype.h>

#include "scheduler/scheduler_impl/SLURM/Scheduler.hpp"
#include "spawner/spawner_error.hpp"

#include "useful/spawner_execvp.hpp"
#include "useful/spawner_hostname.hpp"
#include "useful/spawner_log.h"
#include "useful/spawner_split.hpp"

using namespace spawner;

SLURMScheduler::SLURMScheduler(SpawnerConfig const& config)
    : m_sbatch{config.sbatchPath}
    , m_squeue{config.squeuePath}
    , m_scancel{config.scancelPath}
    , m_scontrol{config.scontrolPath}
    , m_host{config.hostPath}
    , m_timeout{config.commandTimeout}
{}

std::string
SLURMScheduler::runOutput(ManagedArgv const& argv, std::string const& input) const
{
    try {
        auto const result = Execvp::run(argv, input, m_timeout);
        if (result.timedOut) {
            getLogger().write("`%s` timed out after %lld ms\n", argv.string().c_str(),
                static_cast<long long>(m_timeout.count()));
            return "";
        } else if (result.exitStatus != 0) {
            getLogger().write("`%s` failed with code %d\n", argv.string().c_str(),
                result.exitStatus);
            return "";
        }
        return split::removeLeadingWhitespace(result.output);

    } catch (std::exception const& ex) {
        getLogger().write("`%s` could not be run: %s\n", argv.string().c_str(), ex.what());
    }
    return "";
}

std::string
SLURMScheduler::parseSubmitOutput(std::string const& output)
{
    auto const token = split::lastToken(output);
    // federated clusters report `<id>;<cluster>`
    auto const jobId = split::first(token, ';').first;

    auto const allDigits = !jobId.empty()
        && std::all_of(jobId.begin(), jobId.end(), [](char c) { return ::isdigit(static_cast<unsigned char>(c)); });
    if (!allDigits) {
        if (output.empty()) {
            throw SubmissionError("sbatch produced no output");
        }
        throw SubmissionError("failed to parse job identifier from sbatch output: `" + output + "`");
    }

    return jobId;
}

bool
SLURMScheduler::isNodeList(std::string const& nodes)
{
    return nodes.find_first_of("[,") != std::string::npos;
}

std::string
SLURMScheduler::parseHostOutput(std::string const& output)
{
    // Example: `nid00042.local has address 10.128.0.42`
    auto outputStream = std::stringstream{output};
    auto line = std::string{};
    while (std::getline(outputStream, line)) {
        if (line.find(" address ") != std::string::npos) {
            return split::lastToken(line);
        }
    }
    return "";
}

std::string
SLURMScheduler::firstHostname(std::string const& nodes) const
{
    auto scontrolArgv = ManagedArgv{m_scontrol, "show", "hostnames", nodes};
    auto const hostnames = runOutput(scontrolArgv);
    return split::first(hostnames, '\n').first;
}

std::string
SLURMScheduler::submit(SubmissionRequest const& request)
{
    auto const script = renderJobScript(request);
    getLogger().write("submitting job script:\n%s", script.c_str());

    auto sbatchArgv = ManagedArgv{m_sbatch};
    auto const output = runOutput(sbatchArgv, script);
    getLogger().write("sbatch output: %s\n", output.c_str());

    return parseSubmitOutput(output);
}

JobState
SLURMScheduler::queryState(std::string const& jobId)
{
    // squeue without a job filter would report every job in the queue
    if (jobId.empty()) {
        return JobState::Unsubmitted;
    }

    auto squeueArgv = ManagedArgv{m_squeue, "-h", "-j", jobId, "-o", "%T"};
    auto const output = runOutput(squeueArgv);
    auto const state = parseJobState(output);
    getLogger().write("job %s state: `%s` -> %s\n", jobId.c_str(), output.c_str(), toString(state));

    return state;
}

std::string
SLURMScheduler::queryNode(std::string const& jobId)
{
    if (jobId.empty()) {
        return "";
    }

    auto squeueArgv = ManagedArgv{m_squeue, "-h", "-j", jobId, "-o", "%N"};
    auto const nodes = split::first(runOutput(squeueArgv), '\n').first;
    if (isNodeList(nodes)) {
        getLogger().write("job %s spans nodes %s\n", jobId.c_str(), nodes.c_str());
        return firstHostname(nodes);
    }

    return nodes;
}

std::string
SLURMScheduler::resolveHost(std::string const& node)
{
    if (node.empty()) {
        return "";
    }

    auto hostArgv = ManagedArgv{m_host, node};
    auto const address = parseHostOutput(runOutput(hostArgv));
    if (isAddressLiteral(address)) {
        return address;
    }

    // Fall back to the system resolver
    try {
        return resolveHostname(node);
    } catch (std::exception const& ex) {
        getLogger().write("failed to resolve %s: %s\n", node.c_str(), ex.what());
    }
    return "";
}

CancelOutcome
SLURMScheduler::cancel(std::string const& jobId, bool now)
{
    auto scancelArgv = ManagedArgv{m_scancel};
    if (now) {
        scancelArgv.add("--full");
        scancelArgv.add("--signal=KILL");
    }
    scancelArgv.add(jobId);

    auto const output = runOutput(scancelArgv);
    auto const outcome = parseCancelOutput(output);
    getLogger().write("scancel %s: `%s` -> %s\n", jobId.c_str(), output.c_str(), toString(outcome));

    return outcome;
}
