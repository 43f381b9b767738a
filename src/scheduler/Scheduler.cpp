/******************************************************************************\
 * Scheduler.cpp - Scheduler output interpretation common to all implementations.
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

#include <set>

#include "scheduler/Scheduler.hpp"
#include "spawner/spawner_error.hpp"

#include "useful/spawner_split.hpp"

namespace spawner {

char const*
toString(JobState state)
{
    switch (state) {
        case JobState::Unsubmitted: return "UNSUBMITTED";
        case JobState::Pending:     return "PENDING";
        case JobState::Running:     return "RUNNING";
        case JobState::Terminal:    return "TERMINAL";
    }
    return "UNKNOWN";
}

char const*
toString(CancelOutcome outcome)
{
    switch (outcome) {
        case CancelOutcome::Cancelled:       return "cancelled";
        case CancelOutcome::AlreadyTerminal: return "already terminal";
        case CancelOutcome::Unknown:         return "unknown";
    }
    return "unknown";
}

JobState
parseJobState(std::string const& output)
{
    auto const state = split::removeLeadingWhitespace(output);
    if (state.empty()) {
        return JobState::Unsubmitted;
    } else if (state.find("RUNNING") != std::string::npos) {
        return JobState::Running;
    } else if (state.find("PENDING") != std::string::npos) {
        return JobState::Pending;
    }
    return JobState::Terminal;
}

CancelOutcome
parseCancelOutput(std::string const& output)
{
    static auto const terminalLabels = std::set<std::string>
        { "COMPLETED", "FAILED", "COMPLETING", "TIMEOUT", "PREEMPTED"
        , "NODE_FAIL", "OUT_OF_MEMORY", "BOOT_FAIL", "DEADLINE"
    };

    auto const label = split::removeLeadingWhitespace(output);
    if (label == "CANCELLED") {
        return CancelOutcome::Cancelled;
    } else if (terminalLabels.count(label)) {
        return CancelOutcome::AlreadyTerminal;
    }
    return CancelOutcome::Unknown;
}

std::string
Scheduler::queryHost(std::string const& jobId)
{
    auto const node = queryNode(jobId);
    if (node.empty()) {
        throw NotFoundError("job " + jobId + " has no execution node");
    }

    auto const address = resolveHost(node);
    if (address.empty()) {
        throw ResolutionError("failed to resolve address of node " + node + " for job " + jobId);
    }

    return address;
}

} /* namespace spawner */
