/******************************************************************************\
 * Scheduler.hpp - Generic interface to an external batch scheduler.
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

#include <string>

#include "scheduler/JobScript.hpp"

namespace spawner {

// Coarse job phase, recomputed from scheduler output on every query
enum class JobState
    { Unsubmitted // no identifier, or scheduler no longer knows the job
    , Pending
    , Running
    , Terminal
};

enum class CancelOutcome
    { Cancelled       // scheduler confirmed the cancel
    , AlreadyTerminal // job had already finished
    , Unknown
};

char const* toString(JobState state);
char const* toString(CancelOutcome outcome);

// Map the output of a state query to a JobState. RUNNING is checked before
// PENDING; any other non-empty output is Terminal.
JobState parseJobState(std::string const& output);

// Map the output of a cancel command to a CancelOutcome
CancelOutcome parseCancelOutput(std::string const& output);

/*
**
** The Scheduler object defines the interface every batch system implementation
** must provide. All operations run external commands and are expected to degrade
** to empty results rather than throw when a command fails. Implementations live
** under scheduler_impl/.
*/
class Scheduler {
public: // impl.-specific interface that derived type must implement

    // submit the rendered job script, return the new job identifier.
    // throws SubmissionError if no identifier could be parsed.
    virtual std::string
    submit(SubmissionRequest const& request) = 0;

    // current phase of the job
    virtual JobState
    queryState(std::string const& jobId) = 0;

    // name of the node the job runs on, or empty if none is assigned
    virtual std::string
    queryNode(std::string const& jobId) = 0;

    // network address of node, or empty if it cannot be resolved
    virtual std::string
    resolveHost(std::string const& node) = 0;

    // cancel the job. `now` skips the scheduler's grace period.
    virtual CancelOutcome
    cancel(std::string const& jobId, bool now) = 0;

public: // interface

    // address of the node running the job. throws NotFoundError if the job has
    // no node yet, ResolutionError if the node name does not resolve.
    std::string queryHost(std::string const& jobId);

public: // constructor / destructor interface
    Scheduler() = default;
    virtual ~Scheduler() = default;
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;
};

} /* namespace spawner */
