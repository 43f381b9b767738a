/******************************************************************************\
 * Scheduler.hpp - A header file for the SLURM specific scheduler interface.
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

#pragma once

#include <chrono>
#include <string>

#include "batch_spawner.hpp"

#include "scheduler/Scheduler.hpp"

#include "useful/spawner_argv.hpp"

class SLURMScheduler : public spawner::Scheduler
{
public: // inherited interface
    static char const* getName() { return "slurm"; }

    std::string submit(spawner::SubmissionRequest const& request) override;

    spawner::JobState queryState(std::string const& jobId) override;

    std::string queryNode(std::string const& jobId) override;

    std::string resolveHost(std::string const& node) override;

    spawner::CancelOutcome cancel(std::string const& jobId, bool now) override;

private: // variables
    std::string const m_sbatch;
    std::string const m_squeue;
    std::string const m_scancel;
    std::string const m_scontrol;
    std::string const m_host;
    std::chrono::milliseconds const m_timeout;

private: // helpers
    // run a scheduler command, return its trimmed output. a spawn failure,
    // non-zero exit or timeout is logged and produces empty output.
    std::string runOutput(spawner::ManagedArgv const& argv, std::string const& input = {}) const;

public: // slurm specific interface
    // job identifier from sbatch output: the last token, all digits, with an
    // optional `;cluster` suffix. throws SubmissionError otherwise.
    static std::string parseSubmitOutput(std::string const& output);

    // whether squeue reported a compressed or multi-node list
    static bool isNodeList(std::string const& nodes);

    // address reported by `host`, or empty if it reported none
    static std::string parseHostOutput(std::string const& output);

    // expand a compressed node list and return its first host
    std::string firstHostname(std::string const& nodes) const;

public: // constructor / destructor interface
    explicit SLURMScheduler(spawner::SpawnerConfig const& config);
    ~SLURMScheduler() = default;
    SLURMScheduler(const SLURMScheduler&) = delete;
    SLURMScheduler& operator=(const SLURMScheduler&) = delete;
    SLURMScheduler(SLURMScheduler&&) = delete;
    SLURMScheduler& operator=(SLURMScheduler&&) = delete;
};
