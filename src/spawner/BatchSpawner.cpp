/******************************************************************************\
 * BatchSpawner.cpp - Lifecycle of one session's batch job.
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

#include "spawner_defs.h"

#include <stdexcept>

#include "spawner/BatchSpawner.hpp"
#include "spawner/spawner_error.hpp"

#include "useful/spawner_wrappers.hpp"

namespace spawner {

static Scheduler&
requireScheduler(std::unique_ptr<Scheduler> const& scheduler)
{
    if (!scheduler) {
        throw std::invalid_argument("spawner requires a scheduler");
    }
    return *scheduler;
}

/* constructor / destructor */

BatchSpawner::BatchSpawner(SessionInfo session, SpawnerConfig config,
    std::unique_ptr<Scheduler> scheduler, std::shared_ptr<TaskQueue> submitQueue)
    : m_session{std::move(session)}
    , m_config{std::move(config)}
    , m_scheduler{std::move(scheduler)}
    , m_submitQueue{std::move(submitQueue)}
    , m_resolver{requireScheduler(m_scheduler)}
    , m_mutex{}
    , m_abortCv{}
    , m_abort{false}
    , m_jobIdStore{}
    , m_state{LifecycleState::Idle}
    , m_errorString{}
    , m_startResult{}
{
    if (!m_submitQueue) {
        throw std::invalid_argument("spawner requires a submission queue");
    }
    if (m_config.pollAttempts == 0) {
        throw std::invalid_argument("spawner requires at least one poll attempt");
    }
}

BatchSpawner::~BatchSpawner()
{
    { auto lock = std::lock_guard<std::mutex>{m_mutex};
        m_abort = true;
    }
    m_abortCv.notify_all();

    // start thread refers to this object
    if (m_startResult.valid()) {
        m_startResult.wait();
    }
}

/* helpers */

void
BatchSpawner::recordError(std::string const& caller, std::exception const& ex)
{
    auto const message = caller + ": " + std::string{ex.what() ? ex.what() : "(null error string)"};

    auto jobId = std::string{};
    { auto lock = std::lock_guard<std::mutex>{m_mutex};
        m_errorString = message;
        jobId = m_jobIdStore.get();
    }

    writeLog(jobId, "%s\n", message.c_str());
}

std::string
BatchSpawner::currentJobId() const
{
    auto lock = std::lock_guard<std::mutex>{m_mutex};
    return m_jobIdStore.get();
}

bool
BatchSpawner::startInFlight() const
{
    return (m_state == LifecycleState::Submitting) || (m_state == LifecycleState::AwaitingRun);
}

SubmissionRequest
BatchSpawner::buildRequest() const
{
    auto request = SubmissionRequest
        { m_session.user
        , m_session.command
        , m_session.args
        , m_session.workdir
        , m_session.env
        , m_config.partition
        , m_config.memory
        , m_config.hours
    };

    // Job runs as the session user
    if (request.env.count("USER") == 0) {
        request.env["USER"] = m_session.user;
    }
    if (request.env.count("HOME") == 0) {
        auto home = std::optional<std::string>{};
        try {
            home = getpwnamHome(m_session.user);
        } catch (std::exception const& ex) {
            writeLog("", "home directory lookup failed: %s\n", ex.what());
        }
        request.env["HOME"] = home
            ? *home
            : cstr::asprintf(SLURM_HOME_PATTERN, m_session.user.c_str());
    }

    return request;
}

void
BatchSpawner::forgetJob(std::string const& jobId)
{
    auto lock = std::lock_guard<std::mutex>{m_mutex};
    if (m_jobIdStore.get() == jobId) {
        m_jobIdStore.clear();
    }
}

void
BatchSpawner::waitForRunning(std::string const& jobId)
{
    for (unsigned attempt = 1; attempt <= m_config.pollAttempts; ++attempt) {

        // Sleep between attempts, waking early if stop() is called
        { auto lock = std::unique_lock<std::mutex>{m_mutex};
            if (attempt > 1) {
                m_abortCv.wait_for(lock, m_config.pollInterval, [this]() { return m_abort; });
            }
            if (m_abort) {
                throw StartAborted("start of job " + jobId + " interrupted by stop");
            }
        }

        auto const state = m_scheduler->queryState(jobId);
        writeLog(jobId, "state %s (%u/%u)\n", toString(state), attempt, m_config.pollAttempts);

        if (state == JobState::Running) {
            return;
        } else if (state != JobState::Pending) {
            throw JobFailed("job " + jobId + " ended before it started running (state " + toString(state) + ")");
        }
    }

    throw PollTimeout("job " + jobId + " did not start running after "
        + std::to_string(m_config.pollAttempts) + " state queries");
}

void
BatchSpawner::cancelAbandoned(std::string const& jobId)
{
    try {
        auto const outcome = m_scheduler->cancel(jobId, false);
        writeLog(jobId, "cancelled abandoned job: %s\n", toString(outcome));
    } catch (std::exception const& ex) {
        writeLog(jobId, "failed to cancel abandoned job: %s\n", ex.what());
    }
}

Spawner::StartResult
BatchSpawner::runStart()
{
    auto jobId = std::string{};
    try {
        // Submissions from all sessions share one queue
        auto const request = buildRequest();
        auto submitted = m_submitQueue->enqueue([this, request]() {
            return m_scheduler->submit(request);
        });
        jobId = submitted.get();

        { auto lock = std::lock_guard<std::mutex>{m_mutex};
            m_jobIdStore.set(jobId);
            // stop() is responsible for the job from here
            if (m_abort) {
                throw StartAborted("start of job " + jobId + " interrupted by stop");
            }
            m_state = LifecycleState::AwaitingRun;
        }
        writeLog(jobId, "submitted\n");

        waitForRunning(jobId);
        auto host = m_resolver.resolve(jobId);

        { auto lock = std::lock_guard<std::mutex>{m_mutex};
            if (m_abort) {
                throw StartAborted("start of job " + jobId + " interrupted by stop");
            }
            // a concurrent poll() may have seen the job end
            if (m_jobIdStore.get() != jobId) {
                throw JobFailed("job " + jobId + " ended before its endpoint was published");
            }
            m_state = LifecycleState::Running;
        }
        writeLog(jobId, "running at %s:%d\n", host.c_str(), m_session.port);

        return EndpointAddress{std::move(host), m_session.port};

    } catch (StartAborted const& ex) {
        // identifier is kept so that stop() can cancel the job
        recordError("start", ex);
        return std::nullopt;

    } catch (JobFailed const& ex) {
        recordError("start", ex);

    } catch (PollTimeout const& ex) {
        recordError("start", ex);
        cancelAbandoned(jobId);

    } catch (ResolutionError const& ex) {
        recordError("start", ex);
        cancelAbandoned(jobId);

    } catch (std::exception const& ex) {
        recordError("start", ex);
        if (!jobId.empty()) {
            cancelAbandoned(jobId);
        }
    }

    // Failed start leaves the session without a job
    { auto lock = std::lock_guard<std::mutex>{m_mutex};
        if (m_jobIdStore.get() == jobId) {
            m_jobIdStore.clear();
        }
        m_state = LifecycleState::Idle;
    }

    return std::nullopt;
}

void
BatchSpawner::abortStart()
{
    auto inFlight = std::shared_future<StartResult>{};
    { auto lock = std::lock_guard<std::mutex>{m_mutex};
        if (!startInFlight()) {
            return;
        }
        m_abort = true;
        inFlight = m_startResult;
    }
    m_abortCv.notify_all();

    writeLog(currentJobId(), "waiting for in-flight start to give up\n");
    if (inFlight.valid()) {
        inFlight.wait();
    }
}

/* interface */

std::shared_future<Spawner::StartResult>
BatchSpawner::start()
{
    auto failed = []() {
        auto promise = std::promise<StartResult>{};
        promise.set_value(std::nullopt);
        return promise.get_future().share();
    };

    return runSafely("start", [&]() {
        auto lock = std::lock_guard<std::mutex>{m_mutex};
        if (m_state != LifecycleState::Idle) {
            throw Error(std::string{"session is already "} + toString(m_state));
        }

        // start thread blocks on m_mutex until the state below is published
        m_abort = false;
        m_startResult = std::async(std::launch::async, [this]() { return runStart(); }).share();
        m_state = LifecycleState::Submitting;

        return m_startResult;
    }, failed());
}

PollStatus
BatchSpawner::poll()
{
    return runSafely("poll", [&]() {
        auto const jobId = currentJobId();
        if (jobId.empty()) {
            return PollStatus::NotRunning;
        }

        auto const state = m_scheduler->queryState(jobId);
        if ((state == JobState::Running) || (state == JobState::Pending)) {
            return PollStatus::Alive;
        }

        writeLog(jobId, "no longer running (state %s)\n", toString(state));
        { auto lock = std::lock_guard<std::mutex>{m_mutex};
            if (m_jobIdStore.get() == jobId) {
                m_jobIdStore.clear();
                // an in-flight start() settles its own state
                if (m_state == LifecycleState::Running) {
                    m_state = LifecycleState::Idle;
                }
            }
        }
        return PollStatus::NotRunning;
    }, PollStatus::NotRunning);
}

void
BatchSpawner::stop(bool now)
{
    auto const stopped = runSafely("stop", [&]() {
        abortStart();

        auto const setState = [this](LifecycleState state) {
            auto lock = std::lock_guard<std::mutex>{m_mutex};
            m_state = state;
        };

        if (poll() == PollStatus::NotRunning) {
            setState(LifecycleState::Idle);
            return true;
        }

        auto const jobId = currentJobId();
        setState(LifecycleState::Stopping);
        writeLog(jobId, "cancelling%s\n", now ? " immediately" : "");

        auto const outcome = m_scheduler->cancel(jobId, now);
        if ((outcome == CancelOutcome::Cancelled) || (outcome == CancelOutcome::AlreadyTerminal)) {
            writeLog(jobId, "cancel confirmed: %s\n", toString(outcome));
            forgetJob(jobId);
            setState(LifecycleState::Idle);
            return true;
        }

        // Scheduler gave no verdict, check once more
        if (poll() == PollStatus::Alive) {
            setState(LifecycleState::Running);
            throw CancelUnconfirmed("job " + jobId + " is still alive after cancel");
        }

        setState(LifecycleState::Idle);
        return true;
    }, false);

    if (!stopped) {
        { auto lock = std::lock_guard<std::mutex>{m_mutex};
            if (m_state == LifecycleState::Stopping) {
                m_state = m_jobIdStore.empty()
                    ? LifecycleState::Idle
                    : LifecycleState::Running;
            }
        }
        getLogger().warn("%s\n", errorString().c_str());
    }
}

void
BatchSpawner::loadState(std::string const& blob)
{
    runSafely("loadState", [&]() {
        auto lock = std::lock_guard<std::mutex>{m_mutex};
        if (startInFlight()) {
            throw Error("cannot load state while start is in progress");
        }

        try {
            m_jobIdStore.deserialize(blob);
        } catch (std::runtime_error const& ex) {
            // treated as a session without a job
            writeLog("", "ignoring session state: %s\n", ex.what());
        }

        // a restored job is assumed live until a poll says otherwise
        m_state = m_jobIdStore.empty()
            ? LifecycleState::Idle
            : LifecycleState::Running;

        return true;
    }, false);
}

std::string
BatchSpawner::getState() const
{
    auto lock = std::lock_guard<std::mutex>{m_mutex};
    return m_jobIdStore.serialize();
}

void
BatchSpawner::clearState()
{
    runSafely("clearState", [&]() {
        auto lock = std::lock_guard<std::mutex>{m_mutex};
        if (startInFlight()) {
            throw Error("cannot clear state while start is in progress");
        }

        m_jobIdStore.clear();
        m_state = LifecycleState::Idle;

        return true;
    }, false);
}

std::string
BatchSpawner::errorString() const
{
    auto lock = std::lock_guard<std::mutex>{m_mutex};
    return m_errorString.empty()
        ? DEFAULT_ERR_STR
        : m_errorString;
}

LifecycleState
BatchSpawner::lifecycleState() const
{
    auto lock = std::lock_guard<std::mutex>{m_mutex};
    return m_state;
}

std::string
BatchSpawner::jobId() const
{
    return currentJobId();
}

} /* namespace spawner */
