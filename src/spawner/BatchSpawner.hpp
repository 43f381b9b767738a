/******************************************************************************\
 * BatchSpawner.hpp - Lifecycle of one session's batch job: submit, wait for
 *                    it to run, report its endpoint, and cancel it on stop.
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

#include <condition_variable>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>

#include "batch_spawner.hpp"

#include "scheduler/Scheduler.hpp"
#include "spawner/EndpointResolver.hpp"
#include "spawner/JobIdStore.hpp"

#include "useful/TaskQueue.hpp"
#include "useful/spawner_log.h"

namespace spawner {

class BatchSpawner final : public Spawner
{
public: // inherited interface
    std::shared_future<StartResult> start() override;

    PollStatus poll() override;

    void stop(bool now) override;

    void loadState(std::string const& blob) override;
    std::string getState() const override;
    void clearState() override;

    std::string errorString() const override;

    LifecycleState lifecycleState() const override;
    std::string jobId() const override;

private: // variables
    SessionInfo const   m_session;
    SpawnerConfig const m_config;

    std::unique_ptr<Scheduler> m_scheduler;
    std::shared_ptr<TaskQueue> m_submitQueue;
    EndpointResolver           m_resolver;

    // Guards everything below
    mutable std::mutex      m_mutex;
    std::condition_variable m_abortCv;
    bool                    m_abort;
    JobIdStore              m_jobIdStore;
    LifecycleState          m_state;
    std::string             m_errorString;

    // Result of the most recent start(), kept so that stop() and the
    // destructor can wait for it
    std::shared_future<StartResult> m_startResult;

private: // helpers
    // Run func, converting any exception into onError plus a recorded error
    // string of the form "<caller>: <what>"
    template <typename FuncType, typename ReturnType = std::invoke_result_t<FuncType>>
    ReturnType runSafely(std::string const& caller, FuncType&& func, ReturnType const onError)
    {
        try {
            return std::forward<FuncType>(func)();
        } catch (std::exception const& ex) {
            recordError(caller, ex);
            return onError;
        }
    }

    void recordError(std::string const& caller, std::exception const& ex);

    template <typename... Args>
    void writeLog(std::string const& jobId, char const* fmt, Args&&... args) const
    {
        auto const prefixedFmt = std::string{"%s:%s: "} + fmt;
        getLogger().write(prefixedFmt.c_str(), m_session.user.c_str(),
            jobId.c_str(), std::forward<Args>(args)...);
    }

    std::string currentJobId() const;
    bool startInFlight() const;

    SubmissionRequest buildRequest() const;

    // Body of start(), runs on its own thread
    StartResult runStart();

    // Query state until the job runs. Throws JobFailed, PollTimeout, or
    // StartAborted if stop() interrupts the wait.
    void waitForRunning(std::string const& jobId);

    // Cancel a job that start() gave up on. Failures are only logged.
    void cancelAbandoned(std::string const& jobId);

    // Ask an in-flight start() to give up and wait for it
    void abortStart();

    // Forget jobId if it is still the held identifier
    void forgetJob(std::string const& jobId);

public: // constructor / destructor interface
    BatchSpawner(SessionInfo session, SpawnerConfig config,
        std::unique_ptr<Scheduler> scheduler, std::shared_ptr<TaskQueue> submitQueue);
    ~BatchSpawner();
};

} /* namespace spawner */
