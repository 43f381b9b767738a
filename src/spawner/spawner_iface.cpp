/******************************************************************************\
 * spawner_iface.cpp - Entry points of the external spawner interface.
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

#include "batch_spawner.hpp"

#include "scheduler/scheduler_impl/SLURM/Scheduler.hpp"
#include "spawner/BatchSpawner.hpp"

#include "useful/TaskQueue.hpp"
#include "useful/spawner_log.h"

namespace spawner {

char const*
toString(LifecycleState state)
{
    switch (state) {
        case LifecycleState::Idle:        return "idle";
        case LifecycleState::Submitting:  return "submitting";
        case LifecycleState::AwaitingRun: return "awaiting run";
        case LifecycleState::Running:     return "running";
        case LifecycleState::Stopping:    return "stopping";
    }
    return "unknown";
}

std::shared_ptr<TaskQueue>
makeSubmitQueue(size_t workers)
{
    return std::make_shared<TaskQueue>(workers);
}

std::unique_ptr<Spawner>
makeSlurmSpawner(SessionInfo session, SpawnerConfig config,
    std::shared_ptr<TaskQueue> submitQueue)
{
    getLogger().write("%s: creating %s spawner for user %s\n", __func__,
        SLURMScheduler::getName(), session.user.c_str());

    auto scheduler = std::make_unique<SLURMScheduler>(config);
    return std::make_unique<BatchSpawner>(std::move(session), std::move(config),
        std::move(scheduler), std::move(submitQueue));
}

} /* namespace spawner */
