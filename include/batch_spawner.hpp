/******************************************************************************\
 * batch_spawner.hpp - External interface for launching, tracking and stopping
 *                     a single server process as a batch scheduler job.
 *
 * Copyright 2014-2023 Hewlett Packard Enterprise Development LP.
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
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spawner {

/*
 * Types used by the interface
 */

// Where the session manager can reach the spawned server. The port is chosen
// by the session manager before submission; the host is only known once the
// job is running.
struct EndpointAddress {
    std::string host;
    int         port;
};

enum class PollStatus
    { Alive      // job is pending or running
    , NotRunning // job is gone, or was never submitted
};

enum class LifecycleState
    { Idle
    , Submitting
    , AwaitingRun
    , Running
    , Stopping
};

char const* toString(LifecycleState state);

// Supplied by the session manager for each session
struct SessionInfo {
    std::string user;                       // owner of the job
    int         port;                       // port the server will listen on
    std::string command;                    // may begin with `export NAME=value;` statements
    std::vector<std::string> args;          // appended to command, shell quoted
    std::map<std::string, std::string> env; // exported in the job script (auth token etc.)
    std::string workdir;                    // defaults to /home/<user>
};

// Resource hints, poll policy and scheduler binaries. Defaults can be
// overridden through SPAWNER_* environment variables with fromEnvironment().
struct SpawnerConfig {
    std::string partition;
    std::string memory;
    std::string hours;

    unsigned                  pollAttempts;
    std::chrono::milliseconds pollInterval;
    std::chrono::milliseconds commandTimeout;

    std::string sbatchPath;
    std::string squeuePath;
    std::string scancelPath;
    std::string scontrolPath;
    std::string hostPath;

    SpawnerConfig();

    // Throws std::runtime_error if a variable is set to an invalid value
    static SpawnerConfig fromEnvironment();
};

/*
 * The Spawner object is the interface the session manager holds for each
 * session. None of its operations throw: failures are reported through the
 * return value, errorString() and the log.
 */
class Spawner {
public: // types
    using StartResult = std::optional<EndpointAddress>;

public: // interface
    // Submit the job and wait for it to run. The future holds the server
    // endpoint, or is empty if the job failed to start.
    virtual std::shared_future<StartResult> start() = 0;

    // Check whether the job is still pending or running
    virtual PollStatus poll() = 0;

    // Cancel the job. If `now` is set, kill it without a grace period.
    virtual void stop(bool now) = 0;

    // Persist / restore the job identifier across session manager restarts.
    // The blob is a JSON object.
    virtual void loadState(std::string const& blob) = 0;
    virtual std::string getState() const = 0;
    virtual void clearState() = 0;

    // Description of the most recent failure
    virtual std::string errorString() const = 0;

    virtual LifecycleState lifecycleState() const = 0;
    virtual std::string jobId() const = 0;

public: // constructor / destructor interface
    Spawner() = default;
    virtual ~Spawner() = default;
    Spawner(const Spawner&) = delete;
    Spawner& operator=(const Spawner&) = delete;
    Spawner(Spawner&&) = delete;
    Spawner& operator=(Spawner&&) = delete;
};

// Forward declarations
class TaskQueue;

// Create the process-wide queue that serializes job submissions. It should be
// shared by every Spawner in the process.
std::shared_ptr<TaskQueue> makeSubmitQueue(size_t workers = 1);

// Create a Spawner that runs sessions as SLURM batch jobs
std::unique_ptr<Spawner> makeSlurmSpawner(SessionInfo session, SpawnerConfig config,
    std::shared_ptr<TaskQueue> submitQueue);

} /* namespace spawner */
