/******************************************************************************\
 * SpawnerConfig.cpp - Default spawner settings and their environment overrides.
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

#include <errno.h>
#include <stdlib.h>
#include <unistd.h>

#include <stdexcept>
#include <string>

#include "batch_spawner.hpp"

#include "useful/spawner_wrappers.hpp"

namespace spawner {

// Parse a positive integer setting. Throws if the variable is set to
// anything else.
static unsigned long
getPositiveEnv(char const* envVar, unsigned long defaultValue)
{
    auto const value = ::getenv(envVar);
    if (value == nullptr) {
        return defaultValue;
    }

    errno = 0;
    char* end = nullptr;
    auto const result = ::strtoul(value, &end, 10);
    if ((errno != 0) || (end == value) || (*end != '\0') || (result == 0)
     || (std::string{value}.find('-') != std::string::npos)) {
        throw std::runtime_error(std::string{"Bad value for environment variable "} + envVar
            + ": \"" + value + "\" (expected a positive integer)");
    }

    return result;
}

static std::string
getNonEmptyEnv(char const* envVar, std::string const& defaultValue)
{
    auto const value = getenvOrDefault(envVar, defaultValue);
    if (value.empty()) {
        throw std::runtime_error(std::string{"Environment variable "} + envVar + " is set but empty");
    }
    return value;
}

SpawnerConfig::SpawnerConfig()
    : partition{SLURM_DEFAULT_PARTITION}
    , memory{SLURM_DEFAULT_MEMORY}
    , hours{SLURM_DEFAULT_HOURS}
    , pollAttempts{DEFAULT_POLL_ATTEMPTS}
    , pollInterval{std::chrono::seconds{DEFAULT_POLL_INTERVAL_SEC}}
    , commandTimeout{std::chrono::seconds{DEFAULT_CMD_TIMEOUT_SEC}}
    , sbatchPath{SBATCH}
    , squeuePath{SQUEUE}
    , scancelPath{SCANCEL}
    , scontrolPath{SCONTROL}
    , hostPath{HOST_LOOKUP}
{}

SpawnerConfig
SpawnerConfig::fromEnvironment()
{
    auto config = SpawnerConfig{};

    // Resource hints
    config.partition = getNonEmptyEnv(SPAWNER_PARTITION_ENV_VAR, config.partition);
    config.memory = std::to_string(getPositiveEnv(SPAWNER_MEMORY_ENV_VAR, std::stoul(config.memory)));
    config.hours = std::to_string(getPositiveEnv(SPAWNER_HOURS_ENV_VAR, std::stoul(config.hours)));

    // Poll policy
    config.pollAttempts = static_cast<unsigned>(
        getPositiveEnv(SPAWNER_POLL_ATTEMPTS_ENV_VAR, config.pollAttempts));
    config.pollInterval = std::chrono::seconds(
        getPositiveEnv(SPAWNER_POLL_INTERVAL_ENV_VAR, DEFAULT_POLL_INTERVAL_SEC));
    config.commandTimeout = std::chrono::seconds(
        getPositiveEnv(SPAWNER_CMD_TIMEOUT_ENV_VAR, DEFAULT_CMD_TIMEOUT_SEC));

    // Scheduler binaries
    config.sbatchPath   = getNonEmptyEnv(SPAWNER_SBATCH_ENV_VAR,   config.sbatchPath);
    config.squeuePath   = getNonEmptyEnv(SPAWNER_SQUEUE_ENV_VAR,   config.squeuePath);
    config.scancelPath  = getNonEmptyEnv(SPAWNER_SCANCEL_ENV_VAR,  config.scancelPath);
    config.scontrolPath = getNonEmptyEnv(SPAWNER_SCONTROL_ENV_VAR, config.scontrolPath);
    config.hostPath     = getNonEmptyEnv(SPAWNER_HOST_ENV_VAR,     config.hostPath);

    // Log directory must be usable if set
    if (auto const logDir = ::getenv(SPAWNER_LOG_DIR_ENV_VAR)) {
        if (!dirHasPerms(logDir, R_OK | W_OK | X_OK)) {
            throw std::runtime_error(std::string{"Bad directory specified by environment variable "} + SPAWNER_LOG_DIR_ENV_VAR);
        }
    }

    return config;
}

} /* namespace spawner */
