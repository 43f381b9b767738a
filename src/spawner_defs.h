/******************************************************************************\
 * spawner_defs.h - A header file for common compile time defines.
 *
 * NOTE: These defines are used throughout the internal code base and are all
 *       placed inside this file to make modifications due to scheduler
 *       changes easier.
 *
 * Copyright 2013-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#ifndef _SPAWNER_DEFS_H
#define _SPAWNER_DEFS_H

#include <limits.h>
#include <stdint.h>
#include <sys/types.h>

/*******************************************************************************
** Generic defines
*******************************************************************************/
#define SPAWNER_ERR_STR_SIZE    1024
#define DEFAULT_ERR_STR         "Unknown spawner error"
#define SPAWNER_LOG_NAME        "batch_spawner"         // log file basename, suffixed with pid

/*******************************************************************************
** Session state
*******************************************************************************/
#define STATE_JOB_ID_KEY        "job_id"                // key of the job identifier in the persisted state blob

/*******************************************************************************
** SLURM specific information
*******************************************************************************/
#define SBATCH                  "sbatch"                // name of slurm batch submission binary
#define SQUEUE                  "squeue"                // name of slurm queue query binary
#define SCANCEL                 "scancel"               // name of slurm job cancel binary
#define SCONTROL                "scontrol"              // name of slurm configuration binary
#define HOST_LOOKUP             "host"                  // name of DNS lookup binary

#define SLURM_DEFAULT_PARTITION "all"                   // default partition for spawned jobs
#define SLURM_DEFAULT_MEMORY    "200"                   // default memory request, in scheduler units
#define SLURM_DEFAULT_HOURS     "2"                     // default wall-clock limit in hours
#define SLURM_JOB_NAME          "spawner-jupyterhub"    // fixed job name of spawned jobs
#define SLURM_LOG_PATTERN       "/home/%s/jupyterhub_slurmspawner_%%j.log" // job output log, formatted with user name
#define SLURM_HOME_PATTERN      "/home/%s"              // default working directory, formatted with user name
#define SLURM_USER_ENV_MODE     "L"                     // --get-user-env mode: full login shell environment

/*******************************************************************************
** Lifecycle policy
*******************************************************************************/
#define DEFAULT_POLL_ATTEMPTS       15                  // number of state queries before start() gives up
#define DEFAULT_POLL_INTERVAL_SEC   1                   // delay between state queries
#define DEFAULT_CMD_TIMEOUT_SEC     30                  // upper bound on a single scheduler command

/*******************************************************************************
** Environment variables that are read by this library
*******************************************************************************/
#define SPAWNER_DBG_ENV_VAR             "SPAWNER_DBG"           // enable debug logging (read)
#define SPAWNER_LOG_DIR_ENV_VAR         "SPAWNER_LOG_DIR"       // directory for debug log files (read)
#define SPAWNER_PARTITION_ENV_VAR       "SPAWNER_PARTITION"     // override default partition (read)
#define SPAWNER_MEMORY_ENV_VAR          "SPAWNER_MEMORY"        // override default memory request (read)
#define SPAWNER_HOURS_ENV_VAR           "SPAWNER_HOURS"         // override default wall-clock hours (read)
#define SPAWNER_POLL_ATTEMPTS_ENV_VAR   "SPAWNER_POLL_ATTEMPTS" // override number of start() state queries (read)
#define SPAWNER_POLL_INTERVAL_ENV_VAR   "SPAWNER_POLL_INTERVAL" // override seconds between state queries (read)
#define SPAWNER_CMD_TIMEOUT_ENV_VAR     "SPAWNER_CMD_TIMEOUT"   // override scheduler command timeout in seconds (read)
#define SPAWNER_SBATCH_ENV_VAR          "SPAWNER_SBATCH"        // path to sbatch (read)
#define SPAWNER_SQUEUE_ENV_VAR          "SPAWNER_SQUEUE"        // path to squeue (read)
#define SPAWNER_SCANCEL_ENV_VAR         "SPAWNER_SCANCEL"       // path to scancel (read)
#define SPAWNER_SCONTROL_ENV_VAR        "SPAWNER_SCONTROL"      // path to scontrol (read)
#define SPAWNER_HOST_ENV_VAR            "SPAWNER_HOST"          // path to host (read)

#endif /* _SPAWNER_DEFS_H */
