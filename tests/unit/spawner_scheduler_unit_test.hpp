/******************************************************************************\
 * spawner_scheduler_unit_test.hpp - Scheduler client unit tests
 *
 * Copyright 2020 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <memory>
#include <string>

#include "batch_spawner.hpp"

#include "scheduler/JobScript.hpp"
#include "scheduler/Scheduler.hpp"
#include "scheduler/scheduler_impl/SLURM/Scheduler.hpp"

// include google testing files
#include "gmock/gmock.h"
#include "gtest/gtest.h"

// The fixture for testing the SLURM client against stand-in scheduler commands.
// Each command is a small shell script in a temporary directory that records
// its arguments and standard input there.
class SLURMSchedulerUnitTest : public ::testing::Test
{
protected: // variables
    std::string const fakeDir;
    spawner::SpawnerConfig config;

protected: // interface
    SLURMSchedulerUnitTest();
    ~SLURMSchedulerUnitTest();

    // (re)write a stand-in command with the given script body
    std::string writeCommand(std::string const& name, std::string const& body);

    // contents of a file in the stand-in directory, or empty
    std::string readFile(std::string const& name) const;

    std::unique_ptr<SLURMScheduler> makeScheduler() const;
};

// Fixture for the job script renderer
class JobScriptUnitTest : public ::testing::Test
{
protected: // variables
    spawner::SubmissionRequest request;

protected: // interface
    JobScriptUnitTest();
    ~JobScriptUnitTest();
};
