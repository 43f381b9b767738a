/******************************************************************************\
 * spawner_cli_unit_test.hpp - Command line tool unit tests
 *
 * Copyright 2020 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>
#include <vector>

#include "useful/spawner_execvp.hpp"

#include "spawner_scheduler_unit_test.hpp"

// The fixture for running the batch_spawner tool against the stand-in
// scheduler commands. The tool finds them through SPAWNER_* variables.
class BatchSpawnerCliUnitTest : public SLURMSchedulerUnitTest
{
protected: // variables
    std::string const statePath;

protected: // interface
    BatchSpawnerCliUnitTest();
    ~BatchSpawnerCliUnitTest();

    // run the tool with args, after exporting the current config
    spawner::ExecResult runTool(std::vector<std::string> const& args);
};
