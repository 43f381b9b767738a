/******************************************************************************\
 * spawner_useful_unit_test.hpp - Unit tests for the spawner helpers
 *
 * Copyright 2019-2020 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <unistd.h>
#include <stdio.h>

#include <memory>
#include <string>
#include <vector>

#include "batch_spawner.hpp"

#include "spawner/JobIdStore.hpp"

#include "useful/TaskQueue.hpp"
#include "useful/spawner_argv.hpp"
#include "useful/spawner_execvp.hpp"
#include "useful/spawner_log.h"
#include "useful/spawner_split.hpp"
#include "useful/spawner_wrappers.hpp"

// include google testing files
#include "gmock/gmock.h"
#include "gtest/gtest.h"

// the fixture for unit testing the helper layer
class SpawnerUsefulUnitTest : public ::testing::Test
{
protected:
    SpawnerUsefulUnitTest();
    ~SpawnerUsefulUnitTest();
};

// the fixture for configuration tests, restores the environment it changes
class SpawnerConfigUnitTest : public ::testing::Test
{
protected: // variables
    std::vector<std::string> m_setVars;

protected: // interface
    void setVar(char const* name, char const* value);

    SpawnerConfigUnitTest();
    ~SpawnerConfigUnitTest();
};
