/******************************************************************************\
 * spawner_argv_defs.hpp - A header file to define the strong argv interface
 *
 * Copyright 2018-2020 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/
#pragma once

// Strong argv defs below
#include "useful/spawner_argv.hpp"

struct BatchSpawnerArgv : public spawner::Argv {
    using Option    = spawner::Argv::Option;
    using Parameter = spawner::Argv::Parameter;

    static constexpr Option Help { "help", 'h' };
    static constexpr Option Now  { "now",  'n' };

    static constexpr Parameter User        { "user",    'u' };
    static constexpr Parameter Port        { "port",    'p' };
    static constexpr Parameter StateFile   { "state",   's' };
    static constexpr Parameter EnvVariable { "env",     'e' };
    static constexpr Parameter Workdir     { "workdir", 'w' };

    static constexpr GNUOption long_options[] = {
        Help,
        Now,
        User,
        Port,
        StateFile,
        EnvVariable,
        Workdir,
        long_options_done
    };
};
