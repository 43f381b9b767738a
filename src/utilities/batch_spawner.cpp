/******************************************************************************\
 * batch_spawner.cpp - Drive a single spawner session from the command line.
 *                     The session state blob is kept in a file between calls.
 *
 * Copyright 2021 Hewlett Packard Enterprise Development LP.
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

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>

#include "batch_spawner.hpp"

#include "spawner_argv_defs.hpp"

#include "useful/spawner_log.h"

static void
usage(char const* name)
{
    fprintf(stdout, "Usage: %s start --user=USER --port=PORT --state=FILE [--env=KEY=VALUE ...] [--workdir=DIR] -- COMMAND [ARGS...]\n", name);
    fprintf(stdout, "       %s poll  --user=USER --state=FILE\n", name);
    fprintf(stdout, "       %s stop  --user=USER --state=FILE [--now]\n", name);
    fprintf(stdout, "Run a server as a SLURM batch job and track it across invocations.\n\n");

    fprintf(stdout, "\t-%c, --%s\tUser that owns the job\n",
        BatchSpawnerArgv::User.val, BatchSpawnerArgv::User.name);
    fprintf(stdout, "\t-%c, --%s\tPort the server will listen on (start)\n",
        BatchSpawnerArgv::Port.val, BatchSpawnerArgv::Port.name);
    fprintf(stdout, "\t-%c, --%s\tFile holding the session state\n",
        BatchSpawnerArgv::StateFile.val, BatchSpawnerArgv::StateFile.name);
    fprintf(stdout, "\t-%c, --%s\tExport KEY=VALUE in the job (start, repeatable)\n",
        BatchSpawnerArgv::EnvVariable.val, BatchSpawnerArgv::EnvVariable.name);
    fprintf(stdout, "\t-%c, --%s\tWorking directory of the job (start)\n",
        BatchSpawnerArgv::Workdir.val, BatchSpawnerArgv::Workdir.name);
    fprintf(stdout, "\t-%c, --%s\tKill the job without a grace period (stop)\n",
        BatchSpawnerArgv::Now.val, BatchSpawnerArgv::Now.name);
    fprintf(stdout, "\t-%c, --%s\tDisplay this text and exit\n\n",
        BatchSpawnerArgv::Help.val, BatchSpawnerArgv::Help.name);

    fprintf(stdout, "start prints HOST:PORT once the job is running. poll exits 0 if the\n");
    fprintf(stdout, "job is pending or running, 1 otherwise.\n");
}

static std::string
readStateFile(std::string const& path)
{
    auto stateFile = std::ifstream{path};
    if (!stateFile) {
        // no state yet
        return "";
    }

    auto contents = std::stringstream{};
    contents << stateFile.rdbuf();
    return contents.str();
}

static void
writeStateFile(std::string const& path, std::string const& blob)
{
    auto stateFile = std::ofstream{path, std::ios::trunc};
    if (!stateFile) {
        throw std::runtime_error("failed to open state file " + path + ": " + strerror(errno));
    }
    stateFile << blob << "\n";
    if (!stateFile) {
        throw std::runtime_error("failed to write state file " + path);
    }
}

int
main(int argc, char *argv[])
{
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    auto const command = std::string{argv[1]};
    if ((command == "-h") || (command == "--help")) {
        usage(argv[0]);
        return 0;
    } else if ((command != "start") && (command != "poll") && (command != "stop")) {
        fprintf(stderr, "%s: unknown command '%s'\n", argv[0], command.c_str());
        usage(argv[0]);
        return 1;
    }

    auto session = spawner::SessionInfo{};
    session.port = -1;
    auto statePath = std::string{};
    auto now = false;

    // parse options following the command
    { auto incomingArgv = spawner::IncomingArgv<BatchSpawnerArgv>{argc - 1, argv + 1};
        int c; std::string optarg;
        while (true) {
            std::tie(c, optarg) = incomingArgv.get_next();
            if (c < 0) {
                break;
            }

            try {
                switch (c) {

                case BatchSpawnerArgv::User.val:
                    session.user = optarg;
                    break;

                case BatchSpawnerArgv::Port.val:
                    session.port = std::stoi(optarg);
                    break;

                case BatchSpawnerArgv::StateFile.val:
                    statePath = optarg;
                    break;

                case BatchSpawnerArgv::EnvVariable.val:
                    session.env.insert(spawner::splitEnvString(optarg));
                    break;

                case BatchSpawnerArgv::Workdir.val:
                    session.workdir = optarg;
                    break;

                case BatchSpawnerArgv::Now.val:
                    now = true;
                    break;

                case BatchSpawnerArgv::Help.val:
                    usage(argv[0]);
                    return 0;

                case '?':
                default:
                    usage(argv[0]);
                    return 1;

                }
            } catch (std::exception const& ex) {
                fprintf(stderr, "%s: invalid argument '%s': %s\n", argv[0], optarg.c_str(), ex.what());
                return 1;
            }
        }

        // remaining arguments form the server command
        auto const rest = incomingArgv.get_rest();
        if (!rest.empty()) {
            session.command = rest[0];
            session.args.assign(rest.begin() + 1, rest.end());
        }
    }

    // post-process required args to make sure we have everything we need
    if (session.user.empty() || statePath.empty()) {
        fprintf(stderr, "%s: --user and --state are required\n", argv[0]);
        usage(argv[0]);
        return 1;
    }
    if ((command == "start") && ((session.port <= 0) || session.command.empty())) {
        fprintf(stderr, "%s: start requires --port and a command\n", argv[0]);
        usage(argv[0]);
        return 1;
    }

    try {
        auto const port = session.port;
        auto batchSpawner = spawner::makeSlurmSpawner(std::move(session),
            spawner::SpawnerConfig::fromEnvironment(), spawner::makeSubmitQueue());
        batchSpawner->loadState(readStateFile(statePath));

        if (command == "start") {
            auto const endpoint = batchSpawner->start().get();
            writeStateFile(statePath, batchSpawner->getState());
            if (!endpoint) {
                fprintf(stderr, "%s\n", batchSpawner->errorString().c_str());
                return 1;
            }
            fprintf(stdout, "%s:%d\n", endpoint->host.c_str(), port);
            return 0;

        } else if (command == "poll") {
            auto const status = batchSpawner->poll();
            writeStateFile(statePath, batchSpawner->getState());
            return (status == spawner::PollStatus::Alive) ? 0 : 1;

        } else {
            batchSpawner->stop(now);
            writeStateFile(statePath, batchSpawner->getState());
            return 0;
        }

    } catch (std::exception const& ex) {
        fprintf(stderr, "%s: %s\n", argv[0], ex.what());
        spawner::getLogger().write("%s: %s\n", command.c_str(), ex.what());
    }

    // stop is best-effort from the caller's point of view
    return (command == "stop") ? 0 : 1;
}
