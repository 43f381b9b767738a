/******************************************************************************\
 * spawner_useful_unit_test.cpp - Unit tests for the spawner helpers
 *
 * Copyright 2019-2020 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "spawner_defs.h"
#include "spawner_argv_defs.hpp"

#include <stdlib.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <thread>

#include "spawner_useful_unit_test.hpp"

using ::testing::HasSubstr;
using ::testing::EndsWith;

SpawnerUsefulUnitTest::SpawnerUsefulUnitTest()
{
}

SpawnerUsefulUnitTest::~SpawnerUsefulUnitTest()
{
}

/******************************************
*             SPLIT TESTS                 *
******************************************/

TEST_F(SpawnerUsefulUnitTest, split_removeLeadingWhitespace)
{
    EXPECT_EQ(spawner::split::removeLeadingWhitespace("  RUNNING\n"), "RUNNING");
    EXPECT_EQ(spawner::split::removeLeadingWhitespace("\t\n "), "");
    EXPECT_EQ(spawner::split::removeLeadingWhitespace("a b"), "a b");
}

TEST_F(SpawnerUsefulUnitTest, split_first)
{
    auto const [head, rest] = spawner::split::first("export X=1;run.sh;other", ';');
    EXPECT_EQ(head, "export X=1");
    EXPECT_EQ(rest, "run.sh;other");

    auto const [whole, empty] = spawner::split::first("run.sh", ';');
    EXPECT_EQ(whole, "run.sh");
    EXPECT_EQ(empty, "");
}

TEST_F(SpawnerUsefulUnitTest, split_lastToken)
{
    EXPECT_EQ(spawner::split::lastToken("Submitted batch job 4242\n"), "4242");
    EXPECT_EQ(spawner::split::lastToken("4242"), "4242");
    EXPECT_EQ(spawner::split::lastToken("   "), "");
}

TEST_F(SpawnerUsefulUnitTest, shellQuote)
{
    EXPECT_EQ(spawner::shellQuote("plain"), "'plain'");
    EXPECT_EQ(spawner::shellQuote("two words"), "'two words'");
    EXPECT_EQ(spawner::shellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(spawner::shellQuote(""), "''");
}

/******************************************
*             ARGV TESTS                  *
******************************************/

TEST_F(SpawnerUsefulUnitTest, argv_ManagedArgv)
{
    auto argv = spawner::ManagedArgv{"squeue", "-h"};
    argv.add("-j");
    argv.add(std::string{"4242"});
    argv.add(std::vector<std::string>{"-o", "%T"});

    EXPECT_EQ(argv.size(), 7u);
    EXPECT_EQ(argv.binary(), "squeue");
    EXPECT_STREQ(argv.get()[4], "-o");
    EXPECT_EQ(argv.get()[6], nullptr);
    EXPECT_EQ(argv.string(), "squeue \"-h\" \"-j\" \"4242\" \"-o\" \"%T\"");

    EXPECT_THROW(argv.add(static_cast<char const*>(nullptr)), std::logic_error);

    // moved-from array is empty but still terminated
    auto moved = std::move(argv);
    EXPECT_EQ(moved.binary(), "squeue");
    EXPECT_EQ(argv.size(), 1u);
    EXPECT_EQ(argv.binary(), "");
}

TEST_F(SpawnerUsefulUnitTest, argv_IncomingArgv)
{
    char arg0[] = "start", arg1[] = "--user=alice", arg2[] = "-p", arg3[] = "8888",
        arg4[] = "--env=A=B", arg5[] = "--", arg6[] = "run.sh", arg7[] = "--flag";
    char* rawArgv[] = { arg0, arg1, arg2, arg3, arg4, arg5, arg6, arg7, nullptr };

    auto incomingArgv = spawner::IncomingArgv<BatchSpawnerArgv>{8, rawArgv};
    auto results = std::vector<std::pair<int, std::string>>{};
    while (true) {
        auto const next = incomingArgv.get_next();
        if (next.first < 0) {
            break;
        }
        results.push_back(next);
    }

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0], std::make_pair(int{BatchSpawnerArgv::User.val}, std::string{"alice"}));
    EXPECT_EQ(results[1], std::make_pair(int{BatchSpawnerArgv::Port.val}, std::string{"8888"}));
    EXPECT_EQ(results[2], std::make_pair(int{BatchSpawnerArgv::EnvVariable.val}, std::string{"A=B"}));

    EXPECT_EQ(incomingArgv.get_rest(), (std::vector<std::string>{"run.sh", "--flag"}));
}

TEST_F(SpawnerUsefulUnitTest, argv_splitEnvString)
{
    EXPECT_EQ(spawner::splitEnvString("A=B=C"), std::make_pair(std::string{"A"}, std::string{"B=C"}));
    EXPECT_EQ(spawner::splitEnvString("A="), std::make_pair(std::string{"A"}, std::string{""}));
    EXPECT_THROW(spawner::splitEnvString("NOEQUALS"), std::runtime_error);
    EXPECT_THROW(spawner::splitEnvString("=value"), std::runtime_error);
}

/******************************************
*             EXECVP TESTS                *
******************************************/

TEST_F(SpawnerUsefulUnitTest, execvp_Pipe)
{
    auto testpipe = spawner::Pipe{};
    ASSERT_NE(-1, testpipe.getReadFd());
    ASSERT_NE(-1, testpipe.getWriteFd());

    ASSERT_NO_THROW(testpipe.closeWrite());
    ASSERT_NO_THROW(testpipe.closeRead());

    // ends cannot be closed twice
    EXPECT_THROW(testpipe.closeRead(), std::logic_error);
    EXPECT_THROW(testpipe.closeWrite(), std::logic_error);
}

TEST_F(SpawnerUsefulUnitTest, execvp_Output)
{
    auto const result = spawner::Execvp::run(spawner::ManagedArgv{"echo", "-n", "T"}, "",
        std::chrono::seconds{10});
    EXPECT_EQ(result.output, "T");
    EXPECT_EQ(result.exitStatus, 0);
    EXPECT_FALSE(result.timedOut);
}

TEST_F(SpawnerUsefulUnitTest, execvp_Input)
{
    auto const input = std::string(100000, 'x') + "\nend\n";
    auto const result = spawner::Execvp::run(spawner::ManagedArgv{"cat"}, input,
        std::chrono::seconds{10});
    EXPECT_EQ(result.output, input);
    EXPECT_EQ(result.exitStatus, 0);
}

TEST_F(SpawnerUsefulUnitTest, execvp_Failure)
{
    // missing binary
    auto const missing = spawner::Execvp::run(spawner::ManagedArgv{"/this/will/fail"}, "",
        std::chrono::seconds{10});
    EXPECT_EQ(missing.exitStatus, 127);
    EXPECT_EQ(missing.output, "");

    // non-zero exit, stderr is discarded by default
    auto const failed = spawner::Execvp::run(spawner::ManagedArgv{"sh", "-c", "echo oops >&2; exit 3"}, "",
        std::chrono::seconds{10});
    EXPECT_EQ(failed.exitStatus, 3);
    EXPECT_EQ(failed.output, "");

    auto const piped = spawner::Execvp::run(spawner::ManagedArgv{"sh", "-c", "echo oops >&2"}, "",
        std::chrono::seconds{10}, spawner::Execvp::Stderr::Pipe);
    EXPECT_EQ(piped.output, "oops\n");

    EXPECT_THROW(spawner::Execvp::run(spawner::ManagedArgv{}, "", std::chrono::seconds{10}), std::logic_error);
}

TEST_F(SpawnerUsefulUnitTest, execvp_Timeout)
{
    auto const start = std::chrono::steady_clock::now();
    auto const result = spawner::Execvp::run(spawner::ManagedArgv{"sleep", "30"}, "",
        std::chrono::milliseconds{200});
    EXPECT_TRUE(result.timedOut);
    EXPECT_EQ(result.output, "");
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{10});
}

/******************************************
*             LOG TESTS                   *
******************************************/

TEST_F(SpawnerUsefulUnitTest, log_Failure)
{
    // no log without a filename
    auto const log_fail = _spawner_create_log(nullptr, nullptr, 0);
    ASSERT_EQ(log_fail, nullptr);

    // writing to a missing log is a no-op
    EXPECT_EQ(_spawner_write_log(nullptr, "TEST"), 0);
    EXPECT_EQ(_spawner_close_log(nullptr), 0);
}

TEST_F(SpawnerUsefulUnitTest, log_Normal)
{
    auto const logDir = spawner::cstr::mkdtemp(spawner::getenvOrDefault("TMPDIR", "/tmp") + "/spawner_logXXXXXX");

    { auto logger = spawner::Logger{true, logDir, "test_log", 0};
        ASSERT_TRUE(logger.enabled());
        logger.write("job %s state %s\n", "4242", "RUNNING");
    }

    auto const logPath = logDir + "/test_log.0.log";
    auto check = std::ifstream{logPath};
    ASSERT_TRUE(check.is_open()) << "Log file not created at " << logPath;

    auto res = std::string{};
    std::getline(check, res);
    EXPECT_THAT(res, EndsWith("job 4242 state RUNNING"));

    ::unlink(logPath.c_str());
    ::rmdir(logDir.c_str());
}

TEST_F(SpawnerUsefulUnitTest, log_Disabled)
{
    auto logger = spawner::Logger{false, "", "test_log", 0};
    EXPECT_FALSE(logger.enabled());
    EXPECT_NO_THROW(logger.write("ignored %d\n", 1));
}

/******************************************
*             TASK QUEUE TESTS            *
******************************************/

TEST_F(SpawnerUsefulUnitTest, taskQueue_Results)
{
    auto queue = spawner::TaskQueue{1};
    EXPECT_EQ(queue.workerCount(), 1u);

    auto first = queue.enqueue([]() { return 1; });
    auto second = queue.enqueue([]() { return std::string{"two"}; });
    EXPECT_EQ(first.get(), 1);
    EXPECT_EQ(second.get(), "two");
}

TEST_F(SpawnerUsefulUnitTest, taskQueue_Exception)
{
    auto queue = spawner::TaskQueue{1};
    auto failed = queue.enqueue([]() -> std::string {
        throw std::runtime_error("submission failed");
    });
    EXPECT_THROW(failed.get(), std::runtime_error);

    // worker survives
    EXPECT_EQ(queue.enqueue([]() { return 3; }).get(), 3);
}

// a single worker never runs two tasks at once
TEST_F(SpawnerUsefulUnitTest, taskQueue_Serialized)
{
    auto queue = spawner::TaskQueue{1};
    auto running = std::atomic<int>{0};
    auto maxRunning = std::atomic<int>{0};

    auto results = std::vector<std::future<void>>{};
    for (int i = 0; i < 8; ++i) {
        results.push_back(queue.enqueue([&]() {
            auto const now = ++running;
            auto seen = maxRunning.load();
            while ((now > seen) && !maxRunning.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds{5});
            --running;
        }));
    }
    for (auto&& result : results) {
        result.get();
    }

    EXPECT_EQ(maxRunning.load(), 1);
}

TEST_F(SpawnerUsefulUnitTest, taskQueue_Shutdown)
{
    EXPECT_THROW(spawner::TaskQueue{0}, std::invalid_argument);

    auto queue = spawner::TaskQueue{2};
    auto pending = queue.enqueue([]() {
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
        return 5;
    });

    // queued work still completes
    queue.shutdown();
    EXPECT_EQ(pending.get(), 5);
    EXPECT_THROW(queue.enqueue([]() { return 0; }), std::runtime_error);
}

/******************************************
*             STATE BLOB TESTS            *
******************************************/

TEST_F(SpawnerUsefulUnitTest, jobIdStore_Serialize)
{
    auto store = spawner::JobIdStore{};
    EXPECT_TRUE(store.empty());
    EXPECT_EQ(store.serialize(), "{}");

    store.set("4242");
    EXPECT_EQ(store.serialize(), "{\"job_id\":\"4242\"}");

    store.clear();
    EXPECT_EQ(store.serialize().find("job_id"), std::string::npos);
}

TEST_F(SpawnerUsefulUnitTest, jobIdStore_Deserialize)
{
    auto store = spawner::JobIdStore{};
    store.deserialize("{\"job_id\":\"4242\",\"other\":1}");
    EXPECT_EQ(store.get(), "4242");

    store.deserialize("{}");
    EXPECT_TRUE(store.empty());

    store.set("4242");
    store.deserialize("");
    EXPECT_TRUE(store.empty());

    store.set("4242");
    EXPECT_THROW(store.deserialize("{\"job_id\":"), std::runtime_error);
    EXPECT_TRUE(store.empty());
}

/******************************************
*             CONFIG TESTS                *
******************************************/

SpawnerConfigUnitTest::SpawnerConfigUnitTest()
    : m_setVars{}
{}

SpawnerConfigUnitTest::~SpawnerConfigUnitTest()
{
    for (auto&& name : m_setVars) {
        ::unsetenv(name.c_str());
    }
}

void
SpawnerConfigUnitTest::setVar(char const* name, char const* value)
{
    ::setenv(name, value, 1);
    m_setVars.emplace_back(name);
}

TEST_F(SpawnerConfigUnitTest, Defaults)
{
    auto const config = spawner::SpawnerConfig::fromEnvironment();
    EXPECT_EQ(config.partition, "all");
    EXPECT_EQ(config.memory, "200");
    EXPECT_EQ(config.hours, "2");
    EXPECT_EQ(config.pollAttempts, 15u);
    EXPECT_EQ(config.pollInterval, std::chrono::seconds{1});
    EXPECT_EQ(config.commandTimeout, std::chrono::seconds{30});
    EXPECT_EQ(config.sbatchPath, "sbatch");
    EXPECT_EQ(config.squeuePath, "squeue");
    EXPECT_EQ(config.scancelPath, "scancel");
    EXPECT_EQ(config.scontrolPath, "scontrol");
    EXPECT_EQ(config.hostPath, "host");
}

TEST_F(SpawnerConfigUnitTest, Overrides)
{
    setVar(SPAWNER_PARTITION_ENV_VAR, "gpu");
    setVar(SPAWNER_MEMORY_ENV_VAR, "4000");
    setVar(SPAWNER_HOURS_ENV_VAR, "4");
    setVar(SPAWNER_POLL_ATTEMPTS_ENV_VAR, "60");
    setVar(SPAWNER_POLL_INTERVAL_ENV_VAR, "5");
    setVar(SPAWNER_CMD_TIMEOUT_ENV_VAR, "120");
    setVar(SPAWNER_SQUEUE_ENV_VAR, "/opt/slurm/bin/squeue");

    auto const config = spawner::SpawnerConfig::fromEnvironment();
    EXPECT_EQ(config.partition, "gpu");
    EXPECT_EQ(config.memory, "4000");
    EXPECT_EQ(config.hours, "4");
    EXPECT_EQ(config.pollAttempts, 60u);
    EXPECT_EQ(config.pollInterval, std::chrono::seconds{5});
    EXPECT_EQ(config.commandTimeout, std::chrono::seconds{120});
    EXPECT_EQ(config.squeuePath, "/opt/slurm/bin/squeue");
}

TEST_F(SpawnerConfigUnitTest, Invalid)
{
    setVar(SPAWNER_POLL_ATTEMPTS_ENV_VAR, "0");
    try {
        spawner::SpawnerConfig::fromEnvironment();
        FAIL() << "zero poll attempts accepted";
    } catch (std::runtime_error const& ex) {
        EXPECT_THAT(ex.what(), HasSubstr(SPAWNER_POLL_ATTEMPTS_ENV_VAR));
    }

    setVar(SPAWNER_POLL_ATTEMPTS_ENV_VAR, "15");
    setVar(SPAWNER_MEMORY_ENV_VAR, "lots");
    EXPECT_THROW(spawner::SpawnerConfig::fromEnvironment(), std::runtime_error);

    setVar(SPAWNER_MEMORY_ENV_VAR, "-5");
    EXPECT_THROW(spawner::SpawnerConfig::fromEnvironment(), std::runtime_error);

    setVar(SPAWNER_MEMORY_ENV_VAR, "200");
    setVar(SPAWNER_PARTITION_ENV_VAR, "");
    EXPECT_THROW(spawner::SpawnerConfig::fromEnvironment(), std::runtime_error);

    setVar(SPAWNER_PARTITION_ENV_VAR, "all");
    setVar(SPAWNER_LOG_DIR_ENV_VAR, "/this/does/not/exist");
    EXPECT_THROW(spawner::SpawnerConfig::fromEnvironment(), std::runtime_error);
}
