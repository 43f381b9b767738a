/*********************************************************************************\
 * spawner_execvp.hpp - fork / execvp a program with a deadline and collect its output
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
#pragma once

#include <unistd.h>
#include <sys/wait.h>
#include <sys/types.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <errno.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include "useful/spawner_argv.hpp"
#include "useful/spawner_wrappers.hpp"

namespace spawner {

class FdPair {
protected:
    enum Ends { ReadEnd = 0, WriteEnd = 1 };
    bool readOpened = false;
    bool writeOpened = false;

    int fds[2];

public:
    FdPair()
        : readOpened{false}
        , writeOpened{false}
        , fds{-1, -1}
    {}

    ~FdPair() {
        if (readOpened) {
            close(fds[ReadEnd]);
        }

        if (writeOpened) {
            close(fds[WriteEnd]);
        }
    }

    FdPair(FdPair const&) = delete;
    FdPair& operator=(FdPair const&) = delete;

    void closeRead() {
        if (!readOpened) {
            throw std::logic_error("Already closed read end");
        }

        close(fds[ReadEnd]);
        readOpened = false;
    }

    void closeWrite() {
        if (!writeOpened) {
            throw std::logic_error("Already closed write end");
        }

        close(fds[WriteEnd]);
        writeOpened = false;
    }

    int getReadFd() const { return fds[ReadEnd]; }
    int getWriteFd() const { return fds[WriteEnd]; }

    /* Pipe - create and track closed ends of pipe */
    void pipe(int flags = 0)
    {
        if (readOpened || writeOpened) {
            throw std::runtime_error("read or write pipe already opened");
        }

        if (::pipe2(fds, flags)) {
            throw std::runtime_error("Pipe error: " + std::string{strerror(errno)});
        }

        readOpened = true;
        writeOpened = true;
    }
};

struct Pipe : public FdPair
{
    Pipe(int flags = 0)
        : FdPair{}
    {
        pipe(flags);
    }
};

// Outcome of a single external command. Output is empty if the command
// was killed for exceeding its deadline.
struct ExecResult {
    std::string output;
    int exitStatus;
    bool timedOut;
};

/* Execvp - fork / execvp a program, feed it standard input, and collect its output */
class Execvp {
public:
    enum class Stderr : int
        { Ignore = 0
        , Pipe = 1
    };

private:
    // Stage input in an unlinked temporary file so that the child can read
    // it at its own pace without the parent blocking on a full pipe.
    static fd_handle makeInputFd(std::string const& input)
    {
        if (input.empty()) {
            return fd_handle{::open("/dev/null", O_RDONLY | O_CLOEXEC)};
        }

        auto const pathTemplate = getenvOrDefault("TMPDIR", "/tmp") + "/spawner_stdinXXXXXX";
        auto rawPath = take_pointer_ownership(strdup(pathTemplate.c_str()), std::free);
        auto inputFd = fd_handle{::mkostemp(rawPath.get(), O_CLOEXEC)};
        ::unlink(rawPath.get());

        size_t written = 0;
        while (written < input.size()) {
            auto const rc = ::write(inputFd.fd(), input.data() + written, input.size() - written);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::runtime_error("failed to stage command input: " + std::string{strerror(errno)});
            }
            written += static_cast<size_t>(rc);
        }

        if (::lseek(inputFd.fd(), 0, SEEK_SET) < 0) {
            throw std::runtime_error("failed to rewind command input: " + std::string{strerror(errno)});
        }

        return inputFd;
    }

    // Wait for child to exit. If it is still alive at the deadline, kill it.
    static int reap(pid_t child, std::chrono::steady_clock::time_point deadline)
    {
        int status = 0;
        while (true) {
            auto const rc = ::waitpid(child, &status, WNOHANG);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw std::runtime_error("waitpid() on " + std::to_string(child) + " failed!");
            } else if (rc == child) {
                break;
            }

            if (std::chrono::steady_clock::now() >= deadline) {
                ::kill(child, SIGKILL);
                while ((::waitpid(child, &status, 0) < 0) && (errno == EINTR)) {}
                return -1;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }

        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return WEXITSTATUS(status);
    }

public:
    // Run argv to completion, or until timeout expires. Throws
    // std::runtime_error only if the child process could not be created.
    static ExecResult run(ManagedArgv const& argv, std::string const& input,
        std::chrono::milliseconds timeout, Stderr stderr_behavior = Stderr::Ignore)
    {
        auto const binary = argv.binary();
        if (binary.empty()) {
            throw std::logic_error("attempted to run an empty argument array");
        }

        auto inputFd = makeInputFd(input);
        auto outputPipe = Pipe{O_CLOEXEC};
        auto const deadline = std::chrono::steady_clock::now() + timeout;

        auto const child = ::fork();
        if (child < 0) {
            throw std::runtime_error("fork() for " + binary + " failed!");

        } else if (child == 0) { // child side of fork
            ::dup2(inputFd.fd(), STDIN_FILENO);
            ::dup2(outputPipe.getWriteFd(), STDOUT_FILENO);
            auto const stderr_fd = (stderr_behavior == Stderr::Ignore)
                ? ::open("/dev/null", O_WRONLY)
                : outputPipe.getWriteFd();
            ::dup2(stderr_fd, STDERR_FILENO);

            ::execvp(argv.get()[0], argv.get());
            ::_exit(127);
        }

        outputPipe.closeWrite();
        inputFd.reset();

        auto result = ExecResult{std::string{}, -1, false};
        char buf[4096];
        while (true) {
            auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                result.timedOut = true;
                break;
            }

            struct pollfd pfd { outputPipe.getReadFd(), POLLIN, 0 };
            auto const ready = ::poll(&pfd, 1, static_cast<int>(remaining));
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                result.timedOut = true;
                break;
            } else if (ready == 0) {
                continue;
            }

            auto const numBytesRead = ::read(outputPipe.getReadFd(), buf, sizeof(buf));
            if (numBytesRead < 0) {
                if ((errno == EINTR) || (errno == EAGAIN)) {
                    continue;
                }
                break;
            } else if (numBytesRead == 0) {
                break;
            }
            result.output.append(buf, static_cast<size_t>(numBytesRead));
        }

        if (result.timedOut) {
            ::kill(child, SIGKILL);
            result.output.clear();
        }
        result.exitStatus = reap(child, deadline);
        if (result.exitStatus < 0) {
            result.timedOut = true;
            result.output.clear();
        }

        return result;
    }
};

} /* namespace spawner */
