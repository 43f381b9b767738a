/*********************************************************************************\
 * spawner_log.cpp - Functions relating to creating and writing log files.
 *
 * Copyright 2011-2020 Hewlett Packard Enterprise Development LP.
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

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <errno.h>
#include <unistd.h>

#include <string>

#include "useful/spawner_log.h"
#include "useful/spawner_wrappers.hpp"

spawner_log_t*
_spawner_create_log(char const *directory, char const* filename, int suffix)
{
    if (filename == nullptr) {
        return nullptr;
    }

    if (directory == nullptr) {
        return stderr;
    }

    // <directory>/<filename>.<suffix>.log
    auto const logPath = std::string{directory} + "/" + filename + "." + std::to_string(suffix) + ".log";

    auto logFile = fopen(logPath.c_str(), "a");
    if (logFile == nullptr) {
        fprintf(stderr, "warning: failed to open log file %s: %s\n", logPath.c_str(), strerror(errno));
        return nullptr;
    }

    // lines should hit the disk even if we are killed
    setvbuf(logFile, nullptr, _IOLBF, 0);

    return logFile;
}

int
_spawner_close_log(spawner_log_t* log_file)
{
    if ((log_file == nullptr) || (log_file == stderr)) {
        return 0;
    }

    return fclose(log_file);
}

int
_spawner_write_log(spawner_log_t* log_file, const char *fmt, ...)
{
    if (log_file == nullptr) {
        return 0;
    }

    char timestamp[32];
    auto const now = time(nullptr);
    struct tm local;
    localtime_r(&now, &local);
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &local);

    va_list vargs;
    va_start(vargs, fmt);

    // keep lines from concurrent sessions intact
    flockfile(log_file);
    fprintf(log_file, "[%s] %d: ", timestamp, getpid());
    auto const rc = vfprintf(log_file, fmt, vargs);
    fflush(log_file);
    funlockfile(log_file);

    va_end(vargs);

    return rc;
}

namespace spawner {

Logger&
getLogger()
{
    static auto _logger = []() {
        auto const enable = (::getenv(SPAWNER_DBG_ENV_VAR) != nullptr);
        auto logDir = std::string{};
        if (auto const dir = ::getenv(SPAWNER_LOG_DIR_ENV_VAR)) {
            if (dirHasPerms(dir, R_OK | W_OK | X_OK)) {
                logDir = dir;
            } else {
                fprintf(stderr, "warning: ignoring inaccessible log directory %s\n", dir);
            }
        }
        return Logger{enable, logDir, SPAWNER_LOG_NAME, getpid()};
    }();
    return _logger;
}

} /* namespace spawner */
