/*********************************************************************************\
 * spawner_log.h - Header file for the log interface.
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

#ifndef _SPAWNER_LOG_H
#define _SPAWNER_LOG_H

#include <stdarg.h>
#include <stdio.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef FILE spawner_log_t;

// create a new logfile in directory with format <filename>.<suffix>.log
// if directory is NULL, log lines are written to stderr instead
spawner_log_t* _spawner_create_log(char const *directory, char const* filename, int suffix);

// finalize log and close its file (if nonnull)
int _spawner_close_log(spawner_log_t* log_file);

// write the given formatted string to the log file (if nonnull), prefixed with a timestamp
int _spawner_write_log(spawner_log_t* log_file, const char *fmt, ...);

#ifdef __cplusplus
}

#include <string>
#include <memory>
#include <utility>

namespace spawner {

class Logger
{
private: // types
    using LogPtr = std::unique_ptr<spawner_log_t, int(*)(spawner_log_t*)>;

private: // variables
    LogPtr logFile;

public: // interface
    Logger(bool enable, std::string const& directory, std::string const& filename, int suffix) : logFile{nullptr, _spawner_close_log}
    {
        // determine if logging mode is enabled
        if (enable) {
            char const *dir = nullptr;
            if (!directory.empty()) {
                dir = directory.c_str();
            }
            logFile = LogPtr{_spawner_create_log(dir, filename.c_str(), suffix), _spawner_close_log};
        }
    }

    bool enabled() const { return logFile != nullptr; }

    template <typename... Args>
    void write(char const* fmt, Args&&... args)
    {
        if (logFile) {
            _spawner_write_log(logFile.get(), fmt, std::forward<Args>(args)...);
        }
    }

    // warnings are always shown to the user, and also recorded in the log
    template <typename... Args>
    void warn(char const* fmt, Args... args)
    {
        auto const warnFmt = std::string{"warning: "} + fmt;
        if (logFile.get() != stderr) {
            fprintf(stderr, warnFmt.c_str(), args...);
        }
        write(warnFmt.c_str(), args...);
    }
};

// Process-wide logger, configured from SPAWNER_DBG / SPAWNER_LOG_DIR on first use
Logger& getLogger();

} /* namespace spawner */

#endif /* __cplusplus */

#endif /* _SPAWNER_LOG_H */
