/******************************************************************************\
 * spawner_error.hpp - Failure types raised inside the spawner. None of these
 *                     escape the public Spawner interface.
 *
 * Copyright 2020 Hewlett Packard Enterprise Development LP.
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

#include <stdexcept>
#include <string>

namespace spawner {

struct Error : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Scheduler did not hand back a usable job identifier
struct SubmissionError : public Error {
    using Error::Error;
};

// Job has no execution node assigned
struct NotFoundError : public Error {
    using Error::Error;
};

// Job is running but its node could not be turned into an address
struct ResolutionError : public Error {
    using Error::Error;
};

// Job did not reach RUNNING within the attempt cap
struct PollTimeout : public Error {
    using Error::Error;
};

// Job left the queue before it was observed running
struct JobFailed : public Error {
    using Error::Error;
};

// Cancel was issued but the job still reports alive
struct CancelUnconfirmed : public Error {
    using Error::Error;
};

// stop() was called while start() was polling
struct StartAborted : public Error {
    using Error::Error;
};

} /* namespace spawner */
