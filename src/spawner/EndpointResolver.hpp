/******************************************************************************\
 * EndpointResolver.hpp - Find the network address of a running job.
 *
 * Copyright 2021 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>

#include "scheduler/Scheduler.hpp"

namespace spawner {

class EndpointResolver {
private: // variables
    Scheduler& m_scheduler;

public: // interface
    // Address of the node running jobId. Throws ResolutionError if the job
    // has no node or the node name does not resolve.
    std::string resolve(std::string const& jobId);

public: // constructor / destructor interface
    explicit EndpointResolver(Scheduler& scheduler)
        : m_scheduler{scheduler}
    {}
};

} /* namespace spawner */
