/******************************************************************************\
 * EndpointResolver.cpp - Find the network address of a running job.
 *
 * Copyright 2021 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "spawner/EndpointResolver.hpp"
#include "spawner/spawner_error.hpp"

#include "useful/spawner_log.h"

namespace spawner {

std::string
EndpointResolver::resolve(std::string const& jobId)
{
    try {
        auto address = m_scheduler.queryHost(jobId);
        getLogger().write("job %s is reachable at %s\n", jobId.c_str(), address.c_str());
        return address;

    } catch (NotFoundError const& ex) {
        // scheduler reported RUNNING but no node, report as a resolution failure
        throw ResolutionError(ex.what());
    }
}

} /* namespace spawner */
