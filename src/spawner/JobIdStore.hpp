/******************************************************************************\
 * JobIdStore.hpp - Holds the scheduler job identifier of one session and
 *                  converts it to and from the persisted state blob.
 *
 * Copyright 2021 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>
#include <utility>

namespace spawner {

class JobIdStore {
private: // variables
    std::string m_jobId;

public: // interface
    std::string const& get() const { return m_jobId; }
    bool empty() const { return m_jobId.empty(); }

    void set(std::string jobId) { m_jobId = std::move(jobId); }
    void clear() { m_jobId.clear(); }

    // JSON object, with the identifier under "job_id" if one is held
    std::string serialize() const;

    // Replace the held identifier with the one in blob. A blob without the
    // key, or an empty blob, clears it. Throws std::runtime_error on
    // malformed JSON, leaving the store cleared.
    void deserialize(std::string const& blob);
};

} /* namespace spawner */
