/******************************************************************************\
 * JobIdStore.cpp - Session state blob encoding
 *
 * Copyright 2021 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "spawner_defs.h"

#include <sstream>
#include <stdexcept>

// Boost JSON
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

// Boost array stream
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/stream.hpp>

#include "spawner/JobIdStore.hpp"

#include "useful/spawner_split.hpp"

namespace pt = boost::property_tree;

namespace spawner {

static pt::ptree
parse_json(std::string const& json)
{
    // Create stream from string source
    auto jsonSource = boost::iostreams::array_source{json.c_str(), json.length()};
    auto jsonStream = boost::iostreams::stream<boost::iostreams::array_source>{jsonSource};

    auto root = pt::ptree{};
    try {
        pt::read_json(jsonStream, root);
    } catch (pt::json_parser::json_parser_error const& parse_ex) {
        throw std::runtime_error("failed to parse session state: " + parse_ex.message());
    }

    return root;
}

std::string
JobIdStore::serialize() const
{
    auto root = pt::ptree{};
    if (!m_jobId.empty()) {
        root.put(STATE_JOB_ID_KEY, m_jobId);
    }

    auto jsonStream = std::ostringstream{};
    pt::write_json(jsonStream, root, false);

    return split::removeLeadingWhitespace(jsonStream.str());
}

void
JobIdStore::deserialize(std::string const& blob)
{
    m_jobId.clear();

    if (split::removeLeadingWhitespace(blob).empty()) {
        return;
    }

    auto const root = parse_json(blob);
    m_jobId = root.get<std::string>(STATE_JOB_ID_KEY, "");
}

} /* namespace spawner */
