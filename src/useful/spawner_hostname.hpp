/******************************************************************************\
 * spawner_hostname.hpp - Resolve compute node names to network addresses
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

#include <string>
#include <stdexcept>

#include <string.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <netinet/in.h>

#include "useful/spawner_wrappers.hpp"

namespace spawner
{

// Whether address is a numeric IPv4 or IPv6 literal
static inline bool
isAddressLiteral(std::string const& address)
{
    struct in6_addr buf;
    return (::inet_pton(AF_INET, address.c_str(), &buf) == 1)
        || (::inet_pton(AF_INET6, address.c_str(), &buf) == 1);
}

static inline auto
make_addrinfo(std::string const& hostname)
{
    // Get hostname information
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo *info_ptr = nullptr;
    if (auto const rc = getaddrinfo(hostname.c_str(), nullptr, &hints, &info_ptr)) {
        throw std::runtime_error("getaddrinfo failed for " + hostname + ": " + std::string{gai_strerror(rc)});
    }
    if ( info_ptr == nullptr ) {
        throw std::runtime_error("failed to resolve hostname " + hostname);
    }
    return take_pointer_ownership(std::move(info_ptr), freeaddrinfo);
}

// Resolve a hostname to the numeric form of its first address, preferring IPv4
static inline std::string
resolveHostname(std::string const& hostname)
{
    auto const info = make_addrinfo(hostname);

    auto const* selected = info.get();
    for (auto const* ai = info.get(); ai != nullptr; ai = ai->ai_next) {
        if (ai->ai_family == AF_INET) {
            selected = ai;
            break;
        }
    }

    char address[NI_MAXHOST];
    if (auto const rc = getnameinfo(selected->ai_addr, selected->ai_addrlen,
        address, sizeof(address), nullptr, 0, NI_NUMERICHOST)) {
        throw std::runtime_error("getnameinfo failed: " + std::string{gai_strerror(rc)});
    }

    return std::string{address};
}

} // namespace spawner
