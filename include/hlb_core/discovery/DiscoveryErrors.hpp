/*
 * Copyright (c) 2025-present
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * The HybridLB Authors and Contributors.
 */

#pragma once

#include "utils/Utils.hpp"
#include <boost/system/error_code.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace discovery
{

// Base for failures that end a discovery pass without a controller
class DiscoveryError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// Nothing to scan: no private local address and the expected network disabled
class NoCandidatesError : public DiscoveryError
{
  public:
    NoCandidatesError()
        : DiscoveryError("No candidate networks to scan: no private IPv4 address is bound "
                         "and the expected network is disabled. Provide --controller-ip.")
    {
    }
};

/**
 * @brief Every candidate subnet was scanned and none returned a valid payload.
 */
class DiscoveryExhaustedError : public DiscoveryError
{
  public:
    DiscoveryExhaustedError(std::vector<std::string> attempted, uint16_t port)
        : DiscoveryError("Controller discovery failed on port " + std::to_string(port) +
                         "; scanned: " + utils::join(attempted) +
                         ". Provide --controller-ip or verify the controller REST endpoint "
                         "is reachable."),
          m_attempted(std::move(attempted))
    {
    }

    const std::vector<std::string>& attemptedNetworks() const
    {
        return m_attempted;
    }

  private:
    std::vector<std::string> m_attempted;
};

// Probing could not run at all (sockets or memory exhausted)
class DiscoveryResourceError : public DiscoveryError
{
  public:
    DiscoveryResourceError(const std::string& network, const boost::system::error_code& ec)
        : DiscoveryError("Cannot scan " + network + ": " + ec.message()),
          m_code(ec)
    {
    }

    const boost::system::error_code& code() const
    {
        return m_code;
    }

  private:
    boost::system::error_code m_code;
};

} // namespace discovery
