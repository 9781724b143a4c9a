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
 */

// common_types/Errors.hpp
#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Error kinds raised by NetSync.
 *
 * Every error derives from NetSyncError (itself a std::runtime_error) so callers can catch the
 * whole family at an API boundary. Each class keeps the identifiers that explain the failure
 * (network id, port id, zone, cluster name) next to the formatted what() message.
 *
 * Two groups exist:
 *  - reconciliation errors surfaced to callers of the ReconciliationEngine,
 *  - backend-client errors (BackendError, ResourceNotFound) raised by BackendClient
 *    implementations and translated by the engine.
 */
class NetSyncError : public std::runtime_error
{
  public:
    explicit NetSyncError(const std::string& message)
        : std::runtime_error(message)
    {
    }
};

/// Startup failure: a cluster definition or controller endpoint is malformed.
class InvalidClusterConfig : public NetSyncError
{
  public:
    InvalidClusterConfig(const std::string& clusterName, const std::string& reason)
        : NetSyncError("Invalid configuration for cluster '" + clusterName + "': " + reason),
          m_clusterName(clusterName)
    {
    }

    const std::string& clusterName() const
    {
        return m_clusterName;
    }

  private:
    std::string m_clusterName;
};

/// A resource names a failure-domain zone no configured cluster serves.
class UnknownZone : public NetSyncError
{
  public:
    explicit UnknownZone(const std::string& zoneId)
        : NetSyncError("Unable to find cluster config entry for zone: " + zoneId),
          m_zoneId(zoneId)
    {
    }

    const std::string& zoneId() const
    {
        return m_zoneId;
    }

  private:
    std::string m_zoneId;
};

class InvalidInput : public NetSyncError
{
  public:
    explicit InvalidInput(const std::string& message)
        : NetSyncError("Invalid input for operation: " + message)
    {
    }
};

class SegmentationIdInUse : public NetSyncError
{
  public:
    SegmentationIdInUse(int segmentationId, const std::string& physicalNetwork)
        : NetSyncError("Unable to create the network. The VLAN " +
                       std::to_string(segmentationId) + " on physical network " +
                       physicalNetwork + " is in use."),
          m_segmentationId(segmentationId),
          m_physicalNetwork(physicalNetwork)
    {
    }

    int segmentationId() const
    {
        return m_segmentationId;
    }

    const std::string& physicalNetwork() const
    {
        return m_physicalNetwork;
    }

  private:
    int m_segmentationId;
    std::string m_physicalNetwork;
};

/**
 * @brief No backend switch of a network has a free port slot and fragmentation is disallowed.
 *
 * Kept distinct from BackendUnavailable: the operator must raise the capacity limit or allow
 * extra switches, retrying will not help.
 */
class CapacityExhausted : public NetSyncError
{
  public:
    explicit CapacityExhausted(const std::string& networkId)
        : NetSyncError("Maximum number of logical ports reached for logical network " +
                       networkId),
          m_networkId(networkId)
    {
    }

    const std::string& networkId() const
    {
        return m_networkId;
    }

  private:
    std::string m_networkId;
};

class NetworkNotFound : public NetSyncError
{
  public:
    explicit NetworkNotFound(const std::string& networkId)
        : NetSyncError("Network " + networkId + " could not be found"),
          m_networkId(networkId)
    {
    }

    const std::string& networkId() const
    {
        return m_networkId;
    }

  private:
    std::string m_networkId;
};

class PortNotFound : public NetSyncError
{
  public:
    explicit PortNotFound(const std::string& portId)
        : NetSyncError("Port " + portId + " could not be found"),
          m_portId(portId)
    {
    }

    const std::string& portId() const
    {
        return m_portId;
    }

  private:
    std::string m_portId;
};

class NetworkInUse : public NetSyncError
{
  public:
    explicit NetworkInUse(const std::string& networkId)
        : NetSyncError("Unable to complete operation on network " + networkId +
                       ". There are one or more ports still in use on the network."),
          m_networkId(networkId)
    {
    }

    const std::string& networkId() const
    {
        return m_networkId;
    }

  private:
    std::string m_networkId;
};

class NotAuthorized : public NetSyncError
{
  public:
    explicit NotAuthorized(const std::string& action)
        : NetSyncError("Policy doesn't allow " + action + " to be performed."),
          m_action(action)
    {
    }

    const std::string& action() const
    {
        return m_action;
    }

  private:
    std::string m_action;
};

class NotSupported : public NetSyncError
{
  public:
    explicit NotSupported(const std::string& message)
        : NetSyncError(message)
    {
    }
};

/// Generic plugin-level failure wrapping a transport or query error against a controller.
class BackendUnavailable : public NetSyncError
{
  public:
    explicit BackendUnavailable(const std::string& message)
        : NetSyncError("An unexpected error occurred in the backend: " + message)
    {
    }
};

/// Raised only in strict consistency mode when a listing finds unexplained backend resources.
class OutOfSync : public NetSyncError
{
  public:
    OutOfSync(const std::string& resourceKind, std::size_t count)
        : NetSyncError("Found " + std::to_string(count) + " backend " + resourceKind +
                       " not bound to local records. Local store and controller are out of sync"),
          m_count(count)
    {
    }

    std::size_t count() const
    {
        return m_count;
    }

  private:
    std::size_t m_count;
};

/**
 * @brief Transport-level failure of a controller request.
 *
 * status() is the HTTP status when the controller answered, 0 when no answer was obtained.
 */
class BackendError : public NetSyncError
{
  public:
    BackendError(const std::string& message, int status = 0)
        : NetSyncError(message),
          m_status(status)
    {
    }

    int status() const
    {
        return m_status;
    }

  private:
    int m_status;
};

/// The controller answered that the addressed resource does not exist.
class ResourceNotFound : public BackendError
{
  public:
    explicit ResourceNotFound(const std::string& path)
        : BackendError("Resource not found on controller: " + path, 404),
          m_path(path)
    {
    }

    const std::string& path() const
    {
        return m_path;
    }

  private:
    std::string m_path;
};
