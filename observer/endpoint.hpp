#pragma once

#include <map>
#include <sstream>
#include <string>
#include <vector>
#include <stddef.h>

#include <stout/json.hpp>

namespace observer {

  /**
   * The container-specific attributes of a discovered endpoint. Two endpoints with the same ID
   * but different details are reported as a change.
   */
  class EndpointDetails {
   public:
    EndpointDetails()
      : port(0), alternate_port(0) { }

    /**
     * Returns the details as a JSON object, for consumers which want to introspect endpoints
     * generically (eg to evaluate rules against them). Labels are nested under "labels", and
     * only present when label propagation is enabled.
     */
    JSON::Object env() const;

    bool operator==(const EndpointDetails& other) const {
      return port == other.port
        && alternate_port == other.alternate_port
        && container_id == other.container_id
        && name == other.name
        && image == other.image
        && tag == other.tag
        && command == other.command
        && host == other.host
        && transport == other.transport
        && labels == other.labels;
    }
    bool operator!=(const EndpointDetails& other) const {
      return !(*this == other);
    }

    std::string name;
    std::string image;
    std::string tag;
    size_t port;
    // The other side of the port mapping: the host port when 'port' is the container port and
    // vice versa. 0 if the port isn't published.
    size_t alternate_port;
    std::string command;
    std::string container_id;
    std::string host;
    std::string transport;
    std::map<std::string, std::string> labels;
  };

  /**
   * A network-reachable target hosted by a container. Endpoints are snapshots: an endpoint whose
   * details change is replaced by a new value with the same id.
   */
  class Endpoint {
   public:
    Endpoint(const std::string& id, const std::string& target, const EndpointDetails& details)
      : id(id), target(target), details(details) { }

    std::string string() const {
      std::ostringstream oss;
      oss << id << "=>" << target;
      return oss.str();
    }

    bool operator==(const Endpoint& other) const {
      return id == other.id && target == other.target && details == other.details;
    }

    // Stable across cycles: derived from the container id and port only.
    std::string id;
    // host:port, with ipv6 hosts in brackets.
    std::string target;
    EndpointDetails details;
  };

  typedef std::map<std::string, Endpoint> endpoint_map;

  /**
   * The difference between two endpoint snapshots. Each list is ordered by endpoint id.
   */
  class EndpointDiff {
   public:
    bool empty() const {
      return added.empty() && removed.empty() && changed.empty();
    }

    std::string string() const {
      std::ostringstream oss;
      oss << "added[" << added.size() << "] "
          << "removed[" << removed.size() << "] "
          << "changed[" << changed.size() << "]";
      return oss.str();
    }

    // New endpoints, with their current values.
    std::vector<Endpoint> added;
    // Endpoints which are no longer present, with their last known values.
    std::vector<Endpoint> removed;
    // Endpoints whose details differ, with their current values.
    std::vector<Endpoint> changed;
  };

}
