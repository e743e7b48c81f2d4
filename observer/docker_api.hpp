#pragma once

#include <string>
#include <vector>
#include <stddef.h>

#include <stout/try.hpp>

#include "container.hpp"

namespace observer {
  namespace docker_api {

    namespace endpoint_scheme {
      enum Value {
        UNKNOWN,
        UNIX,
        TCP
      };
    }

    /**
     * The parsed address of a Docker engine, either "unix:///path/to/socket" or
     * "tcp://host:port".
     */
    class DockerEndpoint {
     public:
      DockerEndpoint()
        : scheme(endpoint_scheme::UNKNOWN), port(0) { }

      std::string string() const;

      endpoint_scheme::Value scheme;
      // UNIX only
      std::string path;
      // TCP only
      std::string host;
      size_t port;
    };

    Try<DockerEndpoint> parse_endpoint(const std::string& endpoint);

    /**
     * Returns the request target for listing running containers, eg "/v1.22/containers/json".
     */
    std::string containers_path(const std::string& api_version);

    /**
     * Returns the request target for streaming container lifecycle events, filtered to the
     * actions which may affect a container's endpoints.
     */
    std::string events_path(const std::string& api_version);

    /**
     * Decodes the response body of a container list request.
     */
    Try<std::vector<Container>> parse_container_list(const std::string& json);

    /**
     * Decodes a single line of the event stream. Events about objects other than containers
     * are returned as errors.
     */
    Try<ContainerEvent> parse_event(const std::string& json);

  }
}
