#pragma once

#include <string>
#include <vector>

#include "container.hpp"
#include "endpoint.hpp"
#include "observer_config.hpp"

namespace observer {

  /**
   * Converts container records into endpoints, one per relevant port. Settings are fixed at
   * construction.
   */
  class EndpointExtractor {
   public:
    EndpointExtractor(bool use_host_bindings, bool ignore_non_host_bindings, bool propagate_labels)
      : use_host_bindings(use_host_bindings),
        ignore_non_host_bindings(ignore_non_host_bindings),
        propagate_labels(propagate_labels) { }

    explicit EndpointExtractor(const ObserverConfig& config)
      : use_host_bindings(config.use_host_bindings),
        ignore_non_host_bindings(config.ignore_non_host_bindings),
        propagate_labels(config.propagate_labels) { }

    /**
     * Returns the endpoints of the provided container, or an empty list if the container isn't
     * running or exposes no usable ports.
     */
    std::vector<Endpoint> extract(const Container& container) const;

    /**
     * Extracts the endpoints of all provided containers into a map keyed by endpoint id.
     */
    endpoint_map extract_all(const std::vector<Container>& containers) const;

    /**
     * Returns the endpoint id for a container port: "<container_id>:<port>/<transport>".
     */
    static std::string endpoint_id(
        const std::string& container_id, size_t port, const std::string& transport);

    /**
     * Returns the tag portion of an image reference, or "latest" if the reference has none.
     * Digests ("@sha256:...") are ignored, as are registry ports ("host:5000/image").
     */
    static std::string image_tag(const std::string& image);

   private:
    const bool use_host_bindings;
    const bool ignore_non_host_bindings;
    const bool propagate_labels;
  };

}
