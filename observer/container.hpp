#pragma once

#include <map>
#include <sstream>
#include <string>
#include <vector>
#include <stddef.h>

namespace observer {
  /**
   * A single port exposed by a container, as reported by the container engine. A port which was
   * published on the host carries a non-zero host_port, while a port which is only exposed within
   * the container network has host_port == 0.
   */
  class PortBinding {
   public:
    PortBinding()
      : container_port(0), host_port(0) { }
    PortBinding(size_t container_port, const std::string& protocol,
        const std::string& host_ip = "", size_t host_port = 0)
      : container_port(container_port),
        protocol(protocol),
        host_ip(host_ip),
        host_port(host_port) { }

    bool published() const {
      return host_port != 0;
    }

    std::string string() const {
      std::ostringstream oss;
      oss << container_port << "/" << protocol;
      if (published()) {
        oss << "->" << host_ip << ":" << host_port;
      }
      return oss.str();
    }

    size_t container_port;
    std::string protocol;
    std::string host_ip;
    size_t host_port;
  };

  /**
   * A container record as listed by the container engine. This is consumed by the observer but
   * never modified by it.
   */
  class Container {
   public:
    Container() { }

    /**
     * Returns the first non-empty network address assigned to the container, or an empty string
     * if the container isn't attached to any network with an address.
     */
    std::string network_ip() const {
      for (auto network : network_ips) {
        if (!network.second.empty()) {
          return network.second;
        }
      }
      return "";
    }

    std::string id;
    // Without the leading slash which the engine prepends to container names.
    std::string name;
    // The image reference as the container was created with, eg "docker.io/library/nginx:1.17".
    std::string image;
    std::string command;
    // Eg "running", "paused", "exited". Empty when the engine didn't say.
    std::string state;
    std::map<std::string, std::string> labels;
    std::vector<PortBinding> ports;
    // Network name => assigned ip address.
    std::map<std::string, std::string> network_ips;
  };

  /**
   * A container lifecycle notification from the container engine's event stream.
   */
  class ContainerEvent {
   public:
    ContainerEvent(const std::string& container_id, const std::string& action)
      : container_id(container_id), action(action) { }

    std::string string() const {
      std::ostringstream oss;
      oss << action << "[" << container_id << "]";
      return oss.str();
    }

    const std::string container_id;
    const std::string action;
  };
}
