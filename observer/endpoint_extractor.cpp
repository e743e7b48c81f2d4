#include "endpoint_extractor.hpp"

#include <algorithm>
#include <set>
#include <sstream>

#include <glog/logging.h>

namespace {
  const std::string RUNNING_STATE("running");
  const std::string DEFAULT_TAG("latest");
  const std::string DEFAULT_TRANSPORT("tcp");
  const std::string LOCALHOST("127.0.0.1");

  std::string target(const std::string& host, size_t port) {
    std::ostringstream oss;
    if (host.find(':') != std::string::npos) {
      oss << "[" << host << "]:" << port;
    } else {
      oss << host << ":" << port;
    }
    return oss.str();
  }

  // Bindings on all interfaces are reachable locally.
  std::string binding_host(const std::string& host_ip) {
    if (host_ip.empty() || host_ip == "0.0.0.0" || host_ip == "::") {
      return LOCALHOST;
    }
    return host_ip;
  }

  // The engine doesn't list ports in a stable order, so duplicate ids must resolve the same way
  // on every cycle.
  bool binding_less(const observer::PortBinding& a, const observer::PortBinding& b) {
    if (a.container_port != b.container_port) {
      return a.container_port < b.container_port;
    }
    if (a.protocol != b.protocol) {
      return a.protocol < b.protocol;
    }
    if (a.host_ip != b.host_ip) {
      return a.host_ip < b.host_ip;
    }
    return a.host_port < b.host_port;
  }
}

std::vector<observer::Endpoint> observer::EndpointExtractor::extract(
    const Container& container) const {
  std::vector<Endpoint> endpoints;
  if (container.id.empty()) {
    DLOG(INFO) << "Skipping container with empty id: name[" << container.name << "]";
    return endpoints;
  }
  if (!container.state.empty() && container.state != RUNNING_STATE) {
    DLOG(INFO) << "Skipping container[" << container.id << "] in state[" << container.state << "]";
    return endpoints;
  }

  std::string tag = image_tag(container.image);
  std::string network_ip = container.network_ip();
  std::set<std::string> seen_ids;

  std::vector<PortBinding> ports(container.ports);
  std::sort(ports.begin(), ports.end(), binding_less);
  for (const PortBinding& binding : ports) {
    if (ignore_non_host_bindings && !binding.published()) {
      DLOG(INFO) << "Skipping unpublished port[" << binding.string() << "] "
                 << "of container[" << container.id << "]";
      continue;
    }

    std::string host;
    size_t port, alternate_port;
    if (use_host_bindings && binding.published()) {
      host = binding_host(binding.host_ip);
      port = binding.host_port;
      alternate_port = binding.container_port;
    } else {
      host = network_ip;
      port = binding.container_port;
      alternate_port = binding.host_port;
    }
    if (host.empty() || port == 0) {
      DLOG(INFO) << "Skipping port[" << binding.string() << "] of container[" << container.id
                 << "]: no reachable address";
      continue;
    }

    std::string transport = binding.protocol.empty() ? DEFAULT_TRANSPORT : binding.protocol;
    std::string id = endpoint_id(container.id, port, transport);
    if (!seen_ids.insert(id).second) {
      // Eg the ipv4 and ipv6 bindings of the same published port.
      continue;
    }

    EndpointDetails details;
    details.name = container.name;
    details.image = container.image;
    details.tag = tag;
    details.port = port;
    details.alternate_port = alternate_port;
    details.command = container.command;
    details.container_id = container.id;
    details.host = host;
    details.transport = transport;
    if (propagate_labels) {
      details.labels = container.labels;
    }
    endpoints.push_back(Endpoint(id, target(host, port), details));
  }

  if (endpoints.empty()) {
    DLOG(INFO) << "No endpoints in container[" << container.id << "] "
               << "with " << container.ports.size() << " ports";
  }
  return endpoints;
}

observer::endpoint_map observer::EndpointExtractor::extract_all(
    const std::vector<Container>& containers) const {
  endpoint_map endpoints;
  for (const Container& container : containers) {
    for (const Endpoint& endpoint : extract(container)) {
      if (!endpoints.insert(std::make_pair(endpoint.id, endpoint)).second) {
        LOG(WARNING) << "Duplicate endpoint[" << endpoint.id << "] from container["
                     << container.id << "], keeping the first one";
      }
    }
  }
  return endpoints;
}

std::string observer::EndpointExtractor::endpoint_id(
    const std::string& container_id, size_t port, const std::string& transport) {
  std::ostringstream oss;
  oss << container_id << ":" << port << "/" << transport;
  return oss.str();
}

std::string observer::EndpointExtractor::image_tag(const std::string& image) {
  std::string ref = image.substr(0, image.find('@'));
  size_t last_slash = ref.rfind('/');
  size_t last_colon = ref.rfind(':');
  if (last_colon == std::string::npos
      || (last_slash != std::string::npos && last_colon < last_slash)
      || last_colon + 1 == ref.size()) {
    return DEFAULT_TAG;
  }
  return ref.substr(last_colon + 1);
}
