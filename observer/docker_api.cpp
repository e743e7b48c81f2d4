#include "docker_api.hpp"

#include <ctype.h>
#include <stdlib.h>
#include <sstream>

#include <stout/json.hpp>
#include <stout/strings.hpp>

namespace {
  const std::string UNIX_PREFIX("unix://");
  const std::string TCP_PREFIX("tcp://");

  // Actions which start, stop, or modify a container.
  const char* EVENT_ACTIONS[] = {
    "destroy", "die", "pause", "rename", "stop", "start", "unpause", "update"
  };

  std::string url_encode(const std::string& s) {
    const char* hex = "0123456789ABCDEF";
    std::string out;
    for (char c : s) {
      if (isalnum((unsigned char) c) || c == '-' || c == '_' || c == '.' || c == '~') {
        out.push_back(c);
      } else {
        out.push_back('%');
        out.push_back(hex[((unsigned char) c) >> 4]);
        out.push_back(hex[((unsigned char) c) & 0xF]);
      }
    }
    return out;
  }

  // A missing or null field yields an empty string unless it is required.
  Try<std::string> get_string(
      const JSON::Object& obj, const std::string& key, bool required = false) {
    Result<JSON::String> value = obj.find<JSON::String>(key);
    if (value.isError()) {
      return Error("Field[" + key + "] is not a string: " + value.error());
    } else if (value.isNone()) {
      if (required) {
        return Error("Missing required field[" + key + "]");
      }
      return std::string();
    }
    return value.get().value;
  }

  // A missing or null field yields zero.
  Try<size_t> get_uint(const JSON::Object& obj, const std::string& key) {
    Result<JSON::Number> value = obj.find<JSON::Number>(key);
    if (value.isError()) {
      return Error("Field[" + key + "] is not a number: " + value.error());
    } else if (value.isNone()) {
      return (size_t) 0;
    } else if (value.get().as<long>() < 0) {
      return Error("Field[" + key + "] must be non-negative: " + stringify(value.get().as<long>()));
    }
    return value.get().as<size_t>();
  }

  Try<std::vector<observer::PortBinding>> parse_ports(const JSON::Object& container_obj) {
    std::vector<observer::PortBinding> ports;
    Result<JSON::Array> port_values = container_obj.find<JSON::Array>("Ports");
    if (port_values.isError()) {
      return Error("Field[Ports] is not an array: " + port_values.error());
    } else if (port_values.isNone()) {
      return ports;
    }
    for (const JSON::Value& port_value : port_values.get().values) {
      if (!port_value.is<JSON::Object>()) {
        return Error("Entry in Ports is not an object: " + stringify(port_value));
      }
      const JSON::Object& port_obj = port_value.as<JSON::Object>();
      Try<size_t> private_port = get_uint(port_obj, "PrivatePort");
      if (private_port.isError()) {
        return Error(private_port.error());
      }
      Try<size_t> public_port = get_uint(port_obj, "PublicPort");
      if (public_port.isError()) {
        return Error(public_port.error());
      }
      Try<std::string> type = get_string(port_obj, "Type");
      if (type.isError()) {
        return Error(type.error());
      }
      Try<std::string> ip = get_string(port_obj, "IP");
      if (ip.isError()) {
        return Error(ip.error());
      }
      ports.push_back(observer::PortBinding(
              private_port.get(), type.get(), ip.get(), public_port.get()));
    }
    return ports;
  }

  Try<observer::Container> parse_container(const JSON::Value& value) {
    if (!value.is<JSON::Object>()) {
      return Error("Container entry is not an object: " + stringify(value));
    }
    const JSON::Object& obj = value.as<JSON::Object>();
    observer::Container container;

    Try<std::string> str = get_string(obj, "Id", true);
    if (str.isError()) {
      return Error(str.error());
    }
    container.id = str.get();

    Result<JSON::String> first_name = obj.find<JSON::String>("Names[0]");
    if (first_name.isSome()) {
      std::string name = first_name.get().value;
      if (!name.empty() && name[0] == '/') {
        name = name.substr(1);
      }
      container.name = name;
    }

    str = get_string(obj, "Image");
    if (str.isError()) {
      return Error(str.error());
    }
    container.image = str.get();

    str = get_string(obj, "Command");
    if (str.isError()) {
      return Error(str.error());
    }
    container.command = str.get();

    str = get_string(obj, "State");
    if (str.isError()) {
      return Error(str.error());
    }
    container.state = str.get();

    Result<JSON::Object> labels = obj.find<JSON::Object>("Labels");
    if (labels.isError()) {
      return Error("Field[Labels] is not an object: " + labels.error());
    } else if (labels.isSome()) {
      for (auto label : labels.get().values) {
        if (label.second.is<JSON::String>()) {
          container.labels[label.first] = label.second.as<JSON::String>().value;
        }
      }
    }

    Try<std::vector<observer::PortBinding>> ports = parse_ports(obj);
    if (ports.isError()) {
      return Error(ports.error());
    }
    container.ports = ports.get();

    // Missing or malformed network settings leave the container without a network address.
    Result<JSON::Object> networks = obj.find<JSON::Object>("NetworkSettings.Networks");
    if (networks.isSome()) {
      for (auto network : networks.get().values) {
        if (!network.second.is<JSON::Object>()) {
          continue;
        }
        Try<std::string> ip = get_string(network.second.as<JSON::Object>(), "IPAddress");
        if (ip.isSome() && !ip.get().empty()) {
          container.network_ips[network.first] = ip.get();
        }
      }
    }
    return container;
  }
}

std::string observer::docker_api::DockerEndpoint::string() const {
  std::ostringstream oss;
  switch (scheme) {
    case endpoint_scheme::UNIX:
      oss << UNIX_PREFIX << path;
      break;
    case endpoint_scheme::TCP:
      oss << TCP_PREFIX << host << ":" << port;
      break;
    case endpoint_scheme::UNKNOWN:
      oss << "UNKNOWN";
      break;
  }
  return oss.str();
}

Try<observer::docker_api::DockerEndpoint> observer::docker_api::parse_endpoint(
    const std::string& endpoint) {
  DockerEndpoint parsed;
  if (strings::startsWith(endpoint, UNIX_PREFIX)) {
    parsed.scheme = endpoint_scheme::UNIX;
    parsed.path = strings::remove(endpoint, UNIX_PREFIX, strings::PREFIX);
    if (parsed.path.empty() || parsed.path[0] != '/') {
      return Error("Unix endpoint[" + endpoint + "] must have an absolute socket path");
    }
    return parsed;
  }
  if (strings::startsWith(endpoint, TCP_PREFIX)) {
    parsed.scheme = endpoint_scheme::TCP;
    std::string hostport = strings::remove(endpoint, TCP_PREFIX, strings::PREFIX);
    size_t colon = hostport.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == hostport.size()) {
      return Error("TCP endpoint[" + endpoint + "] must be of the form tcp://host:port");
    }
    parsed.host = hostport.substr(0, colon);
    if (parsed.host.size() > 2 && parsed.host[0] == '[' && parsed.host.back() == ']') {
      parsed.host = parsed.host.substr(1, parsed.host.size() - 2);
    }
    std::string port = hostport.substr(colon + 1);
    char* invalid = NULL;
    long val = strtol(port.c_str(), &invalid, 10);
    if ((invalid != NULL && invalid[0] != '\0') || val <= 0 || val > 65535) {
      return Error("TCP endpoint[" + endpoint + "] has an invalid port");
    }
    parsed.port = (size_t) val;
    return parsed;
  }
  return Error("Endpoint[" + endpoint + "] must start with " + UNIX_PREFIX + " or " + TCP_PREFIX);
}

std::string observer::docker_api::containers_path(const std::string& api_version) {
  return "/v" + api_version + "/containers/json";
}

std::string observer::docker_api::events_path(const std::string& api_version) {
  JSON::Array types;
  types.values.push_back("container");
  JSON::Array actions;
  for (const char* action : EVENT_ACTIONS) {
    actions.values.push_back(action);
  }
  JSON::Object filters;
  filters.values["type"] = types;
  filters.values["event"] = actions;
  return "/v" + api_version + "/events?filters=" + url_encode(stringify(filters));
}

Try<std::vector<observer::Container>> observer::docker_api::parse_container_list(
    const std::string& json) {
  Try<JSON::Array> array = JSON::parse<JSON::Array>(json);
  if (array.isError()) {
    return Error("Unable to parse container list: " + array.error());
  }
  std::vector<Container> containers;
  for (const JSON::Value& value : array.get().values) {
    Try<Container> container = parse_container(value);
    if (container.isError()) {
      return Error("Unable to parse container list entry: " + container.error());
    }
    containers.push_back(container.get());
  }
  return containers;
}

Try<observer::ContainerEvent> observer::docker_api::parse_event(const std::string& json) {
  Try<JSON::Object> obj = JSON::parse<JSON::Object>(json);
  if (obj.isError()) {
    return Error("Unable to parse event: " + obj.error());
  }

  Try<std::string> type = get_string(obj.get(), "Type");
  if (type.isError()) {
    return Error(type.error());
  }
  if (!type.get().empty() && type.get() != "container") {
    return Error("Event has non-container type[" + type.get() + "]");
  }

  // Newer engines provide Action and Actor.ID. Older ones only provide status and id.
  Try<std::string> action = get_string(obj.get(), "Action");
  if (action.isError()) {
    return Error(action.error());
  }
  if (action.get().empty()) {
    action = get_string(obj.get(), "status");
    if (action.isError()) {
      return Error(action.error());
    }
  }

  std::string container_id;
  Result<JSON::Object> actor = obj.get().find<JSON::Object>("Actor");
  if (actor.isSome()) {
    Try<std::string> id = get_string(actor.get(), "ID");
    if (id.isError()) {
      return Error(id.error());
    }
    container_id = id.get();
  }
  if (container_id.empty()) {
    Try<std::string> id = get_string(obj.get(), "id");
    if (id.isError()) {
      return Error(id.error());
    }
    container_id = id.get();
  }

  if (action.get().empty() || container_id.empty()) {
    return Error("Event is missing its action or container id: " + json);
  }
  return ContainerEvent(container_id, action.get());
}
