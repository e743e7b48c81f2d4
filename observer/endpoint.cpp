#include "endpoint.hpp"

namespace {
  const std::string PORT_KEY("port");
  const std::string ALTERNATE_PORT_KEY("alternate_port");
  const std::string CONTAINER_ID_KEY("container_id");
  const std::string NAME_KEY("name");
  const std::string IMAGE_KEY("image");
  const std::string TAG_KEY("tag");
  const std::string COMMAND_KEY("command");
  const std::string HOST_KEY("host");
  const std::string TRANSPORT_KEY("transport");
  const std::string LABELS_KEY("labels");
}

JSON::Object observer::EndpointDetails::env() const {
  JSON::Object json_obj;
  json_obj.values[PORT_KEY] = port;
  json_obj.values[ALTERNATE_PORT_KEY] = alternate_port;
  json_obj.values[CONTAINER_ID_KEY] = container_id;
  json_obj.values[NAME_KEY] = name;
  json_obj.values[IMAGE_KEY] = image;
  json_obj.values[TAG_KEY] = tag;
  json_obj.values[COMMAND_KEY] = command;
  json_obj.values[HOST_KEY] = host;
  json_obj.values[TRANSPORT_KEY] = transport;
  if (!labels.empty()) {
    JSON::Object labels_obj;
    for (auto label : labels) {
      labels_obj.values[label.first] = label.second;
    }
    json_obj.values[LABELS_KEY] = labels_obj;
  }
  return json_obj;
}
