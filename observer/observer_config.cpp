#include "observer_config.hpp"

#include <sstream>

#include "docker_api.hpp"
#include "params.hpp"

namespace {
  void join(std::ostringstream& oss, const std::vector<std::string>& entries) {
    oss << "[";
    for (size_t i = 0; i < entries.size(); ++i) {
      if (i != 0) {
        oss << ",";
      }
      oss << entries[i];
    }
    oss << "]";
  }
}

observer::ObserverConfig::ObserverConfig()
  : poll_interval_ms(0),
    api_timeout_ms(0),
    use_host_bindings(false),
    ignore_non_host_bindings(false),
    propagate_labels(false),
    watch_events(false),
    event_reconnect_secs(0),
    failure_log_escalation_count(0),
    shutdown_timeout_ms(0) { }

Try<observer::ObserverConfig> observer::ObserverConfig::create(const Parameters& parameters) {
  ObserverConfig config;
  config.endpoint = params::get_str(parameters, params::ENDPOINT, params::ENDPOINT_DEFAULT);
  config.api_version = params::get_str(
      parameters, params::DOCKER_API_VERSION, params::DOCKER_API_VERSION_DEFAULT);
  config.poll_interval_ms = params::get_uint(
      parameters, params::POLL_INTERVAL_MS, params::POLL_INTERVAL_MS_DEFAULT);
  config.api_timeout_ms = params::get_uint(
      parameters, params::API_TIMEOUT_MS, params::API_TIMEOUT_MS_DEFAULT);

  config.excluded_images = params::get_list(parameters, params::EXCLUDED_IMAGES);
  config.included_images = params::get_list(parameters, params::INCLUDED_IMAGES);
  config.excluded_labels = params::get_list(parameters, params::EXCLUDED_LABELS);

  config.use_host_bindings = params::get_bool(
      parameters, params::USE_HOST_BINDINGS, params::USE_HOST_BINDINGS_DEFAULT);
  config.ignore_non_host_bindings = params::get_bool(
      parameters, params::IGNORE_NON_HOST_BINDINGS, params::IGNORE_NON_HOST_BINDINGS_DEFAULT);
  config.propagate_labels = params::get_bool(
      parameters, params::PROPAGATE_LABELS, params::PROPAGATE_LABELS_DEFAULT);

  config.watch_events = params::get_bool(
      parameters, params::WATCH_EVENTS, params::WATCH_EVENTS_DEFAULT);
  config.event_reconnect_secs = params::get_uint(
      parameters, params::EVENT_RECONNECT_SECONDS, params::EVENT_RECONNECT_SECONDS_DEFAULT);

  config.failure_log_escalation_count = params::get_uint(
      parameters, params::FAILURE_LOG_ESCALATION_COUNT,
      params::FAILURE_LOG_ESCALATION_COUNT_DEFAULT);
  config.shutdown_timeout_ms = params::get_uint(
      parameters, params::SHUTDOWN_TIMEOUT_MS, params::SHUTDOWN_TIMEOUT_MS_DEFAULT);

  if (config.poll_interval_ms == 0) {
    return Error("Config value " + params::POLL_INTERVAL_MS + " must be positive");
  }
  if (config.api_timeout_ms == 0) {
    return Error("Config value " + params::API_TIMEOUT_MS + " must be positive");
  }
  if (config.shutdown_timeout_ms == 0) {
    return Error("Config value " + params::SHUTDOWN_TIMEOUT_MS + " must be positive");
  }
  Try<docker_api::DockerEndpoint> endpoint = docker_api::parse_endpoint(config.endpoint);
  if (endpoint.isError()) {
    return Error("Config value " + params::ENDPOINT + " is invalid: " + endpoint.error());
  }
  return config;
}

std::string observer::ObserverConfig::string() const {
  std::ostringstream oss;
  oss << "endpoint[" << endpoint << "] "
      << "api_version[" << api_version << "] "
      << "poll_interval_ms[" << poll_interval_ms << "] "
      << "api_timeout_ms[" << api_timeout_ms << "] "
      << "excluded_images";
  join(oss, excluded_images);
  oss << " included_images";
  join(oss, included_images);
  oss << " excluded_labels";
  join(oss, excluded_labels);
  oss << " use_host_bindings[" << use_host_bindings << "] "
      << "ignore_non_host_bindings[" << ignore_non_host_bindings << "] "
      << "propagate_labels[" << propagate_labels << "] "
      << "watch_events[" << watch_events << "]";
  return oss.str();
}
