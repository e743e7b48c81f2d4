#pragma once

#include <stddef.h>
#include <string>
#include <vector>

#include "parameters.pb.h"

namespace observer {
  namespace params {
    /**
     * Runtime settings
     */

    // The address of the container engine. Supports unix:///path/to/socket and tcp://host:port.
    const std::string ENDPOINT = "endpoint";
    const std::string ENDPOINT_DEFAULT = "unix:///var/run/docker.sock";

    // The engine API version to request, used as the URL prefix (eg /v1.22/containers/json).
    const std::string DOCKER_API_VERSION = "docker_api_version";
    const std::string DOCKER_API_VERSION_DEFAULT = "1.22";

    // The maximum time to wait for a single request against the engine API. The effective
    // deadline for a discovery cycle is the smaller of this and poll_interval_ms.
    const std::string API_TIMEOUT_MS = "api_timeout_ms";
    const size_t API_TIMEOUT_MS_DEFAULT = 5000;

    /**
     * Discovery settings
     */

    // The period between discovery cycles. Cycles are additionally triggered by container events
    // when watch_events is enabled.
    const std::string POLL_INTERVAL_MS = "poll_interval_ms";
    const size_t POLL_INTERVAL_MS_DEFAULT = 5000;

    // Comma-separated glob patterns. Containers whose image reference matches any of these are
    // never turned into endpoints.
    const std::string EXCLUDED_IMAGES = "excluded_images";

    // Comma-separated glob patterns. When non-empty, a container's image reference must match at
    // least one of these (and none of excluded_images) to be turned into endpoints.
    const std::string INCLUDED_IMAGES = "included_images";

    // Comma-separated key=glob rules. Containers carrying label 'key' with a value matching 'glob'
    // are never turned into endpoints.
    const std::string EXCLUDED_LABELS = "excluded_labels";

    // Whether to surface host-published ports (and the binding's host ip) instead of the
    // container-internal ports (and the container's network ip).
    const std::string USE_HOST_BINDINGS = "use_host_bindings";
    const bool USE_HOST_BINDINGS_DEFAULT = false;

    // Whether to skip ports which aren't published on the host.
    const std::string IGNORE_NON_HOST_BINDINGS = "ignore_non_host_bindings";
    const bool IGNORE_NON_HOST_BINDINGS_DEFAULT = false;

    // Whether to copy container labels into endpoint details.
    const std::string PROPAGATE_LABELS = "propagate_labels";
    const bool PROPAGATE_LABELS_DEFAULT = true;

    /**
     * Event settings
     */

    // Whether to subscribe to the engine's container event stream, triggering a discovery cycle
    // whenever a container starts, stops, or otherwise changes.
    const std::string WATCH_EVENTS = "watch_events";
    const bool WATCH_EVENTS_DEFAULT = true;

    // The delay before re-opening a failed or closed event stream.
    const std::string EVENT_RECONNECT_SECONDS = "event_reconnect_seconds";
    const size_t EVENT_RECONNECT_SECONDS_DEFAULT = 5;

    /**
     * Failure handling settings
     */

    // The number of consecutive failed cycles after which failures are logged as errors rather
    // than warnings. Failed cycles never stop the observer.
    const std::string FAILURE_LOG_ESCALATION_COUNT = "failure_log_escalation_count";
    const size_t FAILURE_LOG_ESCALATION_COUNT_DEFAULT = 3;

    // The maximum time for shutdown to wait for in-flight work to drain before forcibly stopping.
    const std::string SHUTDOWN_TIMEOUT_MS = "shutdown_timeout_ms";
    const size_t SHUTDOWN_TIMEOUT_MS_DEFAULT = 5000;

    std::string get_str(const Parameters& parameters, const std::string& key, const std::string& default_value);
    size_t get_uint(const Parameters& parameters, const std::string& key, size_t default_value);
    bool get_bool(const Parameters& parameters, const std::string& key, bool default_value);

    /**
     * Returns the comma-separated entries of the provided key, with surrounding whitespace
     * trimmed and empty entries dropped. Unlike get_str(), an empty value is allowed and yields an
     * empty list.
     */
    std::vector<std::string> get_list(const Parameters& parameters, const std::string& key);
  }
}
