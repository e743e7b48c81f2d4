#pragma once

#include <string>
#include <vector>

#include <stout/try.hpp>

#include "parameters.pb.h"

namespace observer {

  /**
   * The validated settings of a DockerObserver, extracted from the raw Parameters once at
   * creation. Invalid values which can only be detected semantically (zero intervals, bad engine
   * address) are returned as an Error, while malformed values are fatal (see params.hpp).
   */
  class ObserverConfig {
   public:
    static Try<ObserverConfig> create(const Parameters& parameters);

    /**
     * The deadline for a single discovery cycle's engine request: the smaller of the configured
     * api timeout and poll interval, so that a hung request can't stall past the next tick.
     */
    size_t cycle_deadline_ms() const {
      return (api_timeout_ms < poll_interval_ms) ? api_timeout_ms : poll_interval_ms;
    }

    std::string string() const;

    std::string endpoint;
    std::string api_version;
    size_t poll_interval_ms;
    size_t api_timeout_ms;

    std::vector<std::string> excluded_images;
    std::vector<std::string> included_images;
    std::vector<std::string> excluded_labels;

    bool use_host_bindings;
    bool ignore_non_host_bindings;
    bool propagate_labels;

    bool watch_events;
    size_t event_reconnect_secs;

    size_t failure_log_escalation_count;
    size_t shutdown_timeout_ms;

   private:
    ObserverConfig();
  };

}
