#include "logging_notifier.hpp"

#include <glog/logging.h>

namespace {
  void log_endpoints(const std::string& action, const std::vector<observer::Endpoint>& endpoints) {
    for (const observer::Endpoint& endpoint : endpoints) {
      LOG(INFO) << action << " endpoint[" << endpoint.id << "] "
                << "target[" << endpoint.target << "]: " << stringify(endpoint.details.env());
    }
  }
}

void observer::LoggingNotifier::on_add(const std::vector<Endpoint>& added) {
  log_endpoints("Added", added);
}

void observer::LoggingNotifier::on_remove(const std::vector<Endpoint>& removed) {
  log_endpoints("Removed", removed);
}

void observer::LoggingNotifier::on_change(const std::vector<Endpoint>& changed) {
  log_endpoints("Changed", changed);
}
