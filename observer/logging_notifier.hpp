#pragma once

#include "notifier.hpp"

namespace observer {

  /**
   * A Notifier which logs each endpoint change, along with the endpoint's details as JSON.
   */
  class LoggingNotifier : public Notifier {
   public:
    void on_add(const std::vector<Endpoint>& added);
    void on_remove(const std::vector<Endpoint>& removed);
    void on_change(const std::vector<Endpoint>& changed);
  };

}
