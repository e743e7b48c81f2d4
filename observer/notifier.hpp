#pragma once

#include <memory>
#include <vector>

#include "endpoint.hpp"

namespace observer {

  /**
   * Interface for consumers of endpoint changes. Calls are made from the observer's io thread,
   * one cycle at a time, and only with non-empty lists. Implementations should return promptly:
   * the next discovery cycle waits for them.
   */
  class Notifier {
   public:
    virtual ~Notifier() { }

    virtual void on_add(const std::vector<Endpoint>& added) = 0;
    virtual void on_remove(const std::vector<Endpoint>& removed) = 0;
    virtual void on_change(const std::vector<Endpoint>& changed) = 0;
  };

  typedef std::shared_ptr<Notifier> notifier_ptr_t;
}
