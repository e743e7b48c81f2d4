#pragma once

#include <mutex>
#include <vector>

#include "notifier.hpp"

namespace observer {

  /**
   * Delivers endpoint diffs to registered notifiers, in registration order.
   */
  class NotificationDispatcher {
   public:
    NotificationDispatcher() { }

    /**
     * Registers a notifier. Returns false if it was already registered, in which case its
     * original position is kept.
     */
    bool subscribe(notifier_ptr_t notifier);

    /**
     * Unregisters a notifier. Returns false if it wasn't registered.
     */
    bool unsubscribe(notifier_ptr_t notifier);

    size_t size() const;

    /**
     * Passes the diff to each notifier in turn: on_add(), then on_remove(), then on_change(),
     * skipping empty lists. Exceptions thrown by notifiers are not caught.
     */
    void dispatch(const EndpointDiff& diff) const;

    /**
     * Sends the provided snapshot to a single notifier as one on_add(), or does nothing if the
     * snapshot is empty.
     */
    static void replay(notifier_ptr_t notifier, const endpoint_map& snapshot);

   private:
    NotificationDispatcher(const NotificationDispatcher&);
    NotificationDispatcher& operator=(const NotificationDispatcher&);

    mutable std::mutex mutex;
    std::vector<notifier_ptr_t> notifiers;
  };

}
