#include "notification_dispatcher.hpp"

#include <algorithm>

#include <glog/logging.h>

bool observer::NotificationDispatcher::subscribe(notifier_ptr_t notifier) {
  std::unique_lock<std::mutex> lock(mutex);
  if (std::find(notifiers.begin(), notifiers.end(), notifier) != notifiers.end()) {
    LOG(WARNING) << "Ignoring duplicate subscription of notifier[" << notifier.get() << "]";
    return false;
  }
  notifiers.push_back(notifier);
  LOG(INFO) << "Subscribed notifier[" << notifier.get() << "] "
            << "(now " << notifiers.size() << " subscribers)";
  return true;
}

bool observer::NotificationDispatcher::unsubscribe(notifier_ptr_t notifier) {
  std::unique_lock<std::mutex> lock(mutex);
  auto iter = std::find(notifiers.begin(), notifiers.end(), notifier);
  if (iter == notifiers.end()) {
    LOG(WARNING) << "Notifier[" << notifier.get() << "] wasn't subscribed";
    return false;
  }
  notifiers.erase(iter);
  LOG(INFO) << "Unsubscribed notifier[" << notifier.get() << "] "
            << "(now " << notifiers.size() << " subscribers)";
  return true;
}

size_t observer::NotificationDispatcher::size() const {
  std::unique_lock<std::mutex> lock(mutex);
  return notifiers.size();
}

void observer::NotificationDispatcher::dispatch(const EndpointDiff& diff) const {
  if (diff.empty()) {
    return;
  }
  // Copy so that notifiers may (un)subscribe from within their callbacks.
  std::vector<notifier_ptr_t> notifiers_copy;
  {
    std::unique_lock<std::mutex> lock(mutex);
    notifiers_copy = notifiers;
  }
  DLOG(INFO) << "Dispatching " << diff.string() << " to " << notifiers_copy.size() << " notifiers";
  for (const notifier_ptr_t& notifier : notifiers_copy) {
    if (!diff.added.empty()) {
      notifier->on_add(diff.added);
    }
    if (!diff.removed.empty()) {
      notifier->on_remove(diff.removed);
    }
    if (!diff.changed.empty()) {
      notifier->on_change(diff.changed);
    }
  }
}

void observer::NotificationDispatcher::replay(
    notifier_ptr_t notifier, const endpoint_map& snapshot) {
  if (snapshot.empty()) {
    return;
  }
  std::vector<Endpoint> endpoints;
  for (const endpoint_map::value_type& entry : snapshot) {
    endpoints.push_back(entry.second);
  }
  LOG(INFO) << "Replaying " << endpoints.size() << " endpoints to notifier[" << notifier.get() << "]";
  notifier->on_add(endpoints);
}
