#include "endpoint_state.hpp"

#include <boost/thread/locks.hpp>

#include <glog/logging.h>

observer::EndpointDiff observer::EndpointState::compute_diff(
    const endpoint_map& previous, const endpoint_map& current) {
  // Both maps are ordered by id, so each bucket comes out ordered by id too.
  EndpointDiff diff;
  for (const endpoint_map::value_type& entry : current) {
    auto iter = previous.find(entry.first);
    if (iter == previous.end()) {
      diff.added.push_back(entry.second);
    } else if (iter->second.details != entry.second.details) {
      diff.changed.push_back(entry.second);
    }
  }
  for (const endpoint_map::value_type& entry : previous) {
    if (current.find(entry.first) == current.end()) {
      diff.removed.push_back(entry.second);
    }
  }
  return diff;
}

observer::EndpointDiff observer::EndpointState::update(const endpoint_map& current) {
  // Only the writer thread modifies 'snapshot', so reading it here without the lock is safe.
  EndpointDiff diff = compute_diff(snapshot, current);
  endpoint_map replacement(current);
  {
    boost::unique_lock<boost::shared_mutex> lock(mutex);
    snapshot.swap(replacement);
  }
  DLOG(INFO) << "Updated endpoint snapshot: " << diff.string()
             << " (now " << current.size() << " endpoints)";
  return diff;
}

observer::endpoint_map observer::EndpointState::endpoints() const {
  boost::shared_lock<boost::shared_mutex> lock(mutex);
  return snapshot;
}
