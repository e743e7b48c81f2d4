#pragma once

#include <boost/thread/shared_mutex.hpp>

#include "endpoint.hpp"

namespace observer {

  /**
   * Holds the endpoint snapshot of the last successful discovery cycle.
   *
   * update() must only be called by a single writer (the observer's io thread), while
   * endpoints() may be called from any thread at any time. Readers see either the snapshot
   * before an update or the one after it, never a mix.
   */
  class EndpointState {
   public:
    EndpointState() { }

    /**
     * Returns the difference between two snapshots:
     * - added: ids in current but not in previous (current values)
     * - removed: ids in previous but not in current (previous values)
     * - changed: ids in both whose details differ (current values)
     */
    static EndpointDiff compute_diff(const endpoint_map& previous, const endpoint_map& current);

    /**
     * Diffs the provided snapshot against the stored one, then replaces the stored snapshot.
     */
    EndpointDiff update(const endpoint_map& current);

    /**
     * Returns a copy of the stored snapshot.
     */
    endpoint_map endpoints() const;

   private:
    EndpointState(const EndpointState&);
    EndpointState& operator=(const EndpointState&);

    mutable boost::shared_mutex mutex;
    endpoint_map snapshot;
  };

}
