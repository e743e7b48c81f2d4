#pragma once

#include <functional>
#include <memory>
#include <vector>

#include <boost/asio.hpp>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "container.hpp"
#include "observer_config.hpp"

namespace observer {

  /**
   * Interface to a container engine. Implementations perform their work asynchronously on the
   * io_service they were created with, and invoke all callbacks from that io_service's thread.
   */
  class RuntimeClient {
   public:
    typedef std::function<void(const Try<std::vector<Container>>& containers)> list_cb_t;
    typedef std::function<void(const ContainerEvent& event)> event_cb_t;

    virtual ~RuntimeClient() { }

    /**
     * Requests the list of containers, passing the result or an error to the callback. The
     * callback is invoked exactly once, including when the request times out after timeout_ms or
     * when the client is shut down with the request still outstanding.
     */
    virtual void async_list_containers(size_t timeout_ms, list_cb_t callback) = 0;

    /**
     * Subscribes to container lifecycle events, passing each event to the callback until the
     * client is shut down. Interruptions of the underlying stream are handled internally.
     */
    virtual void watch_events(event_cb_t callback) = 0;

    /**
     * Cancels any outstanding work. Must be called from within the io_service thread.
     */
    virtual Try<Nothing> shutdown() = 0;
  };

  typedef std::shared_ptr<RuntimeClient> runtime_client_ptr_t;

  typedef std::function<runtime_client_ptr_t(
      std::shared_ptr<boost::asio::io_service> io_service,
      const ObserverConfig& config)> runtime_client_factory_t;
}
