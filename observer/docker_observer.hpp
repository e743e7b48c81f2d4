#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio.hpp>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "docker_client.hpp"
#include "endpoint_extractor.hpp"
#include "endpoint_state.hpp"
#include "image_filter.hpp"
#include "notification_dispatcher.hpp"
#include "observer_config.hpp"
#include "parameters.pb.h"
#include "runtime_client.hpp"

namespace observer {

  namespace lifecycle {
    enum Value {
      IDLE,
      RUNNING,
      STOPPING,
      STOPPED
    };

    std::string to_string(Value value);
  }

  /**
   * Discovers the endpoints of the containers on a Docker engine, and notifies subscribers when
   * they are added, removed, or changed.
   *
   * All discovery work runs on a dedicated io_service thread, one cycle at a time. Cycles are
   * triggered once at start(), every poll interval thereafter, and on container events from the
   * engine. Triggers which arrive while a cycle is in flight are collapsed into a single
   * follow-up cycle. A cycle which fails leaves the known endpoints unchanged.
   *
   * Notifier callbacks are invoked from the io_service thread.
   */
  class DockerObserver {
   public:
    /**
     * Returns a new observer configured with the provided parameters, or an error if the
     * parameters are invalid. The observer doesn't do anything until start() is called.
     * The runtime client factory is exposed for tests.
     */
    static Try<std::shared_ptr<DockerObserver>> create(
        const Parameters& parameters,
        runtime_client_factory_t client_factory = docker_client_factory);

    /**
     * Shuts down the observer if it's still running.
     */
    virtual ~DockerObserver();

    /**
     * Starts discovery in the background. Returns an error if the observer isn't idle: an
     * observer may only be started once.
     */
    Try<Nothing> start();

    /**
     * Stops discovery, waiting up to the configured shutdown timeout for in-flight work to
     * finish. No notifications are sent once this has been called. Repeated calls have no
     * effect. Returns an error if called from within a notifier callback.
     *
     * The timeout bounds pending engine requests, not notifiers: once it expires the io_service
     * is stopped, but a notifier callback that never returns still blocks the join on the io
     * thread, and with it this call.
     */
    Try<Nothing> shutdown();

    /**
     * Registers a notifier for all subsequent changes. If endpoints are already known, they are
     * immediately passed to the notifier's on_add() before any later changes.
     */
    void subscribe(notifier_ptr_t notifier);

    /**
     * Unregisters a notifier. It won't receive any callbacks once this returns, unless this is
     * called from within one of its own callbacks.
     */
    void unsubscribe(notifier_ptr_t notifier);

    /**
     * Returns the endpoints found by the last successful cycle. May be called from any thread.
     */
    endpoint_map endpoints() const;

    lifecycle::Value state() const;

   private:
    DockerObserver(
        const ObserverConfig& config,
        const ImageFilter& filter,
        runtime_client_factory_t client_factory);

    bool on_io_thread() const;

    void run_io_service();
    void start_cb();
    void shutdown_cb();
    void subscribe_cb(notifier_ptr_t notifier);
    void unsubscribe_cb(notifier_ptr_t notifier);

    void start_poll_timer();
    void poll_timer_cb(boost::system::error_code ec);
    void event_cb(const ContainerEvent& event);

    void request_cycle(const std::string& reason);
    void begin_cycle(const std::string& reason);
    void list_cb(const Try<std::vector<Container>>& containers);
    void update_endpoints(const std::vector<Container>& containers);

    const ObserverConfig config;
    const ImageFilter filter;
    const EndpointExtractor extractor;
    const runtime_client_factory_t client_factory;

    std::shared_ptr<boost::asio::io_service> io_service;
    boost::asio::deadline_timer poll_timer;
    std::shared_ptr<std::thread> io_service_thread;
    runtime_client_ptr_t client;

    EndpointState endpoint_state;
    NotificationDispatcher notification_dispatcher;

    mutable std::mutex lifecycle_mutex;
    lifecycle::Value lifecycle_state;
    std::atomic<bool> stopping;

    std::mutex io_service_exited_mutex;
    std::condition_variable io_service_exited_cv;
    bool io_service_exited;

    // Only accessed from within the io_service thread.
    bool cycle_in_flight;
    bool cycle_pending;
    size_t cycle_count;
    size_t consecutive_failures;
  };

}
