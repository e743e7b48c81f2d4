#include "docker_observer.hpp"

#ifdef LINUX_PRCTL_AVAILABLE
#include <sys/prctl.h>
#endif
#define THREAD_NAME "docker-observer"

#include <chrono>

#include <glog/logging.h>

#include "sync_util.hpp"

namespace sp = std::placeholders;

std::string observer::lifecycle::to_string(Value value) {
  switch (value) {
    case IDLE:
      return "IDLE";
    case RUNNING:
      return "RUNNING";
    case STOPPING:
      return "STOPPING";
    case STOPPED:
      return "STOPPED";
  }
  return "UNKNOWN";
}

Try<std::shared_ptr<observer::DockerObserver>> observer::DockerObserver::create(
    const Parameters& parameters, runtime_client_factory_t client_factory) {
  Try<ObserverConfig> config = ObserverConfig::create(parameters);
  if (config.isError()) {
    return Error("Invalid observer configuration: " + config.error());
  }
  Try<ImageFilter> filter = ImageFilter::create(
      config.get().excluded_images, config.get().included_images, config.get().excluded_labels);
  if (filter.isError()) {
    return Error("Invalid observer configuration: " + filter.error());
  }
  return std::shared_ptr<DockerObserver>(
      new DockerObserver(config.get(), filter.get(), client_factory));
}

observer::DockerObserver::DockerObserver(
    const ObserverConfig& config,
    const ImageFilter& filter,
    runtime_client_factory_t client_factory)
  : config(config),
    filter(filter),
    extractor(config),
    client_factory(client_factory),
    io_service(new boost::asio::io_service),
    poll_timer(*io_service),
    lifecycle_state(lifecycle::IDLE),
    stopping(false),
    io_service_exited(false),
    cycle_in_flight(false),
    cycle_pending(false),
    cycle_count(0),
    consecutive_failures(0) {
  LOG(INFO) << "DockerObserver constructed with " << config.string();
}

observer::DockerObserver::~DockerObserver() {
  Try<Nothing> result = shutdown();
  if (result.isError()) {
    LOG(ERROR) << "Failed to shut down DockerObserver on destruction: " << result.error();
  }
  if (io_service_thread && io_service_thread->joinable()) {
    // Only reachable when the last reference was dropped from within the io_service thread.
    LOG(ERROR) << "DockerObserver destroyed from its own io_service thread, detaching it";
    io_service_thread->detach();
  }
}

Try<Nothing> observer::DockerObserver::start() {
  std::unique_lock<std::mutex> lock(lifecycle_mutex);
  if (lifecycle_state != lifecycle::IDLE) {
    return Error("DockerObserver can't be started in state["
        + lifecycle::to_string(lifecycle_state) + "]");
  }
  LOG(INFO) << "Starting DockerObserver";
  // The startup work must be queued before the thread starts, or else io_service.run() would
  // return immediately for lack of work.
  io_service->post(std::bind(&DockerObserver::start_cb, this));
  io_service_thread.reset(new std::thread(std::bind(&DockerObserver::run_io_service, this)));
  lifecycle_state = lifecycle::RUNNING;
  return Nothing();
}

Try<Nothing> observer::DockerObserver::shutdown() {
  {
    std::unique_lock<std::mutex> lock(lifecycle_mutex);
    switch (lifecycle_state) {
      case lifecycle::IDLE:
        LOG(INFO) << "DockerObserver shut down before being started";
        lifecycle_state = lifecycle::STOPPED;
        return Nothing();
      case lifecycle::STOPPING:
      case lifecycle::STOPPED:
        return Nothing();
      case lifecycle::RUNNING:
        break;
    }
    if (on_io_thread()) {
      return Error("DockerObserver can't be shut down from within its own thread "
          "(eg from a notifier callback)");
    }
    lifecycle_state = lifecycle::STOPPING;
  }

  LOG(INFO) << "Shutting down DockerObserver";
  stopping = true;
  std::chrono::steady_clock::time_point deadline =
    std::chrono::steady_clock::now() + std::chrono::milliseconds(config.shutdown_timeout_ms);

  bool exited;
  {
    std::unique_lock<std::mutex> lock(io_service_exited_mutex);
    exited = io_service_exited;
  }
  // Run the cancellation itself from within the io_service thread:
  if (!exited && !sync_util::dispatch_run("DockerObserver::shutdown", *io_service,
          std::bind(&DockerObserver::shutdown_cb, this), config.shutdown_timeout_ms)) {
    LOG(ERROR) << "Failed to cancel DockerObserver work within "
               << config.shutdown_timeout_ms << "ms";
  }

  {
    // With the timer and client cancelled, io_service.run() returns once in-flight work drains.
    std::unique_lock<std::mutex> lock(io_service_exited_mutex);
    while (!io_service_exited) {
      if (io_service_exited_cv.wait_until(lock, deadline) == std::cv_status::timeout) {
        break;
      }
    }
    if (!io_service_exited) {
      LOG(ERROR) << "DockerObserver work didn't drain within " << config.shutdown_timeout_ms
                 << "ms of shutdown, forcing io_service to stop";
      io_service->stop();
    }
  }
  io_service_thread->join();

  {
    std::unique_lock<std::mutex> lock(lifecycle_mutex);
    lifecycle_state = lifecycle::STOPPED;
  }
  LOG(INFO) << "DockerObserver shut down after " << cycle_count << " cycles";
  return Nothing();
}

void observer::DockerObserver::subscribe(notifier_ptr_t notifier) {
  if (!notifier) {
    LOG(FATAL) << "DockerObserver::subscribe() was called with a null notifier";
    return;
  }
  if (state() == lifecycle::RUNNING && !on_io_thread()) {
    // Serialize with cycles, so that the replay can't interleave with a cycle's notifications.
    if (!sync_util::dispatch_run("DockerObserver::subscribe", *io_service,
            std::bind(&DockerObserver::subscribe_cb, this, notifier),
            config.shutdown_timeout_ms)) {
      LOG(ERROR) << "Timed out waiting for notifier[" << notifier.get() << "] to be subscribed";
    }
  } else {
    subscribe_cb(notifier);
  }
}

void observer::DockerObserver::unsubscribe(notifier_ptr_t notifier) {
  if (state() == lifecycle::RUNNING && !on_io_thread()) {
    if (!sync_util::dispatch_run("DockerObserver::unsubscribe", *io_service,
            std::bind(&DockerObserver::unsubscribe_cb, this, notifier),
            config.shutdown_timeout_ms)) {
      LOG(ERROR) << "Timed out waiting for notifier[" << notifier.get() << "] to be unsubscribed";
    }
  } else {
    unsubscribe_cb(notifier);
  }
}

observer::endpoint_map observer::DockerObserver::endpoints() const {
  return endpoint_state.endpoints();
}

observer::lifecycle::Value observer::DockerObserver::state() const {
  std::unique_lock<std::mutex> lock(lifecycle_mutex);
  return lifecycle_state;
}

bool observer::DockerObserver::on_io_thread() const {
  return io_service_thread && std::this_thread::get_id() == io_service_thread->get_id();
}

void observer::DockerObserver::run_io_service() {
#if defined(LINUX_PRCTL_AVAILABLE) && defined(PR_SET_NAME)
  // Set the thread name to help with any debugging/tracing (uses Linux-specific API)
  prctl(PR_SET_NAME, THREAD_NAME, 0, 0, 0);
#endif
  try {
    LOG(INFO) << "Starting io_service";
    io_service->run();
    LOG(INFO) << "Exited io_service.run()";
  } catch (const std::exception& e) {
    LOG(ERROR) << "io_service.run() threw exception, exiting: " << e.what();
  }
  {
    std::unique_lock<std::mutex> lock(io_service_exited_mutex);
    io_service_exited = true;
  }
  io_service_exited_cv.notify_all();
}

void observer::DockerObserver::start_cb() {
  if (stopping) {
    return;
  }
  client = client_factory(io_service, config);
  if (!client) {
    LOG(FATAL) << "Runtime client factory returned a null client";
    return;
  }
  if (config.watch_events) {
    client->watch_events(std::bind(&DockerObserver::event_cb, this, sp::_1));
  }
  request_cycle("startup");
  start_poll_timer();
}

void observer::DockerObserver::shutdown_cb() {
  boost::system::error_code ec;
  poll_timer.cancel(ec);
  if (ec) {
    LOG(ERROR) << "Poll timer cancellation returned error. "
               << "err='" << ec.message() << "'(" << ec << ")";
  }
  if (client) {
    Try<Nothing> result = client->shutdown();
    if (result.isError()) {
      LOG(ERROR) << "Runtime client shutdown returned error: " << result.error();
    }
  }
}

void observer::DockerObserver::subscribe_cb(notifier_ptr_t notifier) {
  if (notification_dispatcher.subscribe(notifier)) {
    NotificationDispatcher::replay(notifier, endpoint_state.endpoints());
  }
}

void observer::DockerObserver::unsubscribe_cb(notifier_ptr_t notifier) {
  notification_dispatcher.unsubscribe(notifier);
}

void observer::DockerObserver::start_poll_timer() {
  poll_timer.expires_from_now(boost::posix_time::milliseconds(config.poll_interval_ms));
  poll_timer.async_wait(std::bind(&DockerObserver::poll_timer_cb, this, sp::_1));
}

void observer::DockerObserver::poll_timer_cb(boost::system::error_code ec) {
  if (stopping || ec == boost::asio::error::operation_aborted) {
    return;
  }
  if (ec) {
    LOG(ERROR) << "Poll timer returned error. err='" << ec.message() << "'(" << ec << ")";
  }
  request_cycle("timer");
  start_poll_timer();
}

void observer::DockerObserver::event_cb(const ContainerEvent& event) {
  if (stopping) {
    return;
  }
  DLOG(INFO) << "Container event[" << event.string() << "]";
  request_cycle("event " + event.action);
}

void observer::DockerObserver::request_cycle(const std::string& reason) {
  if (stopping) {
    return;
  }
  if (cycle_in_flight) {
    if (!cycle_pending) {
      DLOG(INFO) << "Cycle in flight, queueing another for reason[" << reason << "]";
    }
    cycle_pending = true;
    return;
  }
  begin_cycle(reason);
}

void observer::DockerObserver::begin_cycle(const std::string& reason) {
  cycle_in_flight = true;
  cycle_pending = false;
  ++cycle_count;
  DLOG(INFO) << "Starting cycle[" << cycle_count << "] for reason[" << reason << "]";
  client->async_list_containers(
      config.cycle_deadline_ms(), std::bind(&DockerObserver::list_cb, this, sp::_1));
}

void observer::DockerObserver::list_cb(const Try<std::vector<Container>>& containers) {
  cycle_in_flight = false;
  if (stopping) {
    DLOG(INFO) << "Discarding result of cycle[" << cycle_count << "]: shutting down";
    return;
  }

  if (containers.isError()) {
    ++consecutive_failures;
    if (consecutive_failures >= config.failure_log_escalation_count) {
      LOG(ERROR) << "Cycle[" << cycle_count << "] failed "
                 << "(" << consecutive_failures << " consecutive failures), "
                 << "keeping last known endpoints: " << containers.error();
    } else {
      LOG(WARNING) << "Cycle[" << cycle_count << "] failed "
                   << "(" << consecutive_failures << " consecutive failures), "
                   << "keeping last known endpoints: " << containers.error();
    }
  } else {
    if (consecutive_failures > 0) {
      LOG(INFO) << "Cycle[" << cycle_count << "] succeeded after "
                << consecutive_failures << " consecutive failures";
      consecutive_failures = 0;
    }
    update_endpoints(containers.get());
  }

  if (cycle_pending && !stopping) {
    begin_cycle("pending trigger");
  }
}

void observer::DockerObserver::update_endpoints(const std::vector<Container>& containers) {
  std::vector<Container> included;
  for (const Container& container : containers) {
    if (filter.include(container)) {
      included.push_back(container);
    }
  }
  EndpointDiff diff = endpoint_state.update(extractor.extract_all(included));
  if (diff.empty()) {
    DLOG(INFO) << "Cycle[" << cycle_count << "] found no changes "
               << "in " << included.size() << "/" << containers.size() << " containers";
    return;
  }
  LOG(INFO) << "Cycle[" << cycle_count << "] found endpoint changes: " << diff.string();
  notification_dispatcher.dispatch(diff);
}
