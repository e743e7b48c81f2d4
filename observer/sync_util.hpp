#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

#include <glog/logging.h>

namespace observer {
  class sync_util {
   public:
    /**
     * Executes the provided function on the provided dispatcher (which must implement
     * "dispatch()"), and returns the value returned by that function or an empty pointer if the
     * result didn't arrive within timeout_ms. Timeouts may be disabled (indefinite wait) with
     * timeout_ms=0.
     *
     * This avoids races against work being run by the dispatcher, by ensuring that the requested
     * work occurs within the dispatcher thread.
     */
    template <typename Dispatcher, typename Result>
    static std::shared_ptr<Result> dispatch_get(
        const std::string& desc, Dispatcher& dispatcher, std::function<Result()> func,
        size_t timeout_ms = 5000) {
      // These go out of scope when we exit, hence tracking whether we're still waiting via tickets.
      std::shared_ptr<Result> out;
      std::condition_variable cv;

      size_t ticket;
      {
        std::unique_lock<std::mutex> lock(tickets->mutex);
        ticket = tickets->locked_get_next_ticket();
      }

      // Dispatch without holding the lock: dispatch() may run func synchronously.
      DLOG(INFO) << "Dispatching and waiting <=" << timeout_ms << "ms for ticket[" << ticket << "]: " << desc;
      dispatcher.dispatch(
          std::bind(&sync_util::exec_and_pass_result_cb<Result>, func, ticket, &cv, &out));

      {
        std::unique_lock<std::mutex> lock(tickets->mutex);
        if (timeout_ms == 0) {
          while (!out) {
            cv.wait(lock);
          }
        } else {
          std::chrono::steady_clock::time_point deadline =
            std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
          // wait_until returns early on spurious wakeups, so check 'out' each time.
          while (!out) {
            if (cv.wait_until(lock, deadline) == std::cv_status::timeout) {
              break;
            }
          }
        }

        // Regardless of outcome, clear the ticket before 'out' and 'cv' go out of scope.
        tickets->locked_clear_ticket(ticket);
      }

      if (out) {
        DLOG(INFO) << "Dispatch result obtained for ticket[" << ticket << "]: " << desc;
      } else {
        LOG(ERROR) << "Timed out for ticket[" << ticket << "] after waiting "
                   << timeout_ms << "ms (abandoning result): " << desc;
      }
      return out;
    }

    /**
     * Executes the provided function on the provided dispatcher (which must implement
     * "dispatch()"), and returns whether the function completed within timeout_ms.
     */
    template <typename Dispatcher>
    static bool dispatch_run(
        const std::string& desc, Dispatcher& dispatcher, std::function<void()> func,
        size_t timeout_ms = 5000) {
      std::shared_ptr<bool> out = dispatch_get<Dispatcher, bool>(
          desc, dispatcher, std::bind(&sync_util::exec_and_return_true_cb, func), timeout_ms);
      return (bool) out;
    }

   private:
    /**
     * No instantiation allowed.
     */
    sync_util() { }
    sync_util(const sync_util&) { }

    template <typename Result>
    static void exec_and_pass_result_cb(
        std::function<Result()> func,
        size_t ticket,
        std::condition_variable* cv_caller_scoped,
        std::shared_ptr<Result>* out_caller_scoped) {
      std::shared_ptr<Result> result(new Result(func()));

      std::unique_lock<std::mutex> lock(tickets->mutex);
      // Only touch 'out' and 'cv' if the caller which owns them is still waiting for us.
      if (tickets->locked_find_ticket(ticket)) {
        *out_caller_scoped = result;
        cv_caller_scoped->notify_all();
      } else {
        LOG(WARNING) << "Result for ticket[" << ticket << "] arrived after its caller gave up";
      }
    }

    static bool exec_and_return_true_cb(std::function<void()> func) {
      func();
      return true;
    }

    // Tracks which synchronous requests are still outstanding, so that the dispatcher thread
    // can tell whether it may safely deliver a result.
    class Tickets {
     public:
      Tickets() : next_ticket(0) { }

      /**
       * These must ONLY be called while 'mutex' is locked.
       */
      size_t locked_get_next_ticket();
      bool locked_find_ticket(size_t ticket) const;
      void locked_clear_ticket(size_t ticket);

      std::mutex mutex;

     private:
      size_t next_ticket;
      std::unordered_set<size_t> tickets;
    };

    static std::shared_ptr<Tickets> tickets;
  };
}
