#include <thread>

#include <glog/logging.h>
#include <gtest/gtest.h>

#include <boost/asio.hpp>

#include "sync_util.hpp"

namespace {
  size_t sleep_a_while(size_t sleep_ms) {
    LOG(INFO) << "RUN: sleep " << sleep_ms << "ms";
    std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));
    LOG(INFO) << "DONE: sleep " << sleep_ms << "ms";
    return sleep_ms;
  }

  size_t return_immediately(size_t return_me) {
    LOG(INFO) << "RUN: ret " << return_me;
    return return_me;
  }

  void run_io_service(std::shared_ptr<boost::asio::io_service> io_service) {
    try {
      LOG(INFO) << "Starting io_service";
      io_service->run();
      LOG(INFO) << "Exited io_service.run()";
    } catch (const std::exception& e) {
      LOG(ERROR) << "io_service.run() threw exception, exiting: " << e.what();
    }
  }

  class IOServiceRunner {
   public:
    IOServiceRunner()
      : io_service(new boost::asio::io_service),
        work(new boost::asio::io_service::work(*io_service)),
        thread(std::bind(&run_io_service, io_service)) { }

    ~IOServiceRunner() {
      work.reset();
      io_service->stop();
      thread.join();
    }

    std::shared_ptr<boost::asio::io_service> io_service;

   private:
    std::unique_ptr<boost::asio::io_service::work> work;
    std::thread thread;
  };
}

TEST(SyncUtilTests, fast_func_get) {
  IOServiceRunner runner;

  size_t val = 1234;
  std::function<size_t()> fast_func = std::bind(&return_immediately, val);
  std::shared_ptr<size_t> out = observer::sync_util::dispatch_get(
      "return_immediately_get", *runner.io_service, fast_func, 1000 /* timeout_ms */);

  ASSERT_TRUE((bool) out);
  EXPECT_EQ(val, *out);
}

TEST(SyncUtilTests, fast_func_run) {
  IOServiceRunner runner;

  size_t val = 1234;
  std::function<size_t()> fast_func = std::bind(&return_immediately, val);

  // break out response into separate variable: weird macro issues with running this direct
  bool ret = observer::sync_util::dispatch_run(
      "return_immediately_run", *runner.io_service, fast_func, 1000 /* timeout_ms */);
  EXPECT_TRUE(ret);
}

TEST(SyncUtilTests, no_timeout) {
  IOServiceRunner runner;

  std::function<size_t()> func = std::bind(&sleep_a_while, 50);
  std::shared_ptr<size_t> out = observer::sync_util::dispatch_get(
      "sleep_a_while_get", *runner.io_service, func, 0 /* timeout_ms */);

  ASSERT_TRUE((bool) out);
  EXPECT_EQ(50, *out);
}

TEST(SyncUtilTests, slow_func_get) {
  IOServiceRunner runner;

  size_t timeout_ms = 100;
  // make the func run more slowly than the timeout:
  std::function<size_t()> slow_func = std::bind(&sleep_a_while, timeout_ms * 5);

  std::shared_ptr<size_t> out = observer::sync_util::dispatch_get(
      "sleep_a_while_get", *runner.io_service, slow_func, timeout_ms);

  EXPECT_FALSE((bool) out);
}

TEST(SyncUtilTests, slow_func_run) {
  IOServiceRunner runner;

  size_t timeout_ms = 100;
  // make the func run more slowly than the timeout:
  std::function<size_t()> slow_func = std::bind(&sleep_a_while, timeout_ms * 5);

  // break out response into separate variable: weird macro issues with running this direct
  bool ret = observer::sync_util::dispatch_run(
      "sleep_a_while_run", *runner.io_service, slow_func, timeout_ms);
  EXPECT_FALSE(ret);
}

int main(int argc, char **argv) {
  ::google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = 1;
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
