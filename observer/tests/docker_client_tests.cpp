#include <future>

#include <glog/logging.h>
#include <gtest/gtest.h>

#include "docker_client.hpp"
#include "docker_observer.hpp"
#include "params.hpp"
#include "recording_notifier.hpp"
#include "test_docker_engine.hpp"

namespace {
  const std::string NGINX_LIST = R"([{
      "Id": "8dfafdbc3a40",
      "Names": ["/web"],
      "Image": "docker.io/library/nginx:1.17",
      "Command": "nginx -g 'daemon off;'",
      "State": "running",
      "Labels": {"app": "web"},
      "Ports": [{"PrivatePort": 80, "Type": "tcp"}],
      "NetworkSettings": {"Networks": {"bridge": {"IPAddress": "172.17.0.2"}}}
    }])";

  const std::string START_EVENT =
    R"({"status":"start","id":"8dfafdbc3a40","Type":"container","Action":"start",)"
    R"("Actor":{"ID":"8dfafdbc3a40","Attributes":{"name":"web"}},"time":1461943101})";

  void add(observer::Parameters& params, const std::string& key, const std::string& value) {
    observer::Parameter* param = params.add_parameter();
    param->set_key(key);
    param->set_value(value);
  }

  observer::Parameters engine_params(const TestDockerEngine& engine, size_t poll_interval_ms) {
    observer::Parameters params;
    add(params, observer::params::ENDPOINT, engine.endpoint());
    add(params, observer::params::POLL_INTERVAL_MS, std::to_string(poll_interval_ms));
    add(params, observer::params::API_TIMEOUT_MS, "1000");
    add(params, observer::params::EVENT_RECONNECT_SECONDS, "1");
    add(params, observer::params::SHUTDOWN_TIMEOUT_MS, "2000");
    return params;
  }

  observer::Parameters tcp_params(const std::string& endpoint) {
    observer::Parameters params;
    add(params, observer::params::ENDPOINT, endpoint);
    add(params, observer::params::API_TIMEOUT_MS, "500");
    add(params, observer::params::EVENT_RECONNECT_SECONDS, "1");
    return params;
  }

  std::shared_ptr<observer::DockerObserver> create(const observer::Parameters& params) {
    Try<std::shared_ptr<observer::DockerObserver>> observer =
      observer::DockerObserver::create(params);
    if (observer.isError()) {
      LOG(FATAL) << "Failed to create observer: " << observer.error();
    }
    return observer.get();
  }

  /**
   * Runs a DockerClient on its own io_service thread, for testing the client on its own.
   */
  class ClientRunner {
   public:
    explicit ClientRunner(const observer::Parameters& params)
      : io_service(new boost::asio::io_service),
        work(new boost::asio::io_service::work(*io_service)) {
      Try<observer::ObserverConfig> config = observer::ObserverConfig::create(params);
      if (config.isError()) {
        LOG(FATAL) << "Bad config: " << config.error();
      }
      client = observer::docker_client_factory(io_service, config.get());
      thread = std::thread([this]() { io_service->run(); });
    }

    ~ClientRunner() {
      shutdown();
      work.reset();
      io_service->stop();
      thread.join();
    }

    Try<std::vector<observer::Container>> list(size_t timeout_ms) {
      std::shared_ptr<std::promise<Try<std::vector<observer::Container>>>> result(
          new std::promise<Try<std::vector<observer::Container>>>);
      io_service->post([this, timeout_ms, result]() {
            client->async_list_containers(timeout_ms,
                [result](const Try<std::vector<observer::Container>>& containers) {
                  result->set_value(containers);
                });
          });
      return result->get_future().get();
    }

    /**
     * Starts a list request without waiting for its result.
     */
    std::shared_future<Try<std::vector<observer::Container>>> list_async(size_t timeout_ms) {
      std::shared_ptr<std::promise<Try<std::vector<observer::Container>>>> result(
          new std::promise<Try<std::vector<observer::Container>>>);
      std::shared_future<Try<std::vector<observer::Container>>> future =
        result->get_future().share();
      io_service->post([this, timeout_ms, result]() {
            client->async_list_containers(timeout_ms,
                [result](const Try<std::vector<observer::Container>>& containers) {
                  result->set_value(containers);
                });
          });
      return future;
    }

    void shutdown() {
      std::promise<void> done;
      io_service->post([this, &done]() {
            Try<Nothing> result = client->shutdown();
            if (result.isError()) {
              LOG(ERROR) << "Client shutdown failed: " << result.error();
            }
            done.set_value();
          });
      done.get_future().wait();
    }

   private:
    std::shared_ptr<boost::asio::io_service> io_service;
    std::unique_ptr<boost::asio::io_service::work> work;
    observer::runtime_client_ptr_t client;
    std::thread thread;
  };
}

TEST(DockerClientTests, list_containers) {
  TestDockerEngine engine;
  engine.set_containers(NGINX_LIST);
  ClientRunner runner(engine_params(engine, 5000));

  Try<std::vector<observer::Container>> containers = runner.list(1000);
  ASSERT_FALSE(containers.isError()) << containers.error();
  ASSERT_EQ(1, containers.get().size());
  EXPECT_EQ("8dfafdbc3a40", containers.get()[0].id);
  EXPECT_EQ("web", containers.get()[0].name);
  EXPECT_EQ(1, engine.get_list_count());

  // Each request uses its own connection.
  containers = runner.list(1000);
  ASSERT_FALSE(containers.isError()) << containers.error();
  EXPECT_EQ(2, engine.get_list_count());
}

TEST(DockerClientTests, list_error_status) {
  TestDockerEngine engine;
  engine.set_status(boost::beast::http::status::internal_server_error);
  ClientRunner runner(engine_params(engine, 5000));

  Try<std::vector<observer::Container>> containers = runner.list(1000);
  ASSERT_TRUE(containers.isError());
  EXPECT_NE(std::string::npos, containers.error().find("500")) << containers.error();
}

TEST(DockerClientTests, list_bad_body) {
  TestDockerEngine engine;
  engine.set_containers("{\"not\": \"a list\"}");
  ClientRunner runner(engine_params(engine, 5000));
  EXPECT_TRUE(runner.list(1000).isError());
}

TEST(DockerClientTests, list_timeout) {
  TestDockerEngine engine;
  engine.set_hang(true);
  ClientRunner runner(engine_params(engine, 5000));

  std::chrono::steady_clock::time_point before = std::chrono::steady_clock::now();
  Try<std::vector<observer::Container>> containers = runner.list(100);
  size_t elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - before).count();
  ASSERT_TRUE(containers.isError());
  EXPECT_NE(std::string::npos, containers.error().find("timed out")) << containers.error();
  EXPECT_LT(elapsed_ms, 1000);
}

TEST(DockerClientTests, engine_unavailable) {
  observer::Parameters params;
  add(params, observer::params::ENDPOINT, "unix:///nonexistent/docker.sock");
  ClientRunner runner(params);
  EXPECT_TRUE(runner.list(1000).isError());
}

TEST(DockerClientTests, shutdown_cancels_requests) {
  TestDockerEngine engine;
  engine.set_hang(true);
  ClientRunner runner(engine_params(engine, 5000));

  std::shared_future<Try<std::vector<observer::Container>>> pending = runner.list_async(60000);
  ASSERT_TRUE(wait_for([&engine]() { return engine.get_list_count() == 1; }));
  runner.shutdown();
  ASSERT_EQ(std::future_status::ready, pending.wait_for(std::chrono::seconds(5)));
  EXPECT_TRUE(pending.get().isError());

  // Requests after shutdown fail immediately.
  EXPECT_TRUE(runner.list(1000).isError());
  EXPECT_EQ(1, engine.get_list_count());
}

TEST(DockerClientTests, tcp_engine_unavailable) {
  // Nothing listens on port 1.
  ClientRunner runner(tcp_params("tcp://127.0.0.1:1"));
  std::shared_future<Try<std::vector<observer::Container>>> result = runner.list_async(500);
  ASSERT_EQ(std::future_status::ready, result.wait_for(std::chrono::seconds(5)));
  EXPECT_TRUE(result.get().isError());
}

TEST(DockerClientTests, tcp_engine_unresolvable) {
  // The lookup runs asynchronously, so the request still completes within its deadline.
  ClientRunner runner(tcp_params("tcp://docker-engine.invalid:2375"));
  std::shared_future<Try<std::vector<observer::Container>>> result = runner.list_async(500);
  ASSERT_EQ(std::future_status::ready, result.wait_for(std::chrono::seconds(5)));
  EXPECT_TRUE(result.get().isError());
}

TEST(DockerClientTests, tcp_shutdown_cancels_lookup) {
  ClientRunner runner(tcp_params("tcp://docker-engine.invalid:2375"));
  std::shared_future<Try<std::vector<observer::Container>>> pending = runner.list_async(60000);
  runner.shutdown();
  ASSERT_EQ(std::future_status::ready, pending.wait_for(std::chrono::seconds(5)));
  EXPECT_TRUE(pending.get().isError());
}

TEST(DockerObserverEngineTests, discovers_container_port) {
  TestDockerEngine engine;
  engine.set_containers(NGINX_LIST);
  std::shared_ptr<observer::DockerObserver> observer = create(engine_params(engine, 3600000));

  std::shared_ptr<RecordingNotifier> notifier(new RecordingNotifier);
  observer->subscribe(notifier);
  ASSERT_FALSE(observer->start().isError());

  ASSERT_TRUE(wait_for([notifier]() { return notifier->count("add") == 1; }));
  std::vector<RecordingNotifier::Call> calls = notifier->get_calls();
  ASSERT_EQ(1, calls[0].endpoints.size());
  const observer::Endpoint& endpoint = calls[0].endpoints[0];
  EXPECT_EQ("8dfafdbc3a40:80/tcp", endpoint.id);
  EXPECT_EQ("172.17.0.2:80", endpoint.target);
  EXPECT_EQ(80, endpoint.details.port);
  EXPECT_EQ("8dfafdbc3a40", endpoint.details.container_id);
  EXPECT_EQ("docker.io/library/nginx:1.17", endpoint.details.image);
  EXPECT_EQ("1.17", endpoint.details.tag);
  EXPECT_EQ("web", endpoint.details.labels.at("app"));

  ASSERT_FALSE(observer->shutdown().isError());
}

TEST(DockerObserverEngineTests, excluded_image) {
  TestDockerEngine engine;
  engine.set_containers(NGINX_LIST);
  observer::Parameters params = engine_params(engine, 50);
  add(params, observer::params::EXCLUDED_IMAGES, "*nginx*");
  std::shared_ptr<observer::DockerObserver> observer = create(params);

  std::shared_ptr<RecordingNotifier> notifier(new RecordingNotifier);
  observer->subscribe(notifier);
  ASSERT_FALSE(observer->start().isError());

  ASSERT_TRUE(wait_for([&engine]() { return engine.get_list_count() >= 3; }));
  ASSERT_FALSE(observer->shutdown().isError());
  EXPECT_TRUE(observer->endpoints().empty());
  EXPECT_EQ(0, notifier->total());
}

TEST(DockerObserverEngineTests, event_triggers_cycle) {
  TestDockerEngine engine;
  std::shared_ptr<observer::DockerObserver> observer = create(engine_params(engine, 3600000));

  std::shared_ptr<RecordingNotifier> notifier(new RecordingNotifier);
  observer->subscribe(notifier);
  ASSERT_FALSE(observer->start().isError());
  ASSERT_TRUE(wait_for([&engine]() {
            return engine.get_event_stream_count() == 1 && engine.get_list_count() == 1;
          }));
  EXPECT_EQ(0, notifier->total());

  engine.set_containers(NGINX_LIST);
  engine.push_event(START_EVENT);
  ASSERT_TRUE(wait_for([notifier]() { return notifier->count("add") == 1; }));
  EXPECT_EQ(2, engine.get_list_count());

  // Removal is noticed the same way.
  engine.set_containers("[]");
  engine.push_event(R"({"Type":"container","Action":"die","Actor":{"ID":"8dfafdbc3a40"}})");
  ASSERT_TRUE(wait_for([notifier]() { return notifier->count("remove") == 1; }));
  EXPECT_TRUE(observer->endpoints().empty());

  ASSERT_FALSE(observer->shutdown().isError());
}

TEST(DockerObserverEngineTests, event_stream_reconnects) {
  TestDockerEngine engine;
  std::shared_ptr<observer::DockerObserver> observer = create(engine_params(engine, 3600000));
  ASSERT_FALSE(observer->start().isError());
  ASSERT_TRUE(wait_for([&engine]() { return engine.get_event_stream_count() == 1; }));

  engine.close_event_streams();
  ASSERT_TRUE(wait_for([&engine]() { return engine.get_event_stream_count() == 0; }));
  ASSERT_TRUE(wait_for([&engine]() { return engine.get_event_stream_count() == 1; }));

  engine.set_containers(NGINX_LIST);
  engine.push_event(START_EVENT);
  ASSERT_TRUE(wait_for([observer]() { return observer->endpoints().size() == 1; }));

  ASSERT_FALSE(observer->shutdown().isError());
}

TEST(DockerObserverEngineTests, recovers_from_engine_errors) {
  TestDockerEngine engine;
  engine.set_containers(NGINX_LIST);
  engine.set_status(boost::beast::http::status::service_unavailable);
  std::shared_ptr<observer::DockerObserver> observer = create(engine_params(engine, 50));

  std::shared_ptr<RecordingNotifier> notifier(new RecordingNotifier);
  observer->subscribe(notifier);
  ASSERT_FALSE(observer->start().isError());
  ASSERT_TRUE(wait_for([&engine]() { return engine.get_list_count() >= 3; }));
  EXPECT_EQ(0, notifier->total());

  engine.set_status(boost::beast::http::status::ok);
  ASSERT_TRUE(wait_for([notifier]() { return notifier->count("add") == 1; }));
  ASSERT_FALSE(observer->shutdown().isError());
}

TEST(DockerObserverEngineTests, shutdown_with_hung_engine) {
  TestDockerEngine engine;
  engine.set_hang(true);
  std::shared_ptr<observer::DockerObserver> observer = create(engine_params(engine, 3600000));
  ASSERT_FALSE(observer->start().isError());
  ASSERT_TRUE(wait_for([&engine]() { return engine.get_list_count() == 1; }));

  std::chrono::steady_clock::time_point before = std::chrono::steady_clock::now();
  ASSERT_FALSE(observer->shutdown().isError());
  size_t elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - before).count();
  EXPECT_LT(elapsed_ms, 2500);
  EXPECT_EQ(observer::lifecycle::STOPPED, observer->state());
}

int main(int argc, char **argv) {
  ::google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = 1;
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
