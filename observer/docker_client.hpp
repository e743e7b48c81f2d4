#pragma once

#include <list>
#include <memory>
#include <string>

#include <boost/asio.hpp>

#include "docker_api.hpp"
#include "runtime_client.hpp"

namespace observer {

  template <typename AsioProtocol>
  class DockerListRequest;
  template <typename AsioProtocol>
  class DockerEventStream;

  /**
   * A RuntimeClient which talks HTTP/1.1 to a Docker engine over a unix socket
   * (boost::asio::local::stream_protocol) or over TCP (boost::asio::ip::tcp).
   *
   * Each list request uses its own connection, which is closed when the request completes or
   * times out. The event stream holds a single long-lived connection, which is re-opened after a
   * delay whenever it fails or is closed by the engine.
   */
  template <typename AsioProtocol>
  class DockerClient : public RuntimeClient {
   public:

    DockerClient(
        std::shared_ptr<boost::asio::io_service> io_service,
        const docker_api::DockerEndpoint& engine,
        const std::string& api_version,
        size_t event_reconnect_secs);

    virtual ~DockerClient();

    void async_list_containers(size_t timeout_ms, list_cb_t callback);

    void watch_events(event_cb_t callback);

    Try<Nothing> shutdown();

   private:
    typedef std::shared_ptr<DockerListRequest<AsioProtocol>> list_request_ptr_t;
    typedef std::shared_ptr<DockerEventStream<AsioProtocol>> event_stream_ptr_t;

    std::string host_header() const;

    void start_event_stream();
    void event_stream_closed_cb(const std::string& reason);
    void event_reconnect_cb(boost::system::error_code ec);

    const docker_api::DockerEndpoint engine;
    const std::string api_version;
    const size_t event_reconnect_secs;

    std::shared_ptr<boost::asio::io_service> io_service;
    boost::asio::deadline_timer event_reconnect_timer;
    std::list<std::weak_ptr<DockerListRequest<AsioProtocol>>> list_requests;
    event_stream_ptr_t event_stream;
    event_cb_t event_cb;
    bool is_shutdown;
  };

  /**
   * Creates a DockerClient for the engine endpoint named in the config.
   */
  runtime_client_ptr_t docker_client_factory(
      std::shared_ptr<boost::asio::io_service> io_service, const ObserverConfig& config);
}
