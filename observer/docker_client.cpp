#include "docker_client.hpp"

#include <functional>
#include <sstream>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <glog/logging.h>

namespace http = boost::beast::http;
namespace sp = std::placeholders;

namespace observer {

  /**
   * Looks up the engine's address without blocking the io thread. Implemented per protocol.
   */
  template <typename AsioProtocol>
  class EngineResolver;

  template <>
  class EngineResolver<boost::asio::local::stream_protocol> {
   public:
    typedef boost::asio::local::stream_protocol::endpoint endpoint_t;
    typedef std::function<void(boost::system::error_code, const endpoint_t&)> resolve_cb_t;

    EngineResolver(
        std::shared_ptr<boost::asio::io_service> io_service,
        const docker_api::DockerEndpoint& engine)
      : io_service(io_service),
        path(engine.path) { }

    void async_resolve(resolve_cb_t callback) {
      io_service->post(std::bind(callback, boost::system::error_code(), endpoint_t(path)));
    }

    void cancel() { }

   private:
    std::shared_ptr<boost::asio::io_service> io_service;
    const std::string path;
  };

  template <>
  class EngineResolver<boost::asio::ip::tcp> {
   public:
    typedef boost::asio::ip::tcp::endpoint endpoint_t;
    typedef std::function<void(boost::system::error_code, const endpoint_t&)> resolve_cb_t;

    EngineResolver(
        std::shared_ptr<boost::asio::io_service> io_service,
        const docker_api::DockerEndpoint& engine)
      : resolver(*io_service),
        host(engine.host),
        port(std::to_string(engine.port)) { }

    void async_resolve(resolve_cb_t callback) {
      resolver.async_resolve(host, port,
          [callback](boost::system::error_code ec,
              boost::asio::ip::tcp::resolver::results_type results) {
            if (!ec && results.empty()) {
              ec = boost::asio::error::host_not_found;
            }
            if (ec) {
              callback(ec, endpoint_t());
            } else {
              // Connect to the first entry in the list.
              callback(ec, results.begin()->endpoint());
            }
          });
    }

    // Any pending lookup completes with operation_aborted.
    void cancel() {
      resolver.cancel();
    }

   private:
    boost::asio::ip::tcp::resolver resolver;
    const std::string host;
    const std::string port;
  };

  /**
   * A single GET request against the engine, on its own connection. The callback is invoked
   * exactly once: with the decoded result, with an error, on deadline expiry, or on cancel().
   */
  template <typename AsioProtocol>
  class DockerListRequest : public std::enable_shared_from_this<DockerListRequest<AsioProtocol>> {
   public:
    DockerListRequest(
        std::shared_ptr<boost::asio::io_service> io_service,
        const docker_api::DockerEndpoint& engine,
        const std::string& host,
        const std::string& target,
        size_t timeout_ms,
        RuntimeClient::list_cb_t callback)
      : target(target),
        timeout_ms(timeout_ms),
        io_service(io_service),
        resolver(io_service, engine),
        deadline_timer(*io_service),
        socket(*io_service),
        callback(callback),
        done(false) {
      request.method(http::verb::get);
      request.target(target);
      request.version(11);
      request.set(http::field::host, host);
      parser.body_limit(boost::none);
    }

    void start() {
      DLOG(INFO) << "Requesting target[" << target << "] with timeout[" << timeout_ms << "ms]";
      deadline_timer.expires_from_now(boost::posix_time::milliseconds(timeout_ms));
      deadline_timer.async_wait(
          std::bind(&DockerListRequest::deadline_cb, this->shared_from_this(), sp::_1));
      resolver.async_resolve(
          std::bind(&DockerListRequest::resolve_cb, this->shared_from_this(), sp::_1, sp::_2));
    }

    void cancel(const std::string& reason) {
      complete(Error("Request for target[" + target + "] was cancelled: " + reason));
    }

   private:
    void deadline_cb(boost::system::error_code ec) {
      if (done || ec == boost::asio::error::operation_aborted) {
        return;
      }
      std::ostringstream oss;
      oss << "Request for target[" << target << "] timed out after " << timeout_ms << "ms";
      complete(Error(oss.str()));
    }

    void resolve_cb(boost::system::error_code ec, const typename AsioProtocol::endpoint& endpoint) {
      if (done) {
        return;
      }
      if (ec) {
        complete(Error("Unable to resolve engine for target[" + target + "]: " + ec.message()));
        return;
      }
      socket.async_connect(endpoint,
          std::bind(&DockerListRequest::connect_cb, this->shared_from_this(), sp::_1));
    }

    void connect_cb(boost::system::error_code ec) {
      if (done) {
        return;
      }
      if (ec) {
        complete(Error("Unable to connect to engine for target[" + target + "]: " + ec.message()));
        return;
      }
      http::async_write(socket, request,
          std::bind(&DockerListRequest::write_cb, this->shared_from_this(), sp::_1, sp::_2));
    }

    void write_cb(boost::system::error_code ec, size_t /*bytes_transferred*/) {
      if (done) {
        return;
      }
      if (ec) {
        complete(Error("Unable to send request for target[" + target + "]: " + ec.message()));
        return;
      }
      http::async_read(socket, buffer, parser,
          std::bind(&DockerListRequest::read_cb, this->shared_from_this(), sp::_1, sp::_2));
    }

    void read_cb(boost::system::error_code ec, size_t /*bytes_transferred*/) {
      if (done) {
        return;
      }
      if (ec) {
        complete(Error("Unable to read response for target[" + target + "]: " + ec.message()));
        return;
      }
      const http::response<http::string_body>& response = parser.get();
      if (response.result() != http::status::ok) {
        std::ostringstream oss;
        oss << "Engine returned status[" << response.result_int() << "] "
            << "for target[" << target << "]: " << response.body();
        complete(Error(oss.str()));
        return;
      }
      complete(docker_api::parse_container_list(response.body()));
    }

    void complete(const Try<std::vector<Container>>& result) {
      if (done) {
        return;
      }
      done = true;

      boost::system::error_code ec;
      deadline_timer.cancel(ec);
      resolver.cancel();
      socket.close(ec);

      // Release the callback before invoking it, in case it holds a reference back to us.
      RuntimeClient::list_cb_t cb;
      cb.swap(callback);
      cb(result);
    }

    const std::string target;
    const size_t timeout_ms;

    std::shared_ptr<boost::asio::io_service> io_service;
    EngineResolver<AsioProtocol> resolver;
    boost::asio::deadline_timer deadline_timer;
    typename AsioProtocol::socket socket;
    http::request<http::empty_body> request;
    boost::beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    RuntimeClient::list_cb_t callback;
    bool done;
  };

  /**
   * A long-lived GET against the engine's event endpoint. The chunked response body is split
   * into lines, and each line is decoded as one event. closed_cb is invoked once if the stream
   * fails or ends, but not after cancel().
   */
  template <typename AsioProtocol>
  class DockerEventStream : public std::enable_shared_from_this<DockerEventStream<AsioProtocol>> {
   public:
    typedef std::function<void(const std::string& reason)> closed_cb_t;

    DockerEventStream(
        std::shared_ptr<boost::asio::io_service> io_service,
        const docker_api::DockerEndpoint& engine,
        const std::string& host,
        const std::string& target,
        RuntimeClient::event_cb_t event_cb,
        closed_cb_t closed_cb)
      : target(target),
        io_service(io_service),
        resolver(io_service, engine),
        socket(*io_service),
        event_cb(event_cb),
        closed_cb(closed_cb),
        closed(false) {
      request.method(http::verb::get);
      request.target(target);
      request.version(11);
      request.set(http::field::host, host);
      // The stream never ends on its own, so its body can't be limited.
      parser.body_limit(boost::none);
      // The parser keeps a reference to this callback, which must outlive it.
      chunk_body_cb = std::bind(&DockerEventStream::chunk_body, this, sp::_1, sp::_2, sp::_3);
      parser.on_chunk_body(chunk_body_cb);
    }

    void start() {
      LOG(INFO) << "Opening event stream[" << target << "]";
      resolver.async_resolve(
          std::bind(&DockerEventStream::resolve_cb, this->shared_from_this(), sp::_1, sp::_2));
    }

    void cancel() {
      closed = true;
      resolver.cancel();
      boost::system::error_code ec;
      socket.close(ec);
    }

   private:
    void resolve_cb(boost::system::error_code ec, const typename AsioProtocol::endpoint& endpoint) {
      if (closed) {
        return;
      }
      if (ec) {
        close("unable to resolve engine: " + ec.message());
        return;
      }
      socket.async_connect(endpoint,
          std::bind(&DockerEventStream::connect_cb, this->shared_from_this(), sp::_1));
    }

    void connect_cb(boost::system::error_code ec) {
      if (closed) {
        return;
      }
      if (ec) {
        close("unable to connect to engine: " + ec.message());
        return;
      }
      http::async_write(socket, request,
          std::bind(&DockerEventStream::write_cb, this->shared_from_this(), sp::_1, sp::_2));
    }

    void write_cb(boost::system::error_code ec, size_t /*bytes_transferred*/) {
      if (closed) {
        return;
      }
      if (ec) {
        close("unable to send request: " + ec.message());
        return;
      }
      http::async_read_header(socket, buffer, parser,
          std::bind(&DockerEventStream::header_cb, this->shared_from_this(), sp::_1, sp::_2));
    }

    void header_cb(boost::system::error_code ec, size_t /*bytes_transferred*/) {
      if (closed) {
        return;
      }
      if (ec) {
        close("unable to read response header: " + ec.message());
        return;
      }
      if (parser.get().result() != http::status::ok) {
        std::ostringstream oss;
        oss << "engine returned status[" << parser.get().result_int() << "]";
        close(oss.str());
        return;
      }
      LOG(INFO) << "Event stream[" << target << "] is open";
      http::async_read(socket, buffer, parser,
          std::bind(&DockerEventStream::read_cb, this->shared_from_this(), sp::_1, sp::_2));
    }

    void read_cb(boost::system::error_code ec, size_t /*bytes_transferred*/) {
      if (closed) {
        return;
      }
      if (ec) {
        close("unable to read events: " + ec.message());
      } else {
        close("engine ended the stream");
      }
    }

    size_t chunk_body(
        std::uint64_t /*remain*/, boost::beast::string_view body, boost::beast::error_code& /*ec*/) {
      pending.append(body.data(), body.size());
      size_t newline;
      while (!closed && (newline = pending.find('\n')) != std::string::npos) {
        std::string line = pending.substr(0, newline);
        pending.erase(0, newline + 1);
        if (!line.empty() && line[line.size() - 1] == '\r') {
          line.erase(line.size() - 1);
        }
        if (line.empty()) {
          continue;
        }
        Try<ContainerEvent> event = docker_api::parse_event(line);
        if (event.isError()) {
          LOG(WARNING) << "Skipping event: " << event.error();
          continue;
        }
        DLOG(INFO) << "Got event[" << event.get().string() << "]";
        event_cb(event.get());
      }
      return body.size();
    }

    void close(const std::string& reason) {
      if (closed) {
        return;
      }
      closed = true;
      resolver.cancel();
      boost::system::error_code ec;
      socket.close(ec);
      closed_cb(reason);
    }

    const std::string target;

    std::shared_ptr<boost::asio::io_service> io_service;
    EngineResolver<AsioProtocol> resolver;
    typename AsioProtocol::socket socket;
    http::request<http::empty_body> request;
    boost::beast::flat_buffer buffer;
    http::response_parser<http::empty_body> parser;
    std::function<size_t(std::uint64_t, boost::beast::string_view, boost::beast::error_code&)>
      chunk_body_cb;
    std::string pending;
    RuntimeClient::event_cb_t event_cb;
    closed_cb_t closed_cb;
    bool closed;
  };
}

template <typename AsioProtocol>
observer::DockerClient<AsioProtocol>::DockerClient(
    std::shared_ptr<boost::asio::io_service> io_service,
    const docker_api::DockerEndpoint& engine,
    const std::string& api_version,
    size_t event_reconnect_secs)
  : engine(engine),
    api_version(api_version),
    event_reconnect_secs(event_reconnect_secs),
    io_service(io_service),
    event_reconnect_timer(*io_service),
    is_shutdown(false) {
  LOG(INFO) << "DockerClient constructed for engine[" << engine.string() << "] "
            << "api_version[" << api_version << "]";
}

template <typename AsioProtocol>
observer::DockerClient<AsioProtocol>::~DockerClient() {
  if (!is_shutdown) {
    LOG(WARNING) << "DockerClient for engine[" << engine.string() << "] "
                 << "destroyed without being shut down";
  }
}

template <typename AsioProtocol>
void observer::DockerClient<AsioProtocol>::async_list_containers(
    size_t timeout_ms, list_cb_t callback) {
  if (is_shutdown) {
    io_service->post(std::bind(callback,
            Try<std::vector<Container>>(Error("DockerClient has been shut down"))));
    return;
  }

  // Forget any completed requests.
  for (auto iter = list_requests.begin(); iter != list_requests.end();) {
    if (iter->expired()) {
      iter = list_requests.erase(iter);
    } else {
      ++iter;
    }
  }

  list_request_ptr_t request(new DockerListRequest<AsioProtocol>(
          io_service, engine, host_header(), docker_api::containers_path(api_version),
          timeout_ms, callback));
  list_requests.push_back(request);
  request->start();
}

template <typename AsioProtocol>
void observer::DockerClient<AsioProtocol>::watch_events(event_cb_t callback) {
  if (is_shutdown) {
    LOG(WARNING) << "Ignoring request to watch events: DockerClient has been shut down";
    return;
  }
  event_cb = callback;
  start_event_stream();
}

template <typename AsioProtocol>
Try<Nothing> observer::DockerClient<AsioProtocol>::shutdown() {
  if (is_shutdown) {
    return Nothing();
  }
  LOG(INFO) << "Shutting down DockerClient for engine[" << engine.string() << "]";
  is_shutdown = true;

  boost::system::error_code ec;
  event_reconnect_timer.cancel(ec);

  if (event_stream) {
    event_stream->cancel();
    event_stream.reset();
  }

  for (std::weak_ptr<DockerListRequest<AsioProtocol>>& weak_request : list_requests) {
    list_request_ptr_t request = weak_request.lock();
    if (request) {
      request->cancel("client is shutting down");
    }
  }
  list_requests.clear();

  if (ec) {
    return Error("Event reconnect timer cancellation returned error: " + ec.message());
  }
  return Nothing();
}

template <typename AsioProtocol>
std::string observer::DockerClient<AsioProtocol>::host_header() const {
  if (engine.scheme == docker_api::endpoint_scheme::TCP) {
    return engine.host + ":" + std::to_string(engine.port);
  }
  // The engine ignores the host of requests over its unix socket.
  return "localhost";
}

template <typename AsioProtocol>
void observer::DockerClient<AsioProtocol>::start_event_stream() {
  if (is_shutdown) {
    return;
  }
  event_stream.reset(new DockerEventStream<AsioProtocol>(
          io_service, engine, host_header(), docker_api::events_path(api_version),
          event_cb, std::bind(&DockerClient<AsioProtocol>::event_stream_closed_cb, this, sp::_1)));
  event_stream->start();
}

template <typename AsioProtocol>
void observer::DockerClient<AsioProtocol>::event_stream_closed_cb(const std::string& reason) {
  if (is_shutdown) {
    return;
  }
  LOG(WARNING) << "Event stream for engine[" << engine.string() << "] closed (" << reason << "), "
               << "reconnecting in " << event_reconnect_secs << "s";
  event_reconnect_timer.expires_from_now(boost::posix_time::seconds(event_reconnect_secs));
  event_reconnect_timer.async_wait(
      std::bind(&DockerClient<AsioProtocol>::event_reconnect_cb, this, sp::_1));
}

template <typename AsioProtocol>
void observer::DockerClient<AsioProtocol>::event_reconnect_cb(boost::system::error_code ec) {
  if (is_shutdown || ec == boost::asio::error::operation_aborted) {
    return;
  }
  start_event_stream();
}

observer::runtime_client_ptr_t observer::docker_client_factory(
    std::shared_ptr<boost::asio::io_service> io_service, const ObserverConfig& config) {
  Try<docker_api::DockerEndpoint> engine = docker_api::parse_endpoint(config.endpoint);
  if (engine.isError()) {
    LOG(FATAL) << "Invalid engine endpoint (should have been validated): " << engine.error();
    return runtime_client_ptr_t();
  }
  switch (engine.get().scheme) {
    case docker_api::endpoint_scheme::UNIX:
      return runtime_client_ptr_t(new DockerClient<boost::asio::local::stream_protocol>(
              io_service, engine.get(), config.api_version, config.event_reconnect_secs));
    case docker_api::endpoint_scheme::TCP:
      return runtime_client_ptr_t(new DockerClient<boost::asio::ip::tcp>(
              io_service, engine.get(), config.api_version, config.event_reconnect_secs));
    case docker_api::endpoint_scheme::UNKNOWN:
      break;
  }
  LOG(FATAL) << "Unsupported engine endpoint[" << config.endpoint << "]";
  return runtime_client_ptr_t();
}

template class observer::DockerClient<boost::asio::local::stream_protocol>;
template class observer::DockerClient<boost::asio::ip::tcp>;
