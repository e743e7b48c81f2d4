#pragma once

#include <future>
#include <list>
#include <mutex>
#include <string>
#include <thread>
#include <stdlib.h>
#include <unistd.h>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <glog/logging.h>

/**
 * A minimal HTTP server on a unix socket which answers container list requests with a
 * configurable body, and serves a chunked event stream which tests may push events into.
 */
class TestDockerEngine {
  typedef boost::asio::local::stream_protocol protocol_t;
  typedef std::shared_ptr<protocol_t::socket> socket_ptr_t;

 public:
  TestDockerEngine()
    : acceptor(io_service),
      work(new boost::asio::io_service::work(io_service)),
      status(boost::beast::http::status::ok),
      containers_json("[]"),
      hang(false),
      list_count(0),
      event_stream_count(0) {
    char dir_template[] = "/tmp/docker-observer-test-XXXXXX";
    if (mkdtemp(dir_template) == NULL) {
      LOG(FATAL) << "Failed to create temp dir for test engine socket";
    }
    dir = dir_template;
    path = dir + "/docker.sock";

    protocol_t::endpoint endpoint(path);
    acceptor.open(endpoint.protocol());
    acceptor.bind(endpoint);
    acceptor.listen();
    start_accept();
    thread = std::thread([this]() { io_service.run(); });
    LOG(INFO) << "Test engine listening at " << path;
  }

  ~TestDockerEngine() {
    std::promise<void> closed;
    io_service.post([this, &closed]() {
          boost::system::error_code ec;
          acceptor.close(ec);
          for (socket_ptr_t socket : event_sockets) {
            socket->close(ec);
          }
          event_sockets.clear();
          for (connection_ptr_t conn : held) {
            conn->socket->close(ec);
          }
          held.clear();
          closed.set_value();
        });
    closed.get_future().wait();
    work.reset();
    io_service.stop();
    thread.join();
    unlink(path.c_str());
    rmdir(dir.c_str());
  }

  std::string endpoint() const {
    return "unix://" + path;
  }

  void set_containers(const std::string& json) {
    std::unique_lock<std::mutex> lock(mutex);
    containers_json = json;
  }

  void set_status(boost::beast::http::status status_) {
    std::unique_lock<std::mutex> lock(mutex);
    status = status_;
  }

  /**
   * When enabled, list requests are read but never answered.
   */
  void set_hang(bool hang_) {
    std::unique_lock<std::mutex> lock(mutex);
    hang = hang_;
  }

  size_t get_list_count() {
    std::unique_lock<std::mutex> lock(mutex);
    return list_count;
  }

  size_t get_event_stream_count() {
    std::unique_lock<std::mutex> lock(mutex);
    return event_stream_count;
  }

  /**
   * Sends a line to every open event stream.
   */
  void push_event(const std::string& json) {
    std::string line = json + "\n";
    io_service.post([this, line]() {
          for (auto iter = event_sockets.begin(); iter != event_sockets.end();) {
            boost::system::error_code ec;
            boost::asio::write(**iter,
                boost::beast::http::make_chunk(boost::asio::buffer(line)), ec);
            if (ec) {
              LOG(WARNING) << "Dropping event stream: " << ec.message();
              iter = event_sockets.erase(iter);
            } else {
              ++iter;
            }
          }
        });
  }

  /**
   * Closes every open event stream, as if the engine had restarted.
   */
  void close_event_streams() {
    io_service.post([this]() {
          for (socket_ptr_t socket : event_sockets) {
            boost::system::error_code ec;
            socket->close(ec);
          }
          event_sockets.clear();
          std::unique_lock<std::mutex> lock(mutex);
          event_stream_count = 0;
        });
  }

 private:
  struct Connection {
    Connection(boost::asio::io_service& io_service)
      : socket(new protocol_t::socket(io_service)) { }

    socket_ptr_t socket;
    boost::beast::flat_buffer buffer;
    boost::beast::http::request<boost::beast::http::string_body> request;
    boost::beast::http::response<boost::beast::http::string_body> response;
  };
  typedef std::shared_ptr<Connection> connection_ptr_t;

  void start_accept() {
    connection_ptr_t conn(new Connection(io_service));
    acceptor.async_accept(*conn->socket, [this, conn](boost::system::error_code ec) {
          if (ec) {
            return;
          }
          boost::beast::http::async_read(*conn->socket, conn->buffer, conn->request,
              [this, conn](boost::system::error_code ec, size_t) {
                if (!ec) {
                  handle(conn);
                }
              });
          start_accept();
        });
  }

  void handle(connection_ptr_t conn) {
    namespace http = boost::beast::http;
    std::string target = conn->request.target().to_string();
    LOG(INFO) << "Test engine got request[" << target << "]";

    if (target.find("/events") != std::string::npos) {
      http::response<http::empty_body> header(http::status::ok, 11);
      header.set(http::field::content_type, "application/json");
      header.chunked(true);
      http::response_serializer<http::empty_body> serializer(header);
      boost::system::error_code ec;
      http::write_header(*conn->socket, serializer, ec);
      if (ec) {
        LOG(WARNING) << "Failed to open event stream: " << ec.message();
        return;
      }
      event_sockets.push_back(conn->socket);
      std::unique_lock<std::mutex> lock(mutex);
      ++event_stream_count;
      return;
    }

    {
      std::unique_lock<std::mutex> lock(mutex);
      if (target.find("/containers/json") != std::string::npos) {
        ++list_count;
        if (hang) {
          held.push_back(conn);
          return;
        }
        conn->response.result(status);
        conn->response.body() = (status == http::status::ok)
          ? containers_json : "{\"message\":\"engine error\"}";
      } else {
        conn->response.result(http::status::not_found);
        conn->response.body() = "{\"message\":\"page not found\"}";
      }
    }
    conn->response.version(11);
    conn->response.set(http::field::content_type, "application/json");
    conn->response.keep_alive(false);
    conn->response.prepare_payload();
    http::async_write(*conn->socket, conn->response,
        [conn](boost::system::error_code, size_t) {
          boost::system::error_code ec;
          conn->socket->shutdown(protocol_t::socket::shutdown_send, ec);
        });
  }

  boost::asio::io_service io_service;
  protocol_t::acceptor acceptor;
  std::unique_ptr<boost::asio::io_service::work> work;
  std::thread thread;
  std::string dir;
  std::string path;

  // Only accessed from within the io_service thread.
  std::list<socket_ptr_t> event_sockets;
  std::list<connection_ptr_t> held;

  std::mutex mutex;
  boost::beast::http::status status;
  std::string containers_json;
  bool hang;
  size_t list_count;
  size_t event_stream_count;
};
