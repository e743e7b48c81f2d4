#include <signal.h>
#include <stdio.h>
#include <string.h>

#include <string>
#include <vector>

#include <boost/asio.hpp>

#include <glog/logging.h>
#include <google/protobuf/util/json_util.h>

#include <stout/os.hpp>
#include <stout/strings.hpp>

#include "docker_observer.hpp"
#include "logging_notifier.hpp"

#define CONFIG_FLAG "--config="

namespace {
  void print_usage(const char* argv0) {
    fprintf(stderr,
        "Usage: %s [" CONFIG_FLAG "<file.json>] [key=value ...]\n"
        "The config file holds a Parameters object, eg "
        "{\"parameter\": [{\"key\": \"poll_interval_ms\", \"value\": \"10000\"}]}\n"
        "key=value arguments take precedence over the config file.\n", argv0);
  }

  Try<observer::Parameters> load_config_file(const std::string& path) {
    Try<std::string> content = os::read(path);
    if (content.isError()) {
      return Error("Unable to read config file[" + path + "]: " + content.error());
    }
    observer::Parameters params;
    google::protobuf::util::Status status =
      google::protobuf::util::JsonStringToMessage(content.get(), &params);
    if (!status.ok()) {
      return Error("Unable to parse config file[" + path + "]: " + status.ToString());
    }
    return params;
  }

  void signal_cb(const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      LOG(ERROR) << "Signal wait returned error. err='" << ec.message() << "'(" << ec << ")";
      return;
    }
    LOG(INFO) << "Got signal " << signal_number << " (" << strsignal(signal_number) << ")";
  }
}

/**
 * Runs a DockerObserver against the configured engine, logging every endpoint change until
 * SIGINT or SIGTERM is received.
 */
int main(int argc, char* argv[]) {
  google::InitGoogleLogging(argv[0]);

  observer::Parameters params;
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    }
    if (strings::startsWith(arg, CONFIG_FLAG)) {
      config_path = strings::remove(arg, CONFIG_FLAG, strings::PREFIX);
      continue;
    }
    std::vector<std::string> key_value = strings::split(arg, "=", 2);
    if (key_value.size() != 2 || key_value[0].empty()) {
      fprintf(stderr, "Invalid argument: %s\n", argv[i]);
      print_usage(argv[0]);
      return -1;
    }
    observer::Parameter* param = params.add_parameter();
    param->set_key(key_value[0]);
    param->set_value(key_value[1]);
  }

  if (!config_path.empty()) {
    Try<observer::Parameters> file_params = load_config_file(config_path);
    if (file_params.isError()) {
      LOG(ERROR) << file_params.error();
      return -1;
    }
    // The first occurrence of a key wins, so these go after the command line params.
    params.MergeFrom(file_params.get());
  }

  Try<std::shared_ptr<observer::DockerObserver>> docker_observer =
    observer::DockerObserver::create(params);
  if (docker_observer.isError()) {
    LOG(ERROR) << docker_observer.error();
    return -1;
  }

  docker_observer.get()->subscribe(std::make_shared<observer::LoggingNotifier>());

  // Register for signals before starting, so that none are missed.
  boost::asio::io_service signal_io_service;
  boost::asio::signal_set signals(signal_io_service, SIGINT, SIGTERM);
  signals.async_wait(&signal_cb);

  Try<Nothing> result = docker_observer.get()->start();
  if (result.isError()) {
    LOG(ERROR) << "Failed to start: " << result.error();
    return -1;
  }

  // Block until a signal arrives.
  signal_io_service.run();

  result = docker_observer.get()->shutdown();
  if (result.isError()) {
    LOG(ERROR) << "Failed to shut down: " << result.error();
    return -1;
  }
  return 0;
}
