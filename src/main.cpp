#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "network/datachannel_engine.hpp"
#include "signaling/websocket_transport.hpp"

namespace {

peerdrop::session::SessionFactories make_factories() {
  peerdrop::session::SessionFactories factories;
  factories.make_transport = [] {
    return std::make_unique<peerdrop::signaling::WebSocketTransport>();
  };
  factories.make_engine = [](const peerdrop::network::RtcConfig& config) {
    return std::make_unique<peerdrop::network::DataChannelEngine>(config);
  };
  return factories;
}

int run_cli(const peerdrop::cli::ProgramOptions& options) {
  peerdrop::cli::CLI cli(options, make_factories());

  // Ctrl-C cancels the session instead of killing the process
  boost::asio::io_context signal_context;
  boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
  signals.async_wait([&cli](const boost::system::error_code& ec, int signal_number) {
    if (!ec) {
      BOOST_LOG_TRIVIAL(info) << "Received signal " << signal_number << ", cancelling";
      cli.cancel();
    }
  });
  std::thread signal_thread([&signal_context] { signal_context.run(); });

  const int code = cli.run();

  signals.cancel();
  signal_context.stop();
  signal_thread.join();
  return code;
}

} // namespace

int main(int argc, char* argv[]) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  const auto options = peerdrop::cli::parse_arguments(args);
  if (!options.valid) {
    std::cerr << "Error: " << options.error << '\n';
    peerdrop::cli::print_usage(std::cerr, argv[0]);
    return peerdrop::cli::exit_code::USAGE;
  }

  try {
    peerdrop::logging::init_logging(peerdrop::cli::build_config(options).log);
  } catch (const std::exception& e) {
    std::cerr << "Error: cannot set up logging: " << e.what() << '\n';
    return peerdrop::cli::exit_code::IO;
  }

  return run_cli(options);
}
