#pragma once

#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "session/session.hpp"
#include "session/session_config.hpp"

namespace peerdrop {
namespace cli {

enum class Command {
  NONE,
  SEND,
  RECEIVE,
  HELP
};

struct ProgramOptions {
  Command command{Command::NONE};
  // send: the file to share; receive: unused
  std::string file;
  // send: requested id (optional); receive: the sender's id
  std::string peer_id;
  // receive only, empty means prompt on stdin
  std::string key;
  std::filesystem::path output{"."};
  std::string server;
  std::vector<std::string> turn_servers;
  bool verbose{false};
  std::string log_file;
  bool valid{false};
  std::string error;
};

// Process exit codes, one per error family
namespace exit_code {
constexpr int OK = 0;
constexpr int FAILURE = 1;
constexpr int USAGE = 2;
constexpr int SIGNALING = 3;
constexpr int NEGOTIATION = 4;
constexpr int CRYPTO = 5;
constexpr int PROTOCOL = 6;
constexpr int IO = 7;
constexpr int TRANSFER = 8;
constexpr int CANCELLED = 130;
} // namespace exit_code

// Arguments without the program name
ProgramOptions parse_arguments(const std::vector<std::string>& args);
void print_usage(std::ostream& out, const std::string& program_name);
int exit_code_for(const std::exception& error);
// Session configuration for the parsed command line
session::SessionConfig build_config(const ProgramOptions& options);

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(ProgramOptions options, session::SessionFactories factories,
      std::istream& in = std::cin, std::ostream& out = std::cout);


  // ---- STARTUP ----
  // Runs the command to completion and returns the process exit code
  int run();
  // Cancels the running session, safe from a signal handler thread
  void cancel();

private:
  // ---- PARAMETERS ----
  ProgramOptions options_;
  session::SessionFactories factories_;
  std::istream& in_;
  std::ostream& out_;

  std::mutex mutex_;
  session::Session* active_session_{nullptr};
  bool cancel_requested_{false};


  // ---- COMMAND PROCESSING ----
  int handle_send_command();
  int handle_receive_command();
  bool read_key(std::string& key);
  void attach(session::Session* session);
  int log_and_display_error(const std::string& message, const std::exception& error);
};

} // namespace cli
} // namespace peerdrop
