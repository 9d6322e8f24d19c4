#include "cli/cli.hpp"
#include <iomanip>
#include <unordered_map>
#include <boost/algorithm/string/trim.hpp>
#include <boost/log/trivial.hpp>
#include "crypto/crypto_engine.hpp"
#include "negotiation/negotiation_error.hpp"
#include "session/receiver_session.hpp"
#include "session/sender_session.hpp"
#include "session/session_error.hpp"
#include "signaling/signaling_error.hpp"
#include "store/store_error.hpp"
#include "transfer/transfer_error.hpp"

namespace peerdrop {
namespace cli {

namespace {

// Prints what the user needs to see; logging stays on stderr
class ConsoleObserver : public session::SessionObserver {
public:
  explicit ConsoleObserver(std::ostream& out) : out_(out) {}

  void on_share_details(const std::string& peer_id, const std::string& key_base64) override {
    out_ << "Peer ID: " << peer_id << '\n'
         << "Key:     " << key_base64 << '\n'
         << "On the receiving machine run:\n"
         << "  peerdrop receive " << peer_id << " --key " << key_base64 << '\n'
         << "Waiting for the receiver..." << std::endl;
  }

  void on_connected(const std::string& remote_peer_id) override {
    out_ << "Connected to " << remote_peer_id << std::endl;
  }

  void on_progress(const transfer::TransferProgress& progress) override {
    const int percent = progress.total_bytes == 0
        ? 100
        : static_cast<int>(progress.bytes_transferred * 100 / progress.total_bytes);
    if (percent == last_percent_) {
      return;
    }
    last_percent_ = percent;
    out_ << '\r' << std::setw(3) << percent << "% "
         << progress.bytes_transferred << '/' << progress.total_bytes << " bytes" << std::flush;
  }

  void on_complete(const std::filesystem::path& path) override {
    if (last_percent_ >= 0) {
      out_ << '\n';
    }
    out_ << "Done: " << path.string() << std::endl;
  }

private:
  std::ostream& out_;
  int last_percent_{-1};
};

} // namespace

//==============================================
// ARGUMENT PARSING
//==============================================

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage:\n"
      << "  " << program_name << " send <file> [--peer-id ID] [--server URL]\n"
      << "  " << program_name << " receive <peer-id> [--key KEY] [--output DIR] [--server URL]\n"
      << "Options:\n"
      << "  --peer-id ID     Register under ID instead of a generated one\n"
      << "  --key KEY        Base64 key printed by the sender (prompted when omitted)\n"
      << "  --output DIR     Directory for the received file (default: .)\n"
      << "  --server URL     PeerJS signaling server (default: 0.peerjs.com)\n"
      << "  --turn URL       TURN server turn:user:password@host:port, repeatable\n"
      << "  --log-file PATH  Also write logs to PATH\n"
      << "  -v, --verbose    Debug logging\n"
      << "  -h, --help       Show this help\n";
}

ProgramOptions parse_arguments(const std::vector<std::string>& args) {
  const std::unordered_map<std::string, std::string ProgramOptions::*> flag_map = {
    {"--peer-id", &ProgramOptions::peer_id},
    {"--key", &ProgramOptions::key},
    {"--server", &ProgramOptions::server},
    {"--log-file", &ProgramOptions::log_file}
  };

  ProgramOptions options;
  std::vector<std::string> positional;
  std::string output;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (arg == "-h" || arg == "--help") {
      options.command = Command::HELP;
      options.valid = true;
      return options;
    }
    if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
      continue;
    }
    if (arg.rfind("--", 0) != 0) {
      positional.push_back(arg);
      continue;
    }
    if (i + 1 >= args.size()) {
      options.error = "missing value for " + arg;
      return options;
    }
    const std::string& value = args[++i];

    if (arg == "--output") {
      output = value;
    } else if (arg == "--turn") {
      options.turn_servers.push_back(value);
    } else if (auto it = flag_map.find(arg); it != flag_map.end()) {
      options.*(it->second) = value;
    } else {
      options.error = "unknown argument: " + arg;
      return options;
    }
  }

  if (positional.empty()) {
    options.error = "missing command";
    return options;
  }
  if (positional.size() != 2) {
    options.error = "expected exactly one argument after '" + positional[0] + "'";
    return options;
  }

  if (positional[0] == "send") {
    options.command = Command::SEND;
    options.file = positional[1];
    if (!options.key.empty() || !output.empty()) {
      options.error = "--key and --output only apply to receive";
      return options;
    }
  } else if (positional[0] == "receive") {
    options.command = Command::RECEIVE;
    if (!options.peer_id.empty()) {
      options.error = "--peer-id only applies to send";
      return options;
    }
    options.peer_id = positional[1];
    if (!output.empty()) {
      options.output = output;
    }
  } else {
    options.error = "unknown command: " + positional[0];
    return options;
  }

  options.valid = true;
  return options;
}

session::SessionConfig build_config(const ProgramOptions& options) {
  session::SessionConfig config = options.command == Command::RECEIVE
      ? session::SessionConfig::receiver_defaults()
      : session::SessionConfig::sender_defaults();

  if (!options.server.empty()) {
    config.signaling.server = options.server;
  }
  config.rtc.turn_servers = options.turn_servers;
  config.log.min_level = options.verbose ? boost::log::trivial::debug : boost::log::trivial::info;
  config.log.log_file = options.log_file;
  return config;
}

int exit_code_for(const std::exception& error) {
  if (dynamic_cast<const session::SessionCancelled*>(&error) ||
      dynamic_cast<const negotiation::NegotiationCancelled*>(&error) ||
      dynamic_cast<const transfer::TransferCancelled*>(&error)) {
    return exit_code::CANCELLED;
  }
  if (dynamic_cast<const session::SessionError*>(&error) ||
      dynamic_cast<const std::invalid_argument*>(&error)) {
    return exit_code::USAGE;
  }
  if (dynamic_cast<const signaling::SignalingError*>(&error)) {
    return exit_code::SIGNALING;
  }
  if (dynamic_cast<const negotiation::NegotiationError*>(&error)) {
    return exit_code::NEGOTIATION;
  }
  if (dynamic_cast<const crypto::CryptoError*>(&error)) {
    return exit_code::CRYPTO;
  }
  if (dynamic_cast<const transfer::ProtocolViolation*>(&error)) {
    return exit_code::PROTOCOL;
  }
  if (dynamic_cast<const store::IoError*>(&error)) {
    return exit_code::IO;
  }
  if (dynamic_cast<const transfer::TransferError*>(&error)) {
    return exit_code::TRANSFER;
  }
  return exit_code::FAILURE;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(ProgramOptions options, session::SessionFactories factories,
         std::istream& in, std::ostream& out)
  : options_(std::move(options))
  , factories_(std::move(factories))
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(debug) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

int CLI::run() {
  switch (options_.command) {
    case Command::SEND:
      return handle_send_command();
    case Command::RECEIVE:
      return handle_receive_command();
    case Command::HELP:
      print_usage(out_, "peerdrop");
      return exit_code::OK;
    case Command::NONE:
      break;
  }
  print_usage(out_, "peerdrop");
  return exit_code::USAGE;
}

void CLI::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancel_requested_ = true;
  if (active_session_) {
    active_session_->cancel();
  }
}


//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::handle_send_command() {
  ConsoleObserver observer(out_);
  try {
    session::SenderSession session(build_config(options_), factories_);
    session.set_observer(&observer);
    attach(&session);
    const transfer::FileMetadata metadata = session.run(options_.file, options_.peer_id);
    attach(nullptr);
    BOOST_LOG_TRIVIAL(info) << "CLI: Sent " << metadata.size << " bytes in "
                            << metadata.total_chunks << " chunks";
    return exit_code::OK;
  } catch (const std::exception& e) {
    attach(nullptr);
    return log_and_display_error("Send failed", e);
  }
}

int CLI::handle_receive_command() {
  std::string encoded = options_.key;
  if (encoded.empty() && !read_key(encoded)) {
    out_ << "No key given" << std::endl;
    return exit_code::USAGE;
  }

  ConsoleObserver observer(out_);
  try {
    const crypto::CryptoEngine::Key key = crypto::CryptoEngine::key_from_base64(encoded);
    session::ReceiverSession session(build_config(options_), factories_, key);
    session.set_observer(&observer);
    attach(&session);
    session.run(options_.peer_id, options_.output);
    attach(nullptr);
    return exit_code::OK;
  } catch (const std::exception& e) {
    attach(nullptr);
    return log_and_display_error("Receive failed", e);
  }
}

bool CLI::read_key(std::string& key) {
  out_ << "Enter key: " << std::flush;
  if (!std::getline(in_, key)) {
    return false;
  }
  boost::algorithm::trim(key);
  return !key.empty();
}

void CLI::attach(session::Session* session) {
  std::lock_guard<std::mutex> lock(mutex_);
  active_session_ = session;
  if (session && cancel_requested_) {
    session->cancel();
  }
}

int CLI::log_and_display_error(const std::string& message, const std::exception& error) {
  const int code = exit_code_for(error);
  if (code == exit_code::CANCELLED) {
    BOOST_LOG_TRIVIAL(info) << "CLI: " << message << ": " << error.what();
    out_ << "Cancelled" << std::endl;
  } else {
    BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error.what();
    out_ << message << ": " << error.what() << std::endl;
  }
  return code;
}

} // namespace cli
} // namespace peerdrop
