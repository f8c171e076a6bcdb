#include <atomic>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "common/auth/peer_key_store.h"
#include "common/errors/error.h"
#include "common/logging/logger.h"
#include "common/media/mime_sniffer.h"
#include "transport/session/session.h"
#include "transport/session/session_config.h"
#include "transport/stream/tcp_connector.h"

using namespace ghostlink;

namespace {

struct ChatOptions {
  std::string mode;
  std::string address{"127.0.0.1"};
  std::uint16_t port{7420};
  std::string config_file;
  std::string key_store;
  std::string pairing_secret;
  std::string peer_id;
  std::string log_level;
  std::string log_file;
  std::string save_dir{"."};
};

bool parse_args(int argc, char* argv[], ChatOptions& options, std::error_code& ec) {
  CLI::App app{"GhostLink chat"};

  app.add_option("mode", options.mode, "host or client")
      ->required()
      ->check(CLI::IsMember({"host", "client"}));
  app.add_option("-a,--address", options.address,
                 "Bind address (host) or peer address (client)")
      ->default_val("127.0.0.1");
  app.add_option("-p,--port", options.port, "TCP port standing in for the RFCOMM channel")
      ->default_val(7420);
  app.add_option("-c,--config", options.config_file, "Configuration file path");
  app.add_option("-k,--key-store", options.key_store, "Pinned key store (JSON)");
  app.add_option("--pairing-secret", options.pairing_secret, "Pairing secret file");
  app.add_option("--peer-id", options.peer_id, "Name the peer key is pinned under");
  app.add_option("--log-level", options.log_level, "trace, debug, info, warn, error or off");
  app.add_option("--log-file", options.log_file, "Log file path");
  app.add_option("--save-dir", options.save_dir, "Directory for received media")
      ->default_val(".");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    app.exit(e);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  return true;
}

bool build_config(const ChatOptions& options, transport::SessionConfig& config,
                  std::error_code& ec) {
  config.role = options.mode == "host" ? transport::Role::kHost : transport::Role::kClient;
  if (!options.config_file.empty() && !transport::load_config_file(options.config_file, config, ec)) {
    return false;
  }
  // Command line wins over the file.
  if (!options.key_store.empty()) {
    config.key_store_path = options.key_store;
  }
  if (!options.pairing_secret.empty()) {
    config.pairing_secret_file = options.pairing_secret;
  }
  if (!options.peer_id.empty()) {
    config.peer_id = options.peer_id;
  }
  if (!options.log_level.empty()) {
    config.log_level = options.log_level;
  }
  if (!options.log_file.empty()) {
    config.log_file = options.log_file;
  }
  if (!config.pairing_secret_file.empty() && !transport::load_pairing_secret(config, ec)) {
    return false;
  }

  std::string error;
  if (!transport::validate_config(config, error)) {
    std::cerr << "Invalid configuration: " << error << '\n';
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  return true;
}

bool read_file(const std::string& path, std::vector<std::uint8_t>& out, std::error_code& ec) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    ec = std::make_error_code(std::errc::no_such_file_or_directory);
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  return true;
}

std::string extension_for(const std::string& mime) {
  if (mime == "image/png") return ".png";
  if (mime == "image/jpeg") return ".jpg";
  if (mime == "image/gif") return ".gif";
  if (mime == "image/bmp") return ".bmp";
  if (mime == "image/webp") return ".webp";
  return ".bin";
}

void print_help() {
  std::cout << "Type a line to send it. Commands:\n"
            << "  /image <path>   send a file as media\n"
            << "  /rotate         negotiate a fresh key\n"
            << "  /drop           simulate a link drop\n"
            << "  /stats          show session counters\n"
            << "  /quit           say BYE and exit\n";
}

void print_stats(const transport::SessionStats& stats) {
  std::cout << "[stats] sent " << stats.frames_sent << " frames / " << stats.bytes_sent
            << " bytes, received " << stats.frames_received << " frames / "
            << stats.bytes_received << " bytes\n"
            << "[stats] session " << stats.session_id << ", send_seq " << stats.next_send_seq
            << ", recv_seq " << stats.next_recv_seq << ", reconnects " << stats.reconnect_count
            << ", replayed " << stats.frames_replayed << '\n'
            << "[stats] frame errors " << stats.frame_errors << ", crypto errors "
            << stats.crypto_errors << ", failed transfers " << stats.transfers_failed << '\n';
}

}  // namespace

int main(int argc, char* argv[]) {
  ChatOptions options;
  std::error_code ec;
  if (!parse_args(argc, argv, options, ec)) {
    return 1;
  }

  transport::SessionConfig config;
  if (!build_config(options, config, ec)) {
    std::cerr << "Configuration failed: " << ec.message() << '\n';
    return 1;
  }
  logging::configure_logging(logging::parse_log_level(config.log_level), config.log_console,
                             config.log_file);

  auto key_store = config.key_store_path.empty()
                       ? std::make_shared<auth::PeerKeyStore>()
                       : std::make_shared<auth::PeerKeyStore>(config.key_store_path);
  if (!key_store->load(ec)) {
    std::cerr << "Failed to load key store: " << ec.message() << '\n';
    return 1;
  }

  std::unique_ptr<transport::StreamConnector> connector;
  if (config.role == transport::Role::kHost) {
    connector = std::make_unique<transport::TcpListenConnector>(options.address, options.port);
  } else {
    connector = std::make_unique<transport::TcpDialConnector>(options.address, options.port);
  }

  transport::Session session(config, std::move(connector), key_store);
  std::atomic<std::uint32_t> media_counter{0};

  session.on_message([](const std::string& text) { std::cout << "peer> " << text << std::endl; });
  session.on_media([&](const std::vector<std::uint8_t>& bytes, const std::string& mime) {
    const auto name = options.save_dir + "/ghostlink-media-" +
                      std::to_string(media_counter.fetch_add(1)) + extension_for(mime);
    std::ofstream out(name, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    std::cout << "[media] " << bytes.size() << " bytes (" << mime << ") saved to " << name
              << std::endl;
  });
  session.on_state_change([](transport::SessionState, transport::SessionState new_state) {
    std::cout << "[state] " << transport::to_string(new_state) << std::endl;
  });
  session.on_error([](ErrorKind kind, const std::error_code& error, const std::string& detail) {
    std::cout << "[error] " << to_string(kind) << ": " << error.message();
    if (!detail.empty()) {
      std::cout << " (" << detail << ")";
    }
    std::cout << std::endl;
  });

  const bool started = config.role == transport::Role::kHost
                           ? session.listen(ec)
                           : session.connect(config.peer_id.empty()
                                                 ? options.address + ":" + std::to_string(options.port)
                                                 : config.peer_id,
                                             ec);
  if (!started) {
    std::cerr << "Failed to start session: " << ec.message() << '\n';
    return 1;
  }

  print_help();
  std::string line;
  while (std::getline(std::cin, line)) {
    if (session.state() == transport::SessionState::kClosed) {
      break;
    }
    if (line.empty()) {
      continue;
    }
    std::error_code send_ec;
    if (line == "/quit") {
      break;
    }
    if (line == "/help") {
      print_help();
    } else if (line == "/stats") {
      print_stats(session.stats());
    } else if (line == "/drop") {
      session.drop_link();
    } else if (line == "/rotate") {
      if (!session.rotate_key(send_ec)) {
        std::cout << "[error] rotate failed: " << send_ec.message() << std::endl;
      }
    } else if (line.rfind("/image ", 0) == 0) {
      const auto path = line.substr(7);
      std::vector<std::uint8_t> bytes;
      if (!read_file(path, bytes, send_ec)) {
        std::cout << "[error] cannot read " << path << ": " << send_ec.message() << std::endl;
        continue;
      }
      const auto sniffed = media::sniff_mime(bytes);
      const auto mime = sniffed != media::kDefaultMime ? sniffed : media::mime_from_extension(path);
      LOG_INFO("Sending {} ({} bytes, {})", path, bytes.size(), mime);
      if (!session.send_media(std::move(bytes), send_ec)) {
        std::cout << "[error] send failed: " << send_ec.message() << std::endl;
      }
    } else if (!session.send_text(line, send_ec)) {
      std::cout << "[error] send failed: " << send_ec.message() << std::endl;
    }
  }

  session.disconnect();
  print_stats(session.stats());
  return 0;
}
