// Stand-in for the robot: accepts the 10 Hz packet stream and the HTTP echo on
// one port, decodes what arrives and logs it.
#include "connection/packet_rx.hpp"
#include "connection/tcp_socket.hpp"
#include "connection/wire_codec.hpp"
#include "core/packet.hpp"
#include "hexapod/stop_flag.hpp"
#include "utils/base64.hpp"
#include "utils/logger.hpp"
#include "utils/signal_handler.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

struct Config {
  std::string bind_ip{"0.0.0.0"};
  uint16_t port{8080};
  bool log_every_frame{false};
};

enum class Mode : uint8_t { UNKNOWN, STREAM, HTTP };

struct Client {
  connection::TcpSocket sock;
  Mode mode{Mode::UNKNOWN};
  std::string http_buf;
  connection::PacketRx rx;
  core::Packet last{};
  bool have_last{false};
  uint64_t frames{0};
};

void print_help(const char* argv0) {
  std::printf(
    "Usage: %s [options]\n"
    "  --bind_ip 0.0.0.0\n"
    "  --port 8080\n"
    "  --every_frame 1|0     log every frame instead of changes only\n",
    argv0
  );
}

bool parse_config(int argc, char** argv, Config& cfg) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* name) -> std::string {
      if (i + 1 >= argc) {
        logger::error() << "Missing value for " << name;
        std::exit(2);
      }
      return std::string(argv[++i]);
    };

    if (a == "--bind_ip") cfg.bind_ip = need("--bind_ip");
    else if (a == "--port") cfg.port = static_cast<uint16_t>(std::stoi(need("--port")));
    else if (a == "--every_frame") cfg.log_every_frame = std::stoi(need("--every_frame")) != 0;
    else if (a == "--help") { print_help(argv[0]); return false; }
    else {
      logger::error() << "Unknown arg: " << a;
      print_help(argv[0]);
      return false;
    }
  }
  return true;
}

// "GET /send?raw=UEtU... HTTP/1.1" -> decoded packet bytes
bool extract_raw(std::string_view request, std::vector<uint8_t>& out) {
  const size_t start = request.find("raw=");
  if (start == std::string_view::npos) return false;
  const size_t end = request.find_first_of(" &\r\n", start + 4);
  const std::string_view b64 = request.substr(start + 4, end == std::string_view::npos ? std::string_view::npos : end - start - 4);
  return utils::base64_decode(b64, out);
}

// Returns false once the request has been answered and the client can go.
bool handle_http(Client& c) {
  const size_t hdr_end = c.http_buf.find("\r\n\r\n");
  if (hdr_end == std::string::npos) return c.http_buf.size() < 8192;

  std::vector<uint8_t> raw;
  core::Packet pkt;
  const bool ok = extract_raw(c.http_buf, raw) &&
                  connection::wire::decode_packet(raw, pkt);

  std::string_view status = "HTTP/1.1 200 OK\r\n";
  if (ok) {
    logger::info() << "[SIM] HTTP echo " << core::to_string(pkt);
  } else {
    logger::warn() << "[SIM] HTTP request without a valid packet";
    status = "HTTP/1.1 400 Bad Request\r\n";
  }

  const std::string reply = std::string(status) +
                            "Content-Length: 0\r\nConnection: close\r\n\r\n";
  if (!c.sock.send_all(reply.data(), reply.size())) {
    logger::debug() << "[SIM] HTTP reply not delivered";
  }
  return false;
}

void handle_stream(Client& c, const Config& cfg) {
  core::Packet pkt;
  while (c.rx.pop(pkt)) {
    ++c.frames;
    if (cfg.log_every_frame || !c.have_last || !(pkt == c.last)) {
      logger::info() << "[SIM] frame #" << c.frames << " " << core::to_string(pkt);
    }
    c.last = pkt;
    c.have_last = true;
  }
}

} // namespace

int main(int argc, char** argv) {
  Config cfg;
  if (!parse_config(argc, argv, cfg)) return EXIT_FAILURE;

  hexapod::StopFlag stop;
  utils::SignalHandler sig(stop);

  connection::TcpSocket srv;
  if (!srv.bind_listen(cfg.bind_ip, cfg.port, 4) || !srv.set_nonblocking(true)) {
    logger::error() << "[SIM] Failed to listen on " << cfg.bind_ip << ":" << cfg.port;
    return EXIT_FAILURE;
  }
  logger::info() << "[SIM] Listening on " << cfg.bind_ip << ":" << srv.local_port();

  std::vector<Client> clients;

  while (!stop.stop_requested()) {
    {
      connection::TcpSocket s;
      while (srv.accept_client(s, true)) {
        clients.emplace_back();
        clients.back().sock = std::move(s);
        logger::debug() << "[SIM] Client connected (" << clients.size() << ")";
      }
    }

    for (size_t i = 0; i < clients.size();) {
      Client& c = clients[i];
      uint8_t buf[2048];
      size_t n = 0;
      bool keep = c.sock.try_recv(buf, sizeof(buf), n);

      if (keep && n > 0) {
        if (c.mode == Mode::UNKNOWN) {
          c.mode = (n >= 4 && std::string_view(reinterpret_cast<const char*>(buf), 4) == "GET ")
                     ? Mode::HTTP : Mode::STREAM;
          if (c.mode == Mode::STREAM) logger::info() << "[SIM] Stream client attached";
        }
        if (c.mode == Mode::HTTP) {
          c.http_buf.append(reinterpret_cast<const char*>(buf), n);
          keep = handle_http(c);
        } else {
          c.rx.push_bytes(buf, n);
          handle_stream(c, cfg);
        }
      }

      if (!keep) {
        if (c.mode == Mode::STREAM) {
          logger::info() << "[SIM] Stream client left after " << c.frames << " frame(s); last "
                         << core::to_string(c.last);
        }
        c.sock.close();
        clients.erase(clients.begin() + static_cast<std::ptrdiff_t>(i));
        continue;
      }
      ++i;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  for (auto& c : clients) c.sock.close();
  srv.close();
  logger::info() << "[SIM] Shutdown complete.";
  logger::close_logger();
  return 0;
}
