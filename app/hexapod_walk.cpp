#include "connection/http_echo_transport.hpp"
#include "connection/tcp_stream_transport.hpp"
#include "core/packet.hpp"
#include "hexapod/commands.hpp"
#include "hexapod/hexapod_client.hpp"
#include "hexapod/runtime_config.hpp"
#include "hexapod/stop_flag.hpp"
#include "utils/logger.hpp"
#include "utils/signal_handler.hpp"
#include "utils/timer_service.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

struct Step {
  hexapod::CommandKind kind{hexapod::CommandKind::REST};
  double value{0.0};
  core::Packet packet{};
};

void print_help(const char* argv0) {
  std::printf(
    "Usage: %s [options] <command> <value> [<command> <value> ...]\n"
    "Options:\n"
    "  --ip 192.168.4.1\n"
    "  --port 80\n"
    "  --speed_factor 13        seconds per metre\n"
    "  --rotation_period 13     seconds per full turn\n"
    "  --stream_hz 10\n"
    "  --slack 0.1              seconds added to every command timer\n"
    "  --connect_timeout 5\n"
    "  --http_timeout 2\n"
    "  --http_echo 1|0\n"
    "  --connect                open the stream before the first command\n"
    "  --log_level debug|info|warn|error\n"
    "  --file_log 1|0\n"
    "  --logs_dir ./logs\n"
    "Commands:\n"
    "  forward M | back M | left DEG | right DEG\n"
    "  tilt_forward S | tilt_back S | tilt_left S | tilt_right S\n"
    "  rest S\n"
    "  custom power=100,angle=90,rotation=0,static_tilt=0,moving_tilt=0,on_off=1,\n"
    "         acc_x=0,acc_y=0,duration=50,aux=50:25:0:0:0:0:0:0:0\n",
    argv0
  );
}

double to_double(std::string_view name, std::string_view text) {
  size_t used = 0;
  const std::string s(text);
  const double v = std::stod(s, &used);
  if (used != s.size()) throw std::invalid_argument("trailing characters in " + std::string(name));
  return v;
}

int to_int(std::string_view name, std::string_view text) {
  size_t used = 0;
  const std::string s(text);
  const int v = std::stoi(s, &used, 0);
  if (used != s.size()) throw std::invalid_argument("trailing characters in " + std::string(name));
  return v;
}

// "power=100,angle=90,aux=50:25:0:0:0:0:0:0:0"
core::Packet parse_custom(std::string_view text) {
  core::PacketFields f;
  while (!text.empty()) {
    const size_t comma = text.find(',');
    const std::string_view item = text.substr(0, comma);
    text = (comma == std::string_view::npos) ? std::string_view{} : text.substr(comma + 1);
    if (item.empty()) continue;

    const size_t eq = item.find('=');
    if (eq == std::string_view::npos) throw std::invalid_argument("custom field without '='");
    const std::string_view key = item.substr(0, eq);
    const std::string_view val = item.substr(eq + 1);

    if (key == "power") f.power = static_cast<int16_t>(to_int(key, val));
    else if (key == "angle") f.angle = static_cast<int16_t>(to_int(key, val));
    else if (key == "rotation") f.rotation = static_cast<int16_t>(to_int(key, val));
    else if (key == "static_tilt") f.static_tilt = static_cast<int16_t>(to_int(key, val));
    else if (key == "moving_tilt") f.moving_tilt = static_cast<int16_t>(to_int(key, val));
    else if (key == "on_off") f.on_off = static_cast<int16_t>(to_int(key, val));
    else if (key == "acc_x") f.acc_x = static_cast<int16_t>(to_int(key, val));
    else if (key == "acc_y") f.acc_y = static_cast<int16_t>(to_int(key, val));
    else if (key == "duration") f.duration = static_cast<uint32_t>(to_int(key, val));
    else if (key == "aux") {
      std::vector<uint8_t> aux;
      std::string_view rest = val;
      while (!rest.empty()) {
        const size_t colon = rest.find(':');
        aux.push_back(static_cast<uint8_t>(to_int(key, rest.substr(0, colon))));
        rest = (colon == std::string_view::npos) ? std::string_view{} : rest.substr(colon + 1);
      }
      f.aux = std::move(aux);
    }
    else throw std::invalid_argument("unknown custom field: " + std::string(key));
  }
  return core::Packet::build(f);
}

void run_step(hexapod::HexapodClient& robot, const Step& s) {
  using hexapod::CommandKind;
  switch (s.kind) {
    case CommandKind::MOVE_FORWARD: (void)robot.move_forward(s.value); break;
    case CommandKind::MOVE_BACK:    (void)robot.move_back(s.value); break;
    case CommandKind::TURN_LEFT:    robot.turn_left(s.value); break;
    case CommandKind::TURN_RIGHT:   robot.turn_right(s.value); break;
    case CommandKind::TILT_FORWARD: robot.tilt_forward(s.value); break;
    case CommandKind::TILT_BACK:    robot.tilt_back(s.value); break;
    case CommandKind::TILT_LEFT:    robot.tilt_left(s.value); break;
    case CommandKind::TILT_RIGHT:   robot.tilt_right(s.value); break;
    case CommandKind::REST:         robot.rest(s.value); break;
    case CommandKind::CUSTOM:       robot.send_custom(s.packet); break;
  }
}

} // namespace

int main(int argc, char** argv) {
  auto cfg = std::make_shared<hexapod::RuntimeConfig>();
  bool eager_connect = false;
  std::vector<Step> steps;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string_view a = argv[i];
      auto need = [&](std::string_view name) -> std::string_view {
        if (i + 1 >= argc) {
          logger::error() << "Missing value for " << name;
          std::exit(2);
        }
        return argv[++i];
      };

      if (a == "--ip") cfg->robot_ip = std::string(need(a));
      else if (a == "--port") cfg->robot_port = static_cast<uint16_t>(to_int(a, need(a)));
      else if (a == "--speed_factor") cfg->calibration.speed_factor_s_per_m = to_double(a, need(a));
      else if (a == "--rotation_period") cfg->calibration.rotation_period_s = to_double(a, need(a));
      else if (a == "--stream_hz") cfg->stream_hz = to_double(a, need(a));
      else if (a == "--slack") cfg->timer_slack_s = to_double(a, need(a));
      else if (a == "--connect_timeout") cfg->connect_timeout_s = to_double(a, need(a));
      else if (a == "--http_timeout") cfg->http_timeout_s = to_double(a, need(a));
      else if (a == "--http_echo") cfg->http_echo = (to_int(a, need(a)) != 0);
      else if (a == "--connect") eager_connect = true;
      else if (a == "--log_level") {
        if (!logger::parse_level(need(a), cfg->print_level)) {
          logger::error() << "Invalid --log_level";
          return 2;
        }
      }
      else if (a == "--file_log") cfg->file_logging = (to_int(a, need(a)) != 0);
      else if (a == "--logs_dir") cfg->logs_dir = std::string(need(a));
      else if (a == "--help") { print_help(argv[0]); return 0; }
      else if (auto kind = hexapod::parse_command_kind(a)) {
        Step s;
        s.kind = *kind;
        if (*kind == hexapod::CommandKind::CUSTOM) s.packet = parse_custom(need(a));
        else s.value = to_double(a, need(a));
        steps.push_back(s);
      }
      else {
        logger::error() << "Unknown arg: " << a;
        print_help(argv[0]);
        return 2;
      }
    }
  } catch (const std::exception& e) {
    logger::error() << "Invalid argument: " << e.what();
    print_help(argv[0]);
    return 2;
  }

  hexapod::apply_logging(*cfg);

  if (steps.empty() && !eager_connect) {
    print_help(argv[0]);
    return 2;
  }

  hexapod::StopFlag stop;
  utils::SignalHandler sig(stop);

  const auto to_ms = [](double s) {
    return std::chrono::milliseconds(static_cast<int64_t>(s * 1000.0));
  };

  utils::TimerService sequence_timers("sequence");
  utils::TimerService stream_timers("stream");
  connection::TcpStreamTransport stream(to_ms(cfg->connect_timeout_s));
  std::unique_ptr<connection::HttpEchoTransport> echo;
  if (cfg->http_echo) {
    echo = std::make_unique<connection::HttpEchoTransport>(cfg->robot_ip, cfg->robot_port,
                                                           to_ms(cfg->http_timeout_s));
  }

  {
    hexapod::HexapodClient robot(cfg, stream, echo.get(), sequence_timers, stream_timers);

    logger::info() << "[MAIN] Robot " << cfg->robot_ip << ":" << cfg->robot_port
                   << " speed_factor=" << cfg->calibration.speed_factor_s_per_m
                   << " rotation_period=" << cfg->calibration.rotation_period_s
                   << " steps=" << steps.size();

    if (eager_connect && !robot.connect()) {
      logger::warn() << "[MAIN] Continuing without a stream connection";
    }

    for (const Step& s : steps) run_step(robot, s);

    while (!stop.stop_requested() && robot.state() == hexapod::RobotState::RUNNING) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    if (stop.stop_requested()) {
      logger::info() << "[MAIN] Interrupted; " << robot.pending() << " command(s) still queued";
    }

    robot.disconnect();
    sequence_timers.shutdown();
    stream_timers.shutdown();

    logger::info() << "[MAIN] Executed " << robot.sequencer().executed() << " command(s); streamed "
                   << robot.stream().packets_sent() << " packet(s), " << robot.stream().send_errors()
                   << " send error(s), " << stream_timers.skipped_ticks() << " late tick(s) skipped";
  }

  if (echo) {
    logger::info() << "[MAIN] Echo requests so far: " << echo->requests_ok() << " ok, "
                   << echo->requests_failed() << " failed";
  }
  echo.reset(); // flush queued echoes before the logger goes away
  logger::info() << "[MAIN] Done.";
  logger::close_logger();
  return 0;
}
