#include "hexapod/hexapod_client.hpp"
#include "utils/logger.hpp"

#include <chrono>
#include <cmath>
#include <utility>

namespace hexapod {

namespace {

RuntimeConfigPtr or_default(RuntimeConfigPtr cfg) {
  return cfg ? std::move(cfg) : std::make_shared<const RuntimeConfig>();
}

std::chrono::milliseconds stream_period(const RuntimeConfig& cfg) {
  const double hz = cfg.stream_hz > 0.0 ? cfg.stream_hz : 10.0;
  return std::chrono::milliseconds(static_cast<int64_t>(std::lround(1000.0 / hz)));
}

} // namespace

HexapodClient::HexapodClient(RuntimeConfigPtr cfg,
                             connection::IStreamTransport& stream,
                             connection::IOneShotTransport* echo,
                             utils::ITimerService& sequence_timers,
                             utils::ITimerService& stream_timers)
  : cfg_(or_default(std::move(cfg))),
    echo_(cfg_->http_echo ? echo : nullptr),
    seq_(CommandTranslator(cfg_->calibration), sequence_timers, cfg_->timer_slack_s),
    stream_(seq_.packet_cell(), stream, stream_timers,
            StreamTarget{cfg_->robot_ip, cfg_->robot_port}, stream_period(*cfg_)) {
  seq_.set_listener(this);
}

HexapodClient::~HexapodClient() noexcept {
  disconnect();
  seq_.set_listener(nullptr);
}

bool HexapodClient::connect() {
  if (!stream_.open_now()) {
    logger::error() << "[CLIENT] Connect to " << cfg_->robot_ip << ":" << cfg_->robot_port << " failed";
    return false;
  }
  return true;
}

void HexapodClient::disconnect() {
  std::scoped_lock lk(ops_mtx_);
  if (seq_.reset()) {
    logger::info() << "[CLIENT] Sequence aborted by disconnect";
  }
  stream_.stop(core::Packet::neutral());
}

bool HexapodClient::move_forward(double distance_m) {
  if (!(distance_m > 0)) {
    logger::warn() << "[CLIENT] move_forward: argument must be greater than zero!";
    return false;
  }
  push(Command::make(CommandKind::MOVE_FORWARD, distance_m));
  return true;
}

bool HexapodClient::move_back(double distance_m) {
  if (!(distance_m > 0)) {
    logger::warn() << "[CLIENT] move_back: argument must be greater than zero!";
    return false;
  }
  push(Command::make(CommandKind::MOVE_BACK, distance_m));
  return true;
}

void HexapodClient::turn_left(double degrees) {
  push(Command::make(CommandKind::TURN_LEFT, degrees));
}

void HexapodClient::turn_right(double degrees) {
  push(Command::make(CommandKind::TURN_RIGHT, degrees));
}

void HexapodClient::tilt_forward(double seconds) {
  push(Command::make(CommandKind::TILT_FORWARD, seconds));
}

void HexapodClient::tilt_back(double seconds) {
  push(Command::make(CommandKind::TILT_BACK, seconds));
}

void HexapodClient::tilt_left(double seconds) {
  push(Command::make(CommandKind::TILT_LEFT, seconds));
}

void HexapodClient::tilt_right(double seconds) {
  push(Command::make(CommandKind::TILT_RIGHT, seconds));
}

void HexapodClient::rest(double seconds) {
  push(Command::make(CommandKind::REST, std::isnan(seconds) ? 0.0 : seconds));
}

void HexapodClient::send_custom(const core::Packet& pkt) {
  push(Command::custom(pkt));
}

void HexapodClient::send_packet_http(const core::Packet& pkt) {
  if (!echo_) return;
  const auto bytes = pkt.serialize();
  echo_->send_once(bytes);
}

void HexapodClient::push(Command cmd) {
  std::scoped_lock lk(ops_mtx_);
  seq_.enqueue(std::move(cmd));
}

void HexapodClient::on_sequence_started() {
  stream_.start();
}

void HexapodClient::on_packet_installed(const core::Packet& pkt) {
  send_packet_http(pkt);
}

void HexapodClient::on_sequence_complete(const core::Packet& neutral) {
  send_packet_http(neutral);
  stream_.stop(neutral);
}

} // namespace hexapod
