#pragma once
#include "hexapod/command_translator.hpp"
#include "utils/logger.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace hexapod {

struct RuntimeConfig {
  // Robot endpoint (TCP stream and HTTP echo share it)
  std::string robot_ip{"192.168.4.1"};
  uint16_t robot_port{80};

  // Calibration
  Calibration calibration{};

  // Streaming
  double stream_hz{10.0};
  double timer_slack_s{0.1};   // added to each command's timer so the robot-side timeout expires first

  // Transports
  double connect_timeout_s{5.0};
  double http_timeout_s{2.0};
  bool http_echo{true};

  // Logging
  logger::Level print_level{logger::Level::Info};
  bool file_logging{false};
  std::string logs_dir{"./logs"};
};

using RuntimeConfigPtr = std::shared_ptr<const RuntimeConfig>;

/// Push the logging section of the config into the logger.
void apply_logging(const RuntimeConfig& cfg);

} // namespace hexapod
