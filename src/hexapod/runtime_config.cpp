#include "hexapod/runtime_config.hpp"

namespace hexapod {

void apply_logging(const RuntimeConfig& cfg) {
  logger::set_print_level(cfg.print_level);
  if (cfg.file_logging) {
    logger::set_logs_dir(cfg.logs_dir);
  }
  logger::set_file_logging_enabled(cfg.file_logging);
}

} // namespace hexapod
