#pragma once

#include <spdlog/spdlog.h>

namespace burrow {

/// Configure the default spdlog logger for the tunnel process.
inline void init_logging(bool verbose) {
  spdlog::set_pattern("[%H:%M:%S] %^%l%$ %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

} // namespace burrow
