// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#include "termclip.h"
#include "termclip_common.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace termclip {

namespace {

const char* kLoggerName = "termclip";

std::shared_ptr<spdlog::logger> create_logger() {
  std::shared_ptr<spdlog::logger> log = spdlog::get(kLoggerName);
  if (!log) {
    log = spdlog::stderr_color_mt(kLoggerName);
    log->set_pattern("[termclip] %^%l%$: %v");
    log->set_level(spdlog::level::warn);
  }
  return log;
}

} // anonymous namespace

void init_logging(bool debug) {
  std::shared_ptr<spdlog::logger> log = create_logger();
  log->set_level(debug ? spdlog::level::debug:
                         spdlog::level::warn);
}

namespace details {

std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> log = create_logger();
  return log;
}

} // namespace details

} // namespace termclip
