// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#include "termclip.h"
#include "termclip_common.h"

namespace termclip {

namespace {

error_handler g_error_handler = nullptr;

} // anonymous namespace

const char* error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:                   return "none";
    case ErrorCode::NoCommandFound:         return "no-command-found";
    case ErrorCode::CommandTimeout:         return "command-timeout";
    case ErrorCode::CommandFailed:          return "command-failed";
    case ErrorCode::PayloadTooLarge:        return "payload-too-large";
    case ErrorCode::UnsupportedDirection:   return "unsupported-direction";
    case ErrorCode::AllTransportsExhausted: return "all-transports-exhausted";
    case ErrorCode::NoTerminal:             return "no-terminal";
    case ErrorCode::DisplayUnavailable:     return "display-unavailable";
  }
  return "unknown";
}

void set_error_handler(error_handler f) {
  g_error_handler = f;
}

error_handler get_error_handler() {
  return g_error_handler;
}

result result::success(const std::string& transport, std::size_t bytes) {
  result r;
  r.ok = true;
  r.bytes = bytes;
  r.transport = transport;
  return r;
}

result result::failure(ErrorCode code, const std::string& detail) {
  result r;
  r.code = code;
  r.detail = detail;
  return r;
}

bool transport::can(Direction direction) const {
  Capability cap = capability();
  if (cap == Capability::Both)
    return true;
  if (direction == Direction::Copy)
    return (cap == Capability::Copy);
  else
    return (cap == Capability::Paste);
}

result transport::paste(payload& output) {
  return result::failure(ErrorCode::UnsupportedDirection,
                         std::string(name()) + " cannot paste");
}

result copy(const environment_context& ctx,
            const payload& data,
            host& system,
            terminal_sink& tty) {
  transport_list list = resolve(ctx, Direction::Copy, system, tty);
  return execute(list, data);
}

result paste(const environment_context& ctx,
             payload& output,
             host& system) {
  // OSC 52 is never a paste candidate, so the terminal is not used.
  memory_sink unused_tty(false);
  transport_list list = resolve(ctx, Direction::Paste, system, unused_tty);
  return execute_paste(list, output);
}

result copy(const payload& data) {
  environment_context ctx =
    probe_environment(host_os(), snapshot_environment());
  system_host system(ctx.overrides.debug);
  tty_sink tty;
  return copy(ctx, data, system, tty);
}

result paste(payload& output) {
  environment_context ctx =
    probe_environment(host_os(), snapshot_environment());
  system_host system(ctx.overrides.debug);
  return paste(ctx, output, system);
}

namespace details {

void report_failure(ErrorCode code, const char* transport_name) {
  error_handler e = get_error_handler();
  if (e)
    e(code, transport_name);
}

} // namespace details

} // namespace termclip
