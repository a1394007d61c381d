// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#ifndef TERMCLIP_COMMON_H_INCLUDED
#define TERMCLIP_COMMON_H_INCLUDED
#pragma once

#include "termclip.h"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <memory>
#include <string>
#include <vector>

namespace termclip {
namespace details {

// Returns the "termclip" logger (creating it with the default level
// if init_logging() wasn't called).
std::shared_ptr<spdlog::logger> logger();

// Calls the user error_handler (if any) for a failed candidate.
void report_failure(ErrorCode code, const char* transport_name);

// A transport that runs an external clipboard command. Payload bytes
// are passed through the command stdin/stdout without modification.
class native_transport : public transport {
public:
  typedef std::vector<std::string> argv;

  native_transport(host& system,
                   const environment_context& ctx,
                   const char* name,
                   const argv& copy_command,
                   const argv& paste_command);

  const char* name() const override { return m_name; }
  Capability capability() const override;

  result copy(const payload& data) override;
  result paste(payload& output) override;

protected:
  // Called before running a command, returns ErrorCode::None if the
  // command can be run.
  virtual ErrorCode check_ready(std::string& detail) const;

  host& system() const { return m_system; }
  const environment_context& context() const { return m_ctx; }

private:
  result run(const argv& command, const payload& input, payload* output);

  host& m_system;
  environment_context m_ctx;
  const char* m_name;
  argv m_copy_command;
  argv m_paste_command;
};

// Writes OSC 52 sequences to the terminal. It cannot paste.
class osc52_transport : public transport {
public:
  osc52_transport(host& system,
                  terminal_sink& tty,
                  const environment_context& ctx);

  const char* name() const override { return "osc52"; }
  Capability capability() const override { return Capability::Copy; }

  result copy(const payload& data) override;

private:
  host& m_system;
  terminal_sink& m_tty;
  environment_context m_ctx;
};

// Native candidates of each platform in preference order. Each
// function appends its candidates to "list".
void add_osx_transports(host& system, const environment_context& ctx, transport_list& list);
void add_win_transports(host& system, const environment_context& ctx, transport_list& list);
void add_wsl_transports(host& system, const environment_context& ctx, transport_list& list);
void add_x11_transports(host& system, const environment_context& ctx, transport_list& list);
void add_wayland_transports(host& system, const environment_context& ctx, transport_list& list);
void add_tmux_transports(host& system, const environment_context& ctx, transport_list& list);

// tmux options that decide whether an OSC 52 sequence reaches the
// outer terminal.
struct tmux_settings {
  bool queried = false;
  bool set_clipboard = false;
  bool allow_passthrough = false;
};

tmux_settings query_tmux_settings(host& system, int timeout_ms);

// Logs a warning with the ~/.tmux.conf lines needed to use OSC 52.
void warn_tmux_settings(const tmux_settings& settings);

} // namespace details
} // namespace termclip

#endif // TERMCLIP_COMMON_H_INCLUDED
