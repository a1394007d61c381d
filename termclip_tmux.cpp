// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#include "termclip.h"
#include "termclip_common.h"

namespace termclip {
namespace details {

namespace {

// Returns true if "tmux show-options -g <option>" says "on" (or
// "external" for set-clipboard). The "queried" flag is cleared if
// tmux cannot be asked.
bool query_option(host& system, const char* option, int timeout_ms,
                  bool& queried) {
  std::vector<std::string> argv = { "tmux", "show-options", "-g", option };
  payload output;
  run_result r = system.run(argv, payload(), &output, timeout_ms);
  if (r.status != RunStatus::Ok) {
    logger()->debug("cannot query tmux option {} (exit code {})",
                    option, r.exit_code);
    queried = false;
    return false;
  }

  // Output format: "<option> <value>"
  std::size_t space = output.find(' ');
  std::string value = (space != std::string::npos ? output.substr(space+1): output);
  while (!value.empty() && (value.back() == '\n' || value.back() == '\r'))
    value.pop_back();

  return (value == "on" || value == "external");
}

// tmux paste buffer. "load-buffer -w" also sends the buffer to the
// outer terminal clipboard (tmux 3.2), and "save-buffer -" prints the
// most recent buffer, which is the only clipboard that can be read
// from a remote session.
class tmux_transport : public native_transport {
public:
  tmux_transport(host& system, const environment_context& ctx)
    : native_transport(system, ctx, "tmux",
                       { "tmux", "load-buffer", "-w", "-" },
                       { "tmux", "save-buffer", "-" }) {
  }

  result copy(const payload& data) override {
    // With set-clipboard off the buffer never leaves tmux
    if (system().find_command("tmux")) {
      tmux_settings settings =
        query_tmux_settings(system(), context().overrides.command_timeout_ms);
      if (settings.queried && !settings.set_clipboard)
        return result::failure(ErrorCode::CommandFailed,
                               "tmux set-clipboard is off");
    }
    return native_transport::copy(data);
  }
};

} // anonymous namespace

void add_tmux_transports(host& system, const environment_context& ctx, transport_list& list) {
  list.push_back(transport_ptr(new tmux_transport(system, ctx)));
}

tmux_settings query_tmux_settings(host& system, int timeout_ms) {
  tmux_settings settings;
  if (!system.find_command("tmux")) {
    logger()->debug("tmux command not found, cannot check its options");
    return settings;
  }

  settings.queried = true;
  settings.set_clipboard =
    query_option(system, "set-clipboard", timeout_ms, settings.queried);

  // allow-passthrough exists since tmux 3.3
  settings.allow_passthrough =
    query_option(system, "allow-passthrough", timeout_ms, settings.queried);

  logger()->debug("tmux set-clipboard: {}, allow-passthrough: {}",
                  settings.set_clipboard, settings.allow_passthrough);
  return settings;
}

void warn_tmux_settings(const tmux_settings& settings) {
  if (!settings.queried)
    return;

  if (!settings.set_clipboard)
    logger()->warn("tmux clipboard integration is off, add "
                   "'set -g set-clipboard on' to ~/.tmux.conf");

  if (!settings.allow_passthrough)
    logger()->warn("tmux passthrough is off, add "
                   "'set -g allow-passthrough on' to ~/.tmux.conf");

  if (!settings.set_clipboard || !settings.allow_passthrough)
    logger()->warn("then run: tmux source-file ~/.tmux.conf");
}

} // namespace details
} // namespace termclip
