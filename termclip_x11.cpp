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

// X11 CLIPBOARD selection through xclip or xsel. Both commands fork
// a background process that owns the selection after reading stdin,
// so the foreground process finishes quickly.
class x11_transport : public native_transport {
public:
  x11_transport(host& system,
                const environment_context& ctx,
                const char* name,
                const argv& copy_command,
                const argv& paste_command)
    : native_transport(system, ctx, name, copy_command, paste_command) {
  }

protected:
  // xclip/xsel can wait a long time for a display that doesn't
  // exist (e.g. a stale DISPLAY in a SSH session), so we check that
  // the X server accepts connections first.
  ErrorCode check_ready(std::string& detail) const override {
    const std::string& display = context().display;
    if (display.empty()) {
      detail = "DISPLAY is not set";
      return ErrorCode::DisplayUnavailable;
    }
    if (!system().display_reachable(display)) {
      detail = "cannot connect to X display " + display;
      return ErrorCode::DisplayUnavailable;
    }
    return ErrorCode::None;
  }
};

} // anonymous namespace

void add_x11_transports(host& system, const environment_context& ctx, transport_list& list) {
  list.push_back(transport_ptr(
    new x11_transport(system, ctx, "xclip",
                      { "xclip", "-selection", "clipboard", "-in" },
                      { "xclip", "-selection", "clipboard", "-out" })));
  list.push_back(transport_ptr(
    new x11_transport(system, ctx, "xsel",
                      { "xsel", "--clipboard", "--input" },
                      { "xsel", "--clipboard", "--output" })));
}

} // namespace details
} // namespace termclip
