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

// Wayland clipboard through wl-clipboard. wl-copy forks a process
// that serves the selection, wl-paste --no-newline returns the exact
// clipboard bytes.
class wayland_transport : public native_transport {
public:
  wayland_transport(host& system, const environment_context& ctx)
    : native_transport(system, ctx, "wl-copy",
                       { "wl-copy" },
                       { "wl-paste", "--no-newline" }) {
  }
};

} // anonymous namespace

void add_wayland_transports(host& system, const environment_context& ctx, transport_list& list) {
  list.push_back(transport_ptr(new wayland_transport(system, ctx)));

  // X11 tools work through XWayland when wl-clipboard isn't installed
  add_x11_transports(system, ctx, list);
}

} // namespace details
} // namespace termclip
