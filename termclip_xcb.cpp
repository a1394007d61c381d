// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#include "termclip.h"
#include "termclip_common.h"

#include <xcb/xcb.h>

namespace termclip {

bool system_host::display_reachable(const std::string& display) const {
  int screen = 0;
  xcb_connection_t* connection = xcb_connect(display.c_str(), &screen);

  // xcb_connect() never returns null, errors are reported through
  // xcb_connection_has_error().
  int error = xcb_connection_has_error(connection);
  xcb_disconnect(connection);

  if (error) {
    details::logger()->debug("cannot connect to X display {} (xcb error {})",
                             display, error);
    return false;
  }
  return true;
}

} // namespace termclip
