// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#include "termclip.h"

namespace termclip {

// Platforms without an X11 client library never select X11 tools.
bool system_host::display_reachable(const std::string& display) const {
  return false;
}

} // namespace termclip
