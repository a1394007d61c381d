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

// The macOS pasteboard through pbcopy/pbpaste.
class osx_transport : public native_transport {
public:
  osx_transport(host& system, const environment_context& ctx)
    : native_transport(system, ctx, "pbcopy",
                       { "pbcopy" },
                       { "pbpaste" }) {
  }
};

} // anonymous namespace

void add_osx_transports(host& system, const environment_context& ctx, transport_list& list) {
  list.push_back(transport_ptr(new osx_transport(system, ctx)));
}

} // namespace details
} // namespace termclip
