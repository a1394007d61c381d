// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#ifndef TERMCLIP_CLI_H_INCLUDED
#define TERMCLIP_CLI_H_INCLUDED
#pragma once

#include "termclip.h"

#include <iosfwd>
#include <string>
#include <vector>

namespace termclip {
namespace cli {

  enum ExitCode {
    kExitOk = 0,
    kExitTransportsExhausted = 1,
    kExitUnsupportedDirection = 2,
    kExitUsage = 64,
    kExitIOError = 74,
  };

  // Returns true if "-v" or "--verbose" is in the arguments (used to
  // show the stderr of clipboard commands before the real parsing).
  bool verbose_requested(const std::vector<std::string>& args);

  // Runs the termclip command with the given arguments (without the
  // program name). "in" and "out" must be in binary mode.
  int run_cli(const std::vector<std::string>& args,
              HostOS os,
              const environment& env,
              std::istream& in,
              std::ostream& out,
              std::ostream& err,
              host& system,
              terminal_sink& tty);

} // namespace cli
} // namespace termclip

#endif // TERMCLIP_CLI_H_INCLUDED
