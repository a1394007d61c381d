// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#include "termclip.h"
#include "termclip_cli.h"

#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#ifdef _WIN32
  #include <fcntl.h>
  #include <io.h>
#else
  #include <signal.h>
#endif

int main(int argc, char* argv[]) {
#ifdef _WIN32
  _setmode(_fileno(stdin), _O_BINARY);
  _setmode(_fileno(stdout), _O_BINARY);
#else
  // A closed stdout (e.g. "termclip --paste | head -c1") must be an
  // I/O error, not a signal.
  signal(SIGPIPE, SIG_IGN);
#endif

  std::vector<std::string> args(argv+1, argv+argc);
  termclip::environment env = termclip::snapshot_environment();

  termclip::system_host system(termclip::cli::verbose_requested(args) ||
                               termclip::read_config(env).debug);
  termclip::tty_sink tty;

  return termclip::cli::run_cli(args, termclip::host_os(), env,
                                std::cin, std::cout, std::cerr,
                                system, tty);
}
