// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#include "termclip_cli.h"

#include <spdlog/spdlog.h>

#include <initializer_list>
#include <istream>
#include <ostream>

namespace termclip {
namespace cli {

namespace {

const char* kUsage =
  "usage: termclip [options]\n"
  "\n"
  "Copies stdin to the clipboard (native clipboard command or OSC 52\n"
  "escape sequence), or writes the clipboard content to stdout.\n"
  "\n"
  "options:\n"
  "  --paste        write the clipboard content to stdout (local only)\n"
  "  -v, --verbose  log each clipboard method that is tried\n"
  "  --version      print the version and exit\n"
  "  -h, --help     print this help and exit\n"
  "\n"
  "environment:\n"
  "  TERMCLIP_FORCE_OSC52=1     use OSC 52 only\n"
  "  TERMCLIP_FORCE_NATIVE=1    use native clipboard commands only\n"
  "  TERMCLIP_OSC52_MAX_B64=N   max base64 length of OSC 52 sequences (75000)\n"
  "  TERMCLIP_TIMEOUT_MS=N      time to wait for clipboard commands (3000)\n"
  "  TERMCLIP_DEBUG=1           same as --verbose\n";

int report_failure(const result& r, bool verbose, std::ostream& err) {
  err << "termclip: " << r.detail << "\n";
  if (verbose) {
    for (const attempt& a : r.attempts) {
      err << "  " << a.transport << ": " << error_code_name(a.code);
      if (!a.detail.empty())
        err << " (" << a.detail << ")";
      err << "\n";
    }
  }
  if (r.code == ErrorCode::UnsupportedDirection) {
    err << "termclip: over SSH, run --paste on your local machine\n";
    return kExitUnsupportedDirection;
  }
  return kExitTransportsExhausted;
}

} // anonymous namespace

bool verbose_requested(const std::vector<std::string>& args) {
  for (const std::string& arg : args) {
    if (arg == "-v" || arg == "--verbose")
      return true;
  }
  return false;
}

int run_cli(const std::vector<std::string>& args,
            HostOS os,
            const environment& env,
            std::istream& in,
            std::ostream& out,
            std::ostream& err,
            host& system,
            terminal_sink& tty) {
  bool paste_mode = false;
  bool verbose = false;

  for (const std::string& arg : args) {
    if (arg == "--paste")
      paste_mode = true;
    else if (arg == "--verbose" || arg == "-v")
      verbose = true;
    else if (arg == "--version") {
      out << "termclip " << TERMCLIP_VERSION << "\n";
      return kExitOk;
    }
    else if (arg == "--help" || arg == "-h") {
      out << kUsage;
      return kExitOk;
    }
    else {
      err << "termclip: unknown option " << arg << "\n" << kUsage;
      return kExitUsage;
    }
  }

  environment_context ctx = probe_environment(os, env);
  if (verbose)
    ctx.overrides.debug = true;
  verbose = ctx.overrides.debug;

  init_logging(ctx.overrides.debug);
  std::shared_ptr<spdlog::logger> log = spdlog::get("termclip");
  for (const char* name : { "TMUX", "STY", "DISPLAY", "WAYLAND_DISPLAY" }) {
    auto it = env.find(name);
    log->debug("{}: {}", name, it != env.end() ? it->second: "not set");
  }

  if (paste_mode) {
    payload output;
    result r = termclip::paste(ctx, output, system);
    if (!r.ok)
      return report_failure(r, verbose, err);

    out.write(output.data(), (std::streamsize)output.size());
    out.flush();
    if (!out) {
      err << "termclip: cannot write to stdout\n";
      return kExitIOError;
    }
    return kExitOk;
  }

  payload data;
  char buf[65536];
  while (in.read(buf, sizeof(buf)) || in.gcount() > 0)
    data.append(buf, (std::size_t)in.gcount());
  if (in.bad()) {
    err << "termclip: cannot read stdin\n";
    return kExitIOError;
  }
  if (data.empty()) {
    log->debug("no data to copy");
    return kExitOk;
  }
  log->debug("copying {} bytes", data.size());

  result r = termclip::copy(ctx, data, system, tty);
  if (!r.ok)
    return report_failure(r, verbose, err);

  log->debug("copied with {}", r.transport);
  return kExitOk;
}

} // namespace cli
} // namespace termclip
