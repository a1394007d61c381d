// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#include "termclip.h"
#include "termclip_common.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace termclip {

namespace {

// Variables that we read from the process environment.
const char* kRecognizedVariables[] = {
  "TERMCLIP_FORCE_OSC52",
  "TERMCLIP_FORCE_NATIVE",
  "TERMCLIP_OSC52_MAX_B64",
  "TERMCLIP_DEBUG",
  "TERMCLIP_TIMEOUT_MS",
  "TMUX",
  "STY",
  "DISPLAY",
  "WAYLAND_DISPLAY",
  "WSL_DISTRO_NAME",
  "WSL_INTEROP",
};

std::string get_var(const environment& env, const char* name) {
  auto it = env.find(name);
  if (it != env.end())
    return it->second;
  return std::string();
}

bool has_var(const environment& env, const char* name) {
  return !get_var(env, name).empty();
}

bool get_flag(const environment& env, const char* name) {
  std::string value = get_var(env, name);
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return (value == "1" ||
          value == "true" ||
          value == "yes" ||
          value == "on");
}

// Returns "def" if the variable is not defined or doesn't contain a
// positive number.
long long get_positive_number(const environment& env,
                              const char* name,
                              long long def) {
  std::string value = get_var(env, name);
  if (value.empty())
    return def;

  errno = 0;
  char* end = nullptr;
  long long n = std::strtoll(value.c_str(), &end, 10);
  if (errno != 0 || end == value.c_str() || *end != 0 || n <= 0) {
    details::logger()->warn("ignoring invalid {}={}, using {}",
                            name, value, def);
    return def;
  }
  return n;
}

} // anonymous namespace

HostOS host_os() {
#if defined(_WIN32)
  return HostOS::Windows;
#elif defined(__APPLE__)
  return HostOS::MacOS;
#else
  return HostOS::Unix;
#endif
}

environment snapshot_environment() {
  environment env;
  for (const char* name : kRecognizedVariables) {
    const char* value = std::getenv(name);
    if (value)
      env[name] = value;
  }
  return env;
}

config read_config(const environment& env) {
  config cfg;
  cfg.force_osc52 = get_flag(env, "TERMCLIP_FORCE_OSC52");
  cfg.force_native = get_flag(env, "TERMCLIP_FORCE_NATIVE");
  cfg.osc52_max_b64 = (std::size_t)
    get_positive_number(env, "TERMCLIP_OSC52_MAX_B64",
                        (long long)kOsc52DefaultMaxB64);
  cfg.command_timeout_ms = (int)
    std::min<long long>(
      get_positive_number(env, "TERMCLIP_TIMEOUT_MS",
                          kDefaultCommandTimeout),
      24*60*60*1000);
  cfg.debug = get_flag(env, "TERMCLIP_DEBUG");

  // FORCE_OSC52 wins if both overrides are set
  if (cfg.force_osc52 && cfg.force_native) {
    details::logger()->debug("TERMCLIP_FORCE_OSC52 and TERMCLIP_FORCE_NATIVE "
                             "are both set, using OSC 52 only");
    cfg.force_native = false;
  }
  return cfg;
}

environment_context probe_environment(HostOS os, const environment& env) {
  environment_context ctx;
  ctx.overrides = read_config(env);

  switch (os) {
    case HostOS::MacOS:
      ctx.platform = Platform::MacOS;
      break;
    case HostOS::Windows:
      ctx.platform = Platform::Windows;
      break;
    case HostOS::Unix:
      // Only use a display server if we actually have a display (it
      // isn't the case in a SSH session without forwarding).
      if (has_var(env, "WAYLAND_DISPLAY"))
        ctx.platform = Platform::Wayland;
      else if (has_var(env, "DISPLAY"))
        ctx.platform = Platform::X11;
      else
        ctx.platform = Platform::Unknown;

      ctx.wsl = (has_var(env, "WSL_DISTRO_NAME") ||
                 has_var(env, "WSL_INTEROP"));
      break;
  }
  ctx.display = get_var(env, "DISPLAY");

  // The multiplexer only changes how OSC 52 sequences are framed
  if (has_var(env, "TMUX"))
    ctx.multiplexer = Multiplexer::Tmux;
  else if (has_var(env, "STY"))
    ctx.multiplexer = Multiplexer::Screen;
  else
    ctx.multiplexer = Multiplexer::None;

  return ctx;
}

const char* platform_name(Platform platform) {
  switch (platform) {
    case Platform::MacOS:   return "macos";
    case Platform::Windows: return "windows";
    case Platform::X11:     return "x11";
    case Platform::Wayland: return "wayland";
    case Platform::Unknown: return "unknown";
  }
  return "unknown";
}

const char* multiplexer_name(Multiplexer multiplexer) {
  switch (multiplexer) {
    case Multiplexer::None:   return "none";
    case Multiplexer::Tmux:   return "tmux";
    case Multiplexer::Screen: return "screen";
  }
  return "none";
}

} // namespace termclip
