// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#include "termclip.h"
#include "termclip_common.h"

namespace termclip {

namespace {

void add_native_transports(host& system,
                           const environment_context& ctx,
                           transport_list& list) {
  switch (ctx.platform) {
    case Platform::MacOS:
      details::add_osx_transports(system, ctx, list);
      break;
    case Platform::Windows:
      details::add_win_transports(system, ctx, list);
      break;
    case Platform::X11:
      details::add_x11_transports(system, ctx, list);
      break;
    case Platform::Wayland:
      details::add_wayland_transports(system, ctx, list);
      break;
    case Platform::Unknown:
      break;
  }

  if (ctx.wsl)
    details::add_wsl_transports(system, ctx, list);

  if (ctx.multiplexer == Multiplexer::Tmux)
    details::add_tmux_transports(system, ctx, list);
}

// True if none of the paste commands can be used here (they aren't
// installed or there is no display), i.e. paste must be done on the
// local machine.
bool no_paste_command(const std::vector<attempt>& attempts) {
  for (const attempt& a : attempts) {
    if (a.code != ErrorCode::NoCommandFound &&
        a.code != ErrorCode::DisplayUnavailable)
      return false;
  }
  return true;
}

const char* kPasteUnsupported =
  "paste not supported here (no native clipboard command found, "
  "OSC 52 cannot paste)";

std::string join_attempts(const std::vector<attempt>& attempts) {
  std::string out;
  for (const attempt& a : attempts) {
    if (!out.empty())
      out += ", ";
    out += a.transport;
    out += " (";
    out += error_code_name(a.code);
    if (!a.detail.empty()) {
      out += ": ";
      out += a.detail;
    }
    out += ")";
  }
  return out;
}

// Records the failure of "t" in "accumulated".
void add_attempt(const transport& t, const result& r, result& accumulated) {
  details::logger()->debug("{} failed: {} ({})",
                           t.name(), error_code_name(r.code), r.detail);
  details::report_failure(r.code, t.name());

  attempt a;
  a.transport = t.name();
  a.code = r.code;
  a.detail = r.detail;
  accumulated.attempts.push_back(a);
}

result exhausted(result& accumulated) {
  accumulated.ok = false;
  accumulated.code = ErrorCode::AllTransportsExhausted;
  if (accumulated.attempts.empty())
    accumulated.detail = "no clipboard method available";
  else
    accumulated.detail = "no clipboard method worked: " +
      join_attempts(accumulated.attempts);
  return accumulated;
}

} // anonymous namespace

transport_list resolve(const environment_context& ctx,
                       Direction direction,
                       host& system,
                       terminal_sink& tty) {
  const config& cfg = ctx.overrides;
  transport_list all;

  // FORCE_OSC52 wins over FORCE_NATIVE
  if (cfg.force_osc52) {
    all.push_back(transport_ptr(new details::osc52_transport(system, tty, ctx)));
  }
  else {
    add_native_transports(system, ctx, all);

    // Escape sequences don't depend on the OS, so OSC 52 is the
    // fallback everywhere (even in unknown platforms).
    if (!cfg.force_native)
      all.push_back(transport_ptr(new details::osc52_transport(system, tty, ctx)));
  }

  transport_list list;
  for (transport_ptr& t : all) {
    if (t->can(direction))
      list.push_back(std::move(t));
  }

  if (details::logger()->should_log(spdlog::level::debug)) {
    std::string names;
    for (const std::string& name : candidate_names(list))
      names += " " + name;
    details::logger()->debug("{} candidates ({}, multiplexer {}{}):{}",
                             direction == Direction::Copy ? "copy": "paste",
                             platform_name(ctx.platform),
                             multiplexer_name(ctx.multiplexer),
                             ctx.wsl ? ", wsl": "",
                             names);
  }
  return list;
}

result execute(const transport_list& list, const payload& data) {
  result accumulated;
  for (const transport_ptr& t : list) {
    details::logger()->debug("trying {}", t->name());

    result r = t->copy(data);
    if (r.ok) {
      details::logger()->debug("{} copied {} bytes", t->name(), r.bytes);
      r.attempts = std::move(accumulated.attempts);
      return r;
    }
    add_attempt(*t, r, accumulated);
  }
  return exhausted(accumulated);
}

result execute_paste(const transport_list& list, payload& output) {
  if (list.empty())
    return result::failure(ErrorCode::UnsupportedDirection, kPasteUnsupported);

  result accumulated;
  for (const transport_ptr& t : list) {
    details::logger()->debug("trying {}", t->name());

    result r = t->paste(output);
    if (r.ok) {
      details::logger()->debug("{} pasted {} bytes", t->name(), r.bytes);
      r.attempts = std::move(accumulated.attempts);
      return r;
    }
    add_attempt(*t, r, accumulated);
  }

  if (no_paste_command(accumulated.attempts)) {
    accumulated.code = ErrorCode::UnsupportedDirection;
    accumulated.detail = kPasteUnsupported;
    return accumulated;
  }
  return exhausted(accumulated);
}

std::vector<std::string> candidate_names(const transport_list& list) {
  std::vector<std::string> names;
  for (const transport_ptr& t : list)
    names.push_back(t->name());
  return names;
}

} // namespace termclip
