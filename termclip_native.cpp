// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#include "termclip.h"
#include "termclip_common.h"

namespace termclip {
namespace details {

native_transport::native_transport(host& system,
                                   const environment_context& ctx,
                                   const char* name,
                                   const argv& copy_command,
                                   const argv& paste_command)
  : m_system(system)
  , m_ctx(ctx)
  , m_name(name)
  , m_copy_command(copy_command)
  , m_paste_command(paste_command) {
}

Capability native_transport::capability() const {
  if (!m_copy_command.empty() && !m_paste_command.empty())
    return Capability::Both;
  else if (!m_paste_command.empty())
    return Capability::Paste;
  else
    return Capability::Copy;
}

result native_transport::copy(const payload& data) {
  if (m_copy_command.empty())
    return result::failure(ErrorCode::UnsupportedDirection,
                           std::string(m_name) + " cannot copy");

  return run(m_copy_command, data, nullptr);
}

result native_transport::paste(payload& output) {
  if (m_paste_command.empty())
    return transport::paste(output);

  payload buf;
  result r = run(m_paste_command, payload(), &buf);
  if (r.ok) {
    r.bytes = buf.size();
    output = std::move(buf);
  }
  return r;
}

ErrorCode native_transport::check_ready(std::string& detail) const {
  return ErrorCode::None;
}

result native_transport::run(const argv& command,
                             const payload& input,
                             payload* output) {
  const std::string& program = command.front();
  if (!m_system.find_command(program))
    return result::failure(ErrorCode::NoCommandFound,
                           program + " not found in PATH");

  std::string detail;
  ErrorCode code = check_ready(detail);
  if (code != ErrorCode::None)
    return result::failure(code, detail);

  const int timeout_ms = m_ctx.overrides.command_timeout_ms;
  run_result r = m_system.run(command, input, output, timeout_ms);
  switch (r.status) {
    case RunStatus::Ok:
      return result::success(m_name, input.size());
    case RunStatus::NotFound:
      return result::failure(ErrorCode::NoCommandFound,
                             program + " cannot be executed");
    case RunStatus::TimedOut:
      return result::failure(ErrorCode::CommandTimeout,
                             fmt::format("{} didn't finish in {} ms",
                                         program, timeout_ms));
    case RunStatus::Failed:
      break;
  }
  return result::failure(ErrorCode::CommandFailed,
                         fmt::format("{} exited with code {}",
                                     program, r.exit_code));
}

} // namespace details
} // namespace termclip
