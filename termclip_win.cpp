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

// PowerShell scripts that move the clipboard content through the
// standard streams without adding a new line at the end.
const char* kSetClipboardScript =
  "Set-Clipboard -Value ([Console]::In.ReadToEnd())";
const char* kGetClipboardScript =
  "[Console]::Out.Write((Get-Clipboard -Raw))";

// Windows clipboard through clip.exe (copy only) or PowerShell. The
// same commands are available from WSL with the .exe suffix.
class win_transport : public native_transport {
public:
  win_transport(host& system,
                const environment_context& ctx,
                const char* name,
                const argv& copy_command,
                const argv& paste_command)
    : native_transport(system, ctx, name, copy_command, paste_command) {
  }
};

native_transport::argv powershell_command(const char* program,
                                          const char* script) {
  return { program, "-NoProfile", "-NonInteractive", "-Command", script };
}

} // anonymous namespace

void add_win_transports(host& system, const environment_context& ctx, transport_list& list) {
  list.push_back(transport_ptr(
    new win_transport(system, ctx, "clip",
                      { "clip" },
                      native_transport::argv())));
  list.push_back(transport_ptr(
    new win_transport(system, ctx, "powershell",
                      powershell_command("powershell", kSetClipboardScript),
                      powershell_command("powershell", kGetClipboardScript))));
}

void add_wsl_transports(host& system, const environment_context& ctx, transport_list& list) {
  list.push_back(transport_ptr(
    new win_transport(system, ctx, "clip.exe",
                      { "clip.exe" },
                      native_transport::argv())));
  list.push_back(transport_ptr(
    new win_transport(system, ctx, "powershell.exe",
                      powershell_command("powershell.exe", kSetClipboardScript),
                      powershell_command("powershell.exe", kGetClipboardScript))));
}

} // namespace details
} // namespace termclip
