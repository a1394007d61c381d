// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#include "termclip.h"
#include "fake_host.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace termclip;

namespace {

typedef std::vector<std::string> names;

environment_context make_context(Platform platform) {
  environment_context ctx;
  ctx.platform = platform;
  ctx.display = ":0";
  return ctx;
}

names resolve_names(const environment_context& ctx, Direction direction) {
  fake_host host;
  memory_sink tty;
  return candidate_names(resolve(ctx, direction, host, tty));
}

std::vector<ErrorCode> attempt_codes(const result& r) {
  std::vector<ErrorCode> codes;
  for (const attempt& a : r.attempts)
    codes.push_back(a.code);
  return codes;
}

int g_failures = 0;

void count_failures(ErrorCode, const char*) {
  ++g_failures;
}

} // anonymous namespace

TEST(Resolve, CopyCandidatesPerPlatform) {
  EXPECT_EQ(names({ "xclip", "xsel", "osc52" }),
            resolve_names(make_context(Platform::X11), Direction::Copy));
  EXPECT_EQ(names({ "wl-copy", "xclip", "xsel", "osc52" }),
            resolve_names(make_context(Platform::Wayland), Direction::Copy));
  EXPECT_EQ(names({ "pbcopy", "osc52" }),
            resolve_names(make_context(Platform::MacOS), Direction::Copy));
  EXPECT_EQ(names({ "clip", "powershell", "osc52" }),
            resolve_names(make_context(Platform::Windows), Direction::Copy));
  EXPECT_EQ(names({ "osc52" }),
            resolve_names(make_context(Platform::Unknown), Direction::Copy));
}

TEST(Resolve, WslAddsWindowsCommands) {
  environment_context ctx = make_context(Platform::Unknown);
  ctx.wsl = true;
  EXPECT_EQ(names({ "clip.exe", "powershell.exe", "osc52" }),
            resolve_names(ctx, Direction::Copy));
  EXPECT_EQ(names({ "powershell.exe" }),
            resolve_names(ctx, Direction::Paste));
}

TEST(Resolve, PasteCandidatesNeverIncludeOsc52) {
  EXPECT_EQ(names({ "xclip", "xsel" }),
            resolve_names(make_context(Platform::X11), Direction::Paste));
  EXPECT_EQ(names({ "wl-copy", "xclip", "xsel" }),
            resolve_names(make_context(Platform::Wayland), Direction::Paste));
  EXPECT_EQ(names({ "pbcopy" }),
            resolve_names(make_context(Platform::MacOS), Direction::Paste));
  EXPECT_EQ(names({ "powershell" }),
            resolve_names(make_context(Platform::Windows), Direction::Paste));
  EXPECT_TRUE(resolve_names(make_context(Platform::Unknown), Direction::Paste).empty());
}

TEST(Resolve, ForceOsc52) {
  environment_context ctx = make_context(Platform::Wayland);
  ctx.overrides.force_osc52 = true;
  EXPECT_EQ(names({ "osc52" }), resolve_names(ctx, Direction::Copy));
  EXPECT_TRUE(resolve_names(ctx, Direction::Paste).empty());
}

TEST(Resolve, ForceNative) {
  environment_context ctx = make_context(Platform::X11);
  ctx.overrides.force_native = true;
  EXPECT_EQ(names({ "xclip", "xsel" }), resolve_names(ctx, Direction::Copy));
}

TEST(Resolve, BothOverridesResolveToOsc52Only) {
  environment env;
  env["DISPLAY"] = ":0";
  env["TERMCLIP_FORCE_OSC52"] = "1";
  env["TERMCLIP_FORCE_NATIVE"] = "1";
  EXPECT_EQ(names({ "osc52" }),
            resolve_names(probe_environment(HostOS::Unix, env), Direction::Copy));

  // Even if both flags reach the selector
  environment_context ctx = make_context(Platform::MacOS);
  ctx.overrides.force_osc52 = true;
  ctx.overrides.force_native = true;
  EXPECT_EQ(names({ "osc52" }), resolve_names(ctx, Direction::Copy));
}

TEST(Execute, FallsThroughToOsc52WhenXclipIsMissing) {
  fake_host host;
  memory_sink tty;
  environment_context ctx = make_context(Platform::X11);

  result r = copy(ctx, "hello world", host, tty);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ("osc52", r.transport);
  EXPECT_EQ(11u, r.bytes);
  EXPECT_EQ("\x1b]52;c;aGVsbG8gd29ybGQ=\x07", tty.data());
  EXPECT_EQ(1, tty.writes());
  EXPECT_TRUE(host.ran.empty());

  ASSERT_EQ(2u, r.attempts.size());
  EXPECT_EQ("xclip", r.attempts[0].transport);
  EXPECT_EQ(ErrorCode::NoCommandFound, r.attempts[0].code);
  EXPECT_EQ("xsel", r.attempts[1].transport);
  EXPECT_EQ(ErrorCode::NoCommandFound, r.attempts[1].code);
}

TEST(Execute, StopsAtFirstSuccess) {
  fake_host host;
  host.commands = { "xclip", "xsel" };
  memory_sink tty;
  environment_context ctx = make_context(Platform::X11);

  payload data("bin\0ary\r\n", 9);
  result r = termclip::copy(ctx, data, host, tty);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ("xclip", r.transport);
  EXPECT_EQ(9u, r.bytes);
  EXPECT_TRUE(r.attempts.empty());
  ASSERT_EQ(1u, host.ran.size());
  EXPECT_EQ("xclip -selection clipboard -in", host.ran[0]);
  EXPECT_EQ(data, host.inputs["xclip"]);
  EXPECT_EQ(0, tty.writes());
}

TEST(Execute, FailedAndHungCommandsAreSkipped) {
  fake_host host;
  host.commands = { "xclip", "xsel" };
  host.fail("xclip", RunStatus::Failed, 1);
  host.fail("xsel", RunStatus::TimedOut);
  memory_sink tty;
  environment_context ctx = make_context(Platform::X11);
  ctx.overrides.command_timeout_ms = 123;

  result r = copy(ctx, "text", host, tty);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ("osc52", r.transport);
  EXPECT_EQ(std::vector<ErrorCode>({ ErrorCode::CommandFailed,
                                     ErrorCode::CommandTimeout }),
            attempt_codes(r));
  EXPECT_EQ(123, host.last_timeout_ms);
}

TEST(Execute, WaylandFallsBackToX11Tools) {
  fake_host host;
  host.commands = { "xsel" };
  memory_sink tty;

  result r = copy(make_context(Platform::Wayland), "text", host, tty);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ("xsel", r.transport);
  EXPECT_EQ(names({ "xsel --clipboard --input" }), host.ran);
}

TEST(Execute, UnreachableDisplaySkipsX11Tools) {
  fake_host host;
  host.commands = { "xclip", "xsel" };
  host.display = false;
  memory_sink tty;

  result r = copy(make_context(Platform::X11), "text", host, tty);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ("osc52", r.transport);
  EXPECT_TRUE(host.ran.empty());
  EXPECT_EQ(std::vector<ErrorCode>({ ErrorCode::DisplayUnavailable,
                                     ErrorCode::DisplayUnavailable }),
            attempt_codes(r));
  EXPECT_EQ(names({ ":0", ":0" }), host.displays_checked);
}

TEST(Execute, AllTransportsExhausted) {
  fake_host host;
  memory_sink tty;
  environment_context ctx = make_context(Platform::X11);
  ctx.overrides.force_native = true;

  result r = copy(ctx, "text", host, tty);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(ErrorCode::AllTransportsExhausted, r.code);
  EXPECT_EQ(2u, r.attempts.size());
  EXPECT_NE(std::string::npos, r.detail.find("xclip"));
  EXPECT_NE(std::string::npos, r.detail.find("xsel"));
}

TEST(Execute, TooLargePayloadEmitsNothing) {
  fake_host host;
  memory_sink tty;
  environment_context ctx = make_context(Platform::Unknown);
  ctx.overrides.osc52_max_b64 = 8;

  result r = copy(ctx, "more than six bytes", host, tty);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(ErrorCode::AllTransportsExhausted, r.code);
  EXPECT_EQ(std::vector<ErrorCode>({ ErrorCode::PayloadTooLarge }), attempt_codes(r));
  EXPECT_EQ(0, tty.writes());
  EXPECT_TRUE(tty.data().empty());
}

TEST(Execute, NoTerminal) {
  fake_host host;
  memory_sink tty(false);

  result r = copy(make_context(Platform::Unknown), "text", host, tty);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(std::vector<ErrorCode>({ ErrorCode::NoTerminal }), attempt_codes(r));
}

TEST(Execute, ScreenSequenceIsWrittenAtOnce) {
  fake_host host;
  memory_sink tty;
  environment_context ctx = make_context(Platform::Unknown);
  ctx.multiplexer = Multiplexer::Screen;

  payload data(5000, 'z');
  result r = termclip::copy(ctx, data, host, tty);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(1, tty.writes());

  std::string b64;
  payload decoded;
  ASSERT_TRUE(extract_osc52_base64(tty.data(), b64));
  ASSERT_TRUE(base64_decode(b64, decoded));
  EXPECT_EQ(data, decoded);
}

TEST(Execute, ErrorHandlerIsCalledForEachFailure) {
  fake_host host;
  memory_sink tty;
  g_failures = 0;
  set_error_handler(count_failures);

  result r = copy(make_context(Platform::Wayland), "text", host, tty);
  set_error_handler(nullptr);

  ASSERT_TRUE(r.ok);
  EXPECT_EQ(3, g_failures);
}

TEST(Paste, NoNativeCommandIsUnsupported) {
  fake_host host;
  payload output;

  result r = paste(make_context(Platform::Unknown), output, host);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(ErrorCode::UnsupportedDirection, r.code);
  EXPECT_TRUE(output.empty());
}

TEST(Paste, ForceOsc52IsUnsupported) {
  fake_host host;
  host.commands = { "pbpaste" };
  environment_context ctx = make_context(Platform::MacOS);
  ctx.overrides.force_osc52 = true;

  payload output;
  result r = paste(ctx, output, host);
  EXPECT_EQ(ErrorCode::UnsupportedDirection, r.code);
  EXPECT_TRUE(host.ran.empty());
}

TEST(Paste, ReturnsExactBytes) {
  fake_host host;
  host.commands = { "xclip" };
  host.outputs["xclip -selection clipboard -out"] = payload("a\0b\n", 4);

  payload output;
  result r = paste(make_context(Platform::X11), output, host);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ("xclip", r.transport);
  EXPECT_EQ(4u, r.bytes);
  EXPECT_EQ(payload("a\0b\n", 4), output);
}

TEST(Paste, FailedCommandsAreExhausted) {
  fake_host host;
  host.commands = { "wl-paste", "xclip" };
  host.fail("wl-paste", RunStatus::Failed, 1);
  host.fail("xclip", RunStatus::TimedOut);

  payload output;
  result r = paste(make_context(Platform::Wayland), output, host);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(ErrorCode::AllTransportsExhausted, r.code);
  EXPECT_EQ(std::vector<ErrorCode>({ ErrorCode::CommandFailed,
                                     ErrorCode::CommandTimeout,
                                     ErrorCode::NoCommandFound }),
            attempt_codes(r));
  EXPECT_EQ(names({ "wl-paste --no-newline", "xclip -selection clipboard -out" }),
            host.ran);
}

TEST(Paste, MissingCommandsAreUnsupported) {
  const Platform platforms[] = { Platform::X11, Platform::Wayland };
  for (Platform platform : platforms) {
    fake_host host;
    payload output;
    result r = paste(make_context(platform), output, host);
    EXPECT_FALSE(r.ok) << platform_name(platform);
    EXPECT_EQ(ErrorCode::UnsupportedDirection, r.code) << platform_name(platform);
    EXPECT_FALSE(r.attempts.empty()) << platform_name(platform);
    EXPECT_TRUE(host.ran.empty()) << platform_name(platform);
  }
}

TEST(Paste, UnreachableDisplayIsUnsupported) {
  fake_host host;
  host.commands = { "xclip", "xsel" };
  host.display = false;

  payload output;
  result r = paste(make_context(Platform::X11), output, host);
  EXPECT_EQ(ErrorCode::UnsupportedDirection, r.code);
  EXPECT_EQ(std::vector<ErrorCode>({ ErrorCode::DisplayUnavailable,
                                     ErrorCode::DisplayUnavailable }),
            attempt_codes(r));
}

TEST(Paste, DiagnosticNamesTheCommandThatRan) {
  fake_host host;
  host.commands = { "pbpaste" };
  host.fail("pbpaste", RunStatus::Failed, 1);

  payload output;
  result r = paste(make_context(Platform::MacOS), output, host);
  EXPECT_EQ(ErrorCode::AllTransportsExhausted, r.code);
  EXPECT_NE(std::string::npos, r.detail.find("pbpaste exited with code 1"));
}

TEST(Resolve, TmuxBufferCandidate) {
  environment_context ctx = make_context(Platform::X11);
  ctx.multiplexer = Multiplexer::Tmux;
  EXPECT_EQ(names({ "xclip", "xsel", "tmux", "osc52" }),
            resolve_names(ctx, Direction::Copy));
  EXPECT_EQ(names({ "xclip", "xsel", "tmux" }),
            resolve_names(ctx, Direction::Paste));

  ctx.platform = Platform::Unknown;
  EXPECT_EQ(names({ "tmux", "osc52" }), resolve_names(ctx, Direction::Copy));

  ctx.overrides.force_osc52 = true;
  EXPECT_EQ(names({ "osc52" }), resolve_names(ctx, Direction::Copy));
}

TEST(Paste, TmuxBufferOverSsh) {
  fake_host host;
  host.commands = { "tmux" };
  host.outputs["tmux save-buffer -"] = "remote buffer";
  environment_context ctx = make_context(Platform::Unknown);
  ctx.multiplexer = Multiplexer::Tmux;

  payload output;
  result r = paste(ctx, output, host);
  ASSERT_TRUE(r.ok);
  EXPECT_EQ("tmux", r.transport);
  EXPECT_EQ("remote buffer", output);
}
