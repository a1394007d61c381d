// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#include "termclip.h"
#include "termclip_common.h"

#include <cstdint>

namespace termclip {

namespace {

const char kBase64Chars[] =
  "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
  "abcdefghijklmnopqrstuvwxyz"
  "0123456789+/";

const char kEsc = '\x1b';
const char kBel = '\x07';

// "ESC ] 52 ; c ;" sets the "c" (clipboard) selection. The sequence
// is terminated with BEL, which is accepted by xterm, tmux, screen,
// and most terminal emulators.
const std::string kOscStart = "\x1b]52;c;";
const std::string kDcsStart = "\x1bP";
const std::string kTmuxStart = "\x1bPtmux;";
const std::string kStringTerminator = "\x1b\\";

int base64_value(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

std::size_t base64_length(std::size_t n) {
  return 4 * ((n + 2) / 3);
}

bool starts_with(const std::string& s, const std::string& prefix,
                 std::size_t pos = 0) {
  return (s.size() >= pos + prefix.size() &&
          s.compare(pos, prefix.size(), prefix) == 0);
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return (s.size() >= suffix.size() &&
          s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0);
}

// tmux pass-through: each ESC inside the envelope must be doubled.
std::string wrap_tmux(const std::string& osc) {
  std::string out = kTmuxStart;
  out.reserve(osc.size() + 16);
  for (char c : osc) {
    if (c == kEsc)
      out.push_back(kEsc);
    out.push_back(c);
  }
  out += kStringTerminator;
  return out;
}

// screen pass-through: the sequence is sent in several device control
// strings, each one not longer than kScreenChunkLimit bytes.
std::string wrap_screen(const std::string& osc) {
  const std::size_t framing = kDcsStart.size() + kStringTerminator.size();
  const std::size_t piece_size = kScreenChunkLimit - framing;

  std::string out;
  out.reserve(osc.size() + framing * (osc.size() / piece_size + 1));
  for (std::size_t i=0; i<osc.size(); i+=piece_size) {
    out += kDcsStart;
    out.append(osc, i, piece_size);
    out += kStringTerminator;
  }
  return out;
}

std::string unwrap_tmux(const std::string& seq) {
  std::string body = seq.substr(kTmuxStart.size(),
                                seq.size() - kTmuxStart.size() - kStringTerminator.size());
  std::string out;
  out.reserve(body.size());
  for (std::size_t i=0; i<body.size(); ++i) {
    out.push_back(body[i]);
    if (body[i] == kEsc && i+1 < body.size() && body[i+1] == kEsc)
      ++i;
  }
  return out;
}

bool unwrap_screen(const std::string& seq, std::string& osc) {
  std::size_t pos = 0;
  while (pos < seq.size()) {
    if (!starts_with(seq, kDcsStart, pos))
      return false;
    pos += kDcsStart.size();

    std::size_t end = seq.find(kStringTerminator, pos);
    if (end == std::string::npos)
      return false;

    osc.append(seq, pos, end - pos);
    pos = end + kStringTerminator.size();
  }
  return true;
}

} // anonymous namespace

std::string base64_encode(const payload& data) {
  std::string out;
  out.reserve(base64_length(data.size()));

  const uint8_t* src = (const uint8_t*)data.data();
  const std::size_t n = data.size();
  std::size_t i = 0;
  for (; i+2<n; i+=3) {
    uint32_t v = (src[i] << 16) | (src[i+1] << 8) | src[i+2];
    out.push_back(kBase64Chars[(v >> 18) & 63]);
    out.push_back(kBase64Chars[(v >> 12) & 63]);
    out.push_back(kBase64Chars[(v >> 6) & 63]);
    out.push_back(kBase64Chars[v & 63]);
  }

  if (i < n) {
    uint32_t v = (src[i] << 16);
    if (i+1 < n)
      v |= (src[i+1] << 8);

    out.push_back(kBase64Chars[(v >> 18) & 63]);
    out.push_back(kBase64Chars[(v >> 12) & 63]);
    out.push_back(i+1 < n ? kBase64Chars[(v >> 6) & 63]: '=');
    out.push_back('=');
  }
  return out;
}

bool base64_decode(const std::string& text, payload& data) {
  if (text.size() % 4 != 0)
    return false;

  data.clear();
  data.reserve(text.size() / 4 * 3);

  for (std::size_t i=0; i<text.size(); i+=4) {
    const bool last = (i+4 == text.size());
    int v[4];
    int padding = 0;
    for (int j=0; j<4; ++j) {
      char c = text[i+j];
      if (c == '=' && last && j >= 2) {
        v[j] = 0;
        ++padding;
      }
      else {
        // Data after the padding is invalid
        if (padding > 0)
          return false;
        v[j] = base64_value(c);
        if (v[j] < 0)
          return false;
      }
    }

    uint32_t bits = (v[0] << 18) | (v[1] << 12) | (v[2] << 6) | v[3];
    data.push_back((char)((bits >> 16) & 0xff));
    if (padding < 2)
      data.push_back((char)((bits >> 8) & 0xff));
    if (padding < 1)
      data.push_back((char)(bits & 0xff));
  }
  return true;
}

ErrorCode encode_osc52(const payload& data,
                       Multiplexer multiplexer,
                       std::size_t max_b64,
                       std::string& sequence) {
  sequence.clear();

  // We prefer to fail instead of truncating the content, a truncated
  // base64 text would leave garbage in the clipboard.
  if (base64_length(data.size()) > max_b64)
    return ErrorCode::PayloadTooLarge;

  std::string osc = kOscStart;
  osc += base64_encode(data);
  osc.push_back(kBel);

  switch (multiplexer) {
    case Multiplexer::None:
      sequence = std::move(osc);
      break;
    case Multiplexer::Tmux:
      sequence = wrap_tmux(osc);
      break;
    case Multiplexer::Screen:
      sequence = wrap_screen(osc);
      break;
  }
  return ErrorCode::None;
}

bool extract_osc52_base64(const std::string& sequence, std::string& b64) {
  std::string osc;
  if (starts_with(sequence, kTmuxStart)) {
    if (!ends_with(sequence, kStringTerminator) ||
        sequence.size() < kTmuxStart.size() + kStringTerminator.size())
      return false;
    osc = unwrap_tmux(sequence);
  }
  else if (starts_with(sequence, kDcsStart)) {
    if (!unwrap_screen(sequence, osc))
      return false;
  }
  else
    osc = sequence;

  std::size_t terminator;
  if (ends_with(osc, std::string(1, kBel)))
    terminator = 1;
  else if (ends_with(osc, kStringTerminator))
    terminator = kStringTerminator.size();
  else
    return false;

  if (!starts_with(osc, kOscStart) ||
      osc.size() < kOscStart.size() + terminator)
    return false;

  b64 = osc.substr(kOscStart.size(),
                   osc.size() - kOscStart.size() - terminator);
  return true;
}

memory_sink::memory_sink(bool available)
  : m_available(available)
  , m_writes(0) {
}

bool memory_sink::write(const std::string& bytes) {
  if (!m_available)
    return false;
  m_data += bytes;
  ++m_writes;
  return true;
}

namespace details {

osc52_transport::osc52_transport(host& system,
                                 terminal_sink& tty,
                                 const environment_context& ctx)
  : m_system(system)
  , m_tty(tty)
  , m_ctx(ctx) {
}

result osc52_transport::copy(const payload& data) {
  const std::size_t max_b64 = m_ctx.overrides.osc52_max_b64;

  std::string seq;
  if (encode_osc52(data, m_ctx.multiplexer, max_b64, seq) != ErrorCode::None) {
    return result::failure(
      ErrorCode::PayloadTooLarge,
      fmt::format("base64 length {} exceeds the {} limit (TERMCLIP_OSC52_MAX_B64)",
                  base64_length(data.size()), max_b64));
  }

  // tmux discards the sequence if it's not configured to forward it
  if (m_ctx.multiplexer == Multiplexer::Tmux)
    warn_tmux_settings(query_tmux_settings(m_system, m_ctx.overrides.command_timeout_ms));

  logger()->debug("writing {} bytes OSC 52 sequence ({} framing)",
                  seq.size(), multiplexer_name(m_ctx.multiplexer));

  if (!m_tty.write(seq))
    return result::failure(ErrorCode::NoTerminal,
                           "cannot open the terminal to write the OSC 52 sequence");

  return result::success(name(), data.size());
}

} // namespace details

} // namespace termclip
