// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#include "termclip.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace termclip;

namespace {

payload all_bytes() {
  payload data;
  for (int i=0; i<256; ++i)
    data.push_back((char)i);
  return data;
}

// Splits a screen sequence in its "ESC P ... ESC \" chunks.
std::vector<std::string> screen_chunks(const std::string& seq) {
  std::vector<std::string> chunks;
  std::size_t pos = 0;
  while (pos < seq.size()) {
    EXPECT_EQ(0u, seq.compare(pos, 2, "\x1bP"));
    std::size_t end = seq.find("\x1b\\", pos + 2);
    EXPECT_NE(std::string::npos, end);
    if (end == std::string::npos)
      break;
    chunks.push_back(seq.substr(pos, end + 2 - pos));
    pos = end + 2;
  }
  return chunks;
}

} // anonymous namespace

TEST(Base64, EncodesKnownVectors) {
  EXPECT_EQ("", base64_encode(""));
  EXPECT_EQ("Zg==", base64_encode("f"));
  EXPECT_EQ("Zm8=", base64_encode("fo"));
  EXPECT_EQ("Zm9v", base64_encode("foo"));
  EXPECT_EQ("Zm9vYg==", base64_encode("foob"));
  EXPECT_EQ("Zm9vYmE=", base64_encode("fooba"));
  EXPECT_EQ("Zm9vYmFy", base64_encode("foobar"));
  EXPECT_EQ("aGVsbG8gd29ybGQ=", base64_encode("hello world"));
  EXPECT_EQ("/+8A", base64_encode(std::string("\xff\xef\x00", 3)));
}

TEST(Base64, DecodesKnownVectors) {
  payload data;
  EXPECT_TRUE(base64_decode("Zm9vYmE=", data));
  EXPECT_EQ("fooba", data);
  EXPECT_TRUE(base64_decode("Zg==", data));
  EXPECT_EQ("f", data);
  EXPECT_TRUE(base64_decode("", data));
  EXPECT_EQ("", data);
}

TEST(Base64, RejectsMalformedText) {
  payload data;
  EXPECT_FALSE(base64_decode("Zm9", data));      // Length is not a multiple of 4
  EXPECT_FALSE(base64_decode("Zm9*", data));     // Invalid char
  EXPECT_FALSE(base64_decode("Z===", data));     // Too much padding
  EXPECT_FALSE(base64_decode("Zg==Zm9v", data)); // Data after padding
  EXPECT_FALSE(base64_decode("Zg=v", data));
}

TEST(Osc52, HelloWorldWithoutMultiplexer) {
  std::string seq;
  ASSERT_EQ(ErrorCode::None,
            encode_osc52("hello world", Multiplexer::None, kOsc52DefaultMaxB64, seq));
  EXPECT_EQ("\x1b]52;c;aGVsbG8gd29ybGQ=\x07", seq);
}

TEST(Osc52, TmuxEnvelopeDoublesEscapes) {
  std::string seq;
  ASSERT_EQ(ErrorCode::None,
            encode_osc52("hello world", Multiplexer::Tmux, kOsc52DefaultMaxB64, seq));
  EXPECT_EQ("\x1bPtmux;\x1b\x1b]52;c;aGVsbG8gd29ybGQ=\x07\x1b\\", seq);
}

TEST(Osc52, ScreenShortSequenceIsOneChunk) {
  std::string seq;
  ASSERT_EQ(ErrorCode::None,
            encode_osc52("hello world", Multiplexer::Screen, kOsc52DefaultMaxB64, seq));
  EXPECT_EQ("\x1bP\x1b]52;c;aGVsbG8gd29ybGQ=\x07\x1b\\", seq);
}

TEST(Osc52, ScreenLongSequenceIsChunked) {
  // 3000 bytes -> 4000 base64 chars -> 4008 bytes of OSC sequence,
  // 764 bytes per chunk (768 minus the DCS framing).
  payload data(3000, 'x');
  std::string seq;
  ASSERT_EQ(ErrorCode::None,
            encode_osc52(data, Multiplexer::Screen, kOsc52DefaultMaxB64, seq));

  std::vector<std::string> chunks = screen_chunks(seq);
  ASSERT_EQ(6u, chunks.size());

  std::string osc;
  for (const std::string& chunk : chunks) {
    EXPECT_LE(chunk.size(), kScreenChunkLimit);
    osc += chunk.substr(2, chunk.size() - 4);
  }
  EXPECT_EQ("\x1b]52;c;" + base64_encode(data) + "\x07", osc);

  std::string b64;
  ASSERT_TRUE(extract_osc52_base64(seq, b64));
  EXPECT_EQ(base64_encode(data), b64);
}

TEST(Osc52, PayloadAtTheCeilingIsAccepted) {
  std::string seq;
  // 12 bytes -> 16 base64 chars
  EXPECT_EQ(ErrorCode::None,
            encode_osc52(payload(12, 'a'), Multiplexer::None, 16, seq));
  EXPECT_FALSE(seq.empty());
}

TEST(Osc52, PayloadOverTheCeilingIsRejected) {
  std::string seq = "previous content";
  // 13 bytes -> 20 base64 chars
  EXPECT_EQ(ErrorCode::PayloadTooLarge,
            encode_osc52(payload(13, 'a'), Multiplexer::None, 16, seq));
  EXPECT_TRUE(seq.empty());

  EXPECT_EQ(ErrorCode::PayloadTooLarge,
            encode_osc52(payload(60000, 'a'), Multiplexer::Tmux, kOsc52DefaultMaxB64, seq));
  EXPECT_TRUE(seq.empty());
}

TEST(Osc52, BinaryPayloadSurvivesEveryFraming) {
  payload data = all_bytes();
  data += std::string("\x1b]52;\x07\x1b\\", 8);
  data += payload(2000, '\x1b');

  const Multiplexer multiplexers[] = {
    Multiplexer::None, Multiplexer::Tmux, Multiplexer::Screen
  };
  for (Multiplexer m : multiplexers) {
    std::string seq, b64;
    payload decoded;
    ASSERT_EQ(ErrorCode::None, encode_osc52(data, m, kOsc52DefaultMaxB64, seq));
    ASSERT_TRUE(extract_osc52_base64(seq, b64)) << multiplexer_name(m);
    ASSERT_TRUE(base64_decode(b64, decoded)) << multiplexer_name(m);
    EXPECT_EQ(data, decoded) << multiplexer_name(m);
  }
}

TEST(Osc52, ExtractAcceptsStringTerminator) {
  std::string b64;
  EXPECT_TRUE(extract_osc52_base64("\x1b]52;c;Zm9v\x1b\\", b64));
  EXPECT_EQ("Zm9v", b64);
}

TEST(Osc52, ExtractRejectsOtherSequences) {
  std::string b64;
  EXPECT_FALSE(extract_osc52_base64("", b64));
  EXPECT_FALSE(extract_osc52_base64("hello", b64));
  EXPECT_FALSE(extract_osc52_base64("\x1b]2;title\x07", b64));
  EXPECT_FALSE(extract_osc52_base64("\x1b]52;c;Zm9v", b64));
  EXPECT_FALSE(extract_osc52_base64("\x1bPtmux;", b64));
  EXPECT_FALSE(extract_osc52_base64("\x1bP\x1b]52;c;Zm9v\x07", b64));
}
