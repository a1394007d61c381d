// Termclip Library
// Copyright (c) 2026 David Capello

#include "termclip.h"
#include <cstdio>
#include <iostream>

// Prints the OSC 52 sequence that would be sent to the terminal for
// each multiplexer (with the escape chars made visible).
int main() {
  const termclip::Multiplexer multiplexers[] = {
    termclip::Multiplexer::None,
    termclip::Multiplexer::Tmux,
    termclip::Multiplexer::Screen,
  };

  for (termclip::Multiplexer m : multiplexers) {
    std::string seq;
    termclip::ErrorCode err =
      termclip::encode_osc52("hello world", m, termclip::kOsc52DefaultMaxB64, seq);

    std::cout << termclip::multiplexer_name(m) << ": ";
    if (err != termclip::ErrorCode::None) {
      std::cout << termclip::error_code_name(err) << "\n";
      continue;
    }
    for (char c : seq) {
      if (c == '\x1b')
        std::cout << "ESC ";
      else if (c == '\x07')
        std::cout << " BEL";
      else
        std::cout << c;
    }
    std::cout << "\n";
  }
}
