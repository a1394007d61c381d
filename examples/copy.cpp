// Termclip Library
// Copyright (c) 2026 David Capello

#include "termclip.h"
#include <iostream>

int main() {
  termclip::result r = termclip::copy("Hello World");
  if (!r.ok) {
    std::cout << "Cannot copy: " << r.detail << "\n";
    return 1;
  }

  std::cout << "'Hello World' was copied to the clipboard with "
            << r.transport << "\n";
}
