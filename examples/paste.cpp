// Termclip Library
// Copyright (c) 2026 David Capello

#include "termclip.h"
#include <iostream>

int main() {
  std::string value;
  termclip::result r = termclip::paste(value);
  if (r.ok)
    std::cout << "Clipboard content is '" << value << "' (from "
              << r.transport << ")\n";
  else
    std::cout << "Clipboard cannot be read: "
              << termclip::error_code_name(r.code) << "\n";
}
