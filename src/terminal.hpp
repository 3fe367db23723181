#ifndef TWCSS_TERMINAL_H
#define TWCSS_TERMINAL_H

// Minimal terminal abstraction for cross compatibility.
// Its main purpose is to let us print stuff with colors.
namespace Terminal {

  // ANSI escape codes (only emitted if colors are enabled)
  const char reset[] = "\033[m";
  const char bold[] = "\033[1m";
  const char red[] = "\033[31m";
  const char green[] = "\033[32m";
  const char yellow[] = "\033[33m";
  const char blue[] = "\033[34m";
  const char magenta[] = "\033[35m";
  const char cyan[] = "\033[36m";

}

#endif
