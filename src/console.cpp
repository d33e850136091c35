/*
 * *****************************************************************************
 * CONSOLE - IMPLEMENTATION
 * *****************************************************************************
 */

#include "console.h"

#include <stdarg.h>
#include <stdio.h>
#include <iostream>
#include <vector>

static std::ostream *g_out = &std::cout;

void console_attach(std::ostream *out) {
  g_out = out;
}

std::ostream *console_stream() {
  return g_out;
}

void console_printf(const char *tag, const char *fmt, ...) {
  if (g_out == nullptr) {
    return;
  }

  char buffer[256];
  va_list args;
  va_start(args, fmt);
  va_list retry;
  va_copy(retry, args);
  int len = vsnprintf(buffer, sizeof(buffer), fmt, args);
  va_end(args);

  if (len < 0) {
    va_end(retry);
    return;
  }

  if (static_cast<size_t>(len) < sizeof(buffer)) {
    (*g_out) << tag << ": " << buffer << '\n';
  } else {
    // Long line: format again into a buffer of the exact size
    std::vector<char> big(static_cast<size_t>(len) + 1);
    vsnprintf(big.data(), big.size(), fmt, retry);
    (*g_out) << tag << ": " << big.data() << '\n';
  }
  va_end(retry);
}
