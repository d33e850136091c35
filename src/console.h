/*
 * *****************************************************************************
 * CONSOLE
 * *****************************************************************************
 * Tagged diagnostic output ("Controller: Ready", "PID[temperature]: ...")
 * written line by line to an attachable stream. Defaults to std::cout;
 * attach nullptr to silence, or a string stream to capture in tests.
 * *****************************************************************************
 */

#pragma once

#include <iosfwd>

/**
 * @brief Redirect console output
 * @param out Destination stream, or nullptr to discard all output
 */
void console_attach(std::ostream *out);

/**
 * @brief Currently attached stream (nullptr when silenced)
 */
std::ostream *console_stream();

/**
 * @brief Print one tagged line: "<tag>: <formatted message>\n"
 * @param tag Component name shown before the colon
 * @param fmt printf-style format string
 */
void console_printf(const char *tag, const char *fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;
