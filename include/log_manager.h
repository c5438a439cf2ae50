/*
 * Log Manager - stderr logging with formatting
 *
 * Provides structured logging with:
 * - Nested blocks with automatic indentation
 * - Automatic timing for each block
 * - Printf-style formatting
 *
 * Output goes to stderr so the systemd journal picks it up.
 */

#pragma once

#include <stdint.h>
#include <stdio.h>

class LogManager {
public:
  LogManager();

  // Redirect output (defaults to stderr). Passing nullptr restores stderr.
  void begin(FILE* out = nullptr);

  // Nested logging with automatic timing
  void logBegin(const char* module);
  void logLine(const char* message);
  void logLinef(const char* format, ...) __attribute__((format(printf, 2, 3)));
  void logEnd(const char* message = nullptr);

  // Single-line logging: "[MODULE] message"
  void logMessage(const char* module, const char* message);
  void logMessagef(const char* module, const char* format, ...) __attribute__((format(printf, 3, 4)));

private:
  FILE* out;

  // Nested block tracking
  static uint64_t startTimes[3];  // Start time for each nesting level
  static uint8_t nestLevel;       // Current nesting depth (0-2, 3+ = overflow)

  const char* indent();
  void writeLine(const char* line);
};

// Global instance
extern LogManager Logger;
