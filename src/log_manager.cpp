/*
 * Log Manager Implementation
 *
 * Indentation-based logger with nested blocks and automatic timing.
 * Every line is formatted first and then written with a single call.
 */

#include "log_manager.h"
#include "timing.h"

#include <stdarg.h>
#include <string.h>

#include <string>

// Initialize static members
uint64_t LogManager::startTimes[3] = {0, 0, 0};
uint8_t LogManager::nestLevel = 0;

// Global LogManager instance
LogManager Logger;

LogManager::LogManager() : out(nullptr) {
}

void LogManager::begin(FILE* stream) {
  out = stream;
}

void LogManager::writeLine(const char* line) {
  if (!line) return;
  FILE* f = out ? out : stderr;
  fputs(line, f);
  fflush(f);
}

// Get indentation string based on nesting level
const char* LogManager::indent() {
  static const char* indents[] = {
    "",         // Level 0: no indent
    "  ",       // Level 1: 2 spaces
    "    ",     // Level 2: 4 spaces
    "      "    // Level 3+: 6 spaces
};

  uint8_t level = nestLevel;
  if (level > 3) level = 3;
  return indents[level];
}

void LogManager::logBegin(const char* module) {
  char line[128];
  snprintf(line, sizeof(line), "%s[%s] Starting...\n", indent(), module);
  writeLine(line);

  if (nestLevel < 3) {
    startTimes[nestLevel] = monotonicMillis();
  }
  if (nestLevel < 255) {
    nestLevel++;
  }
}

// Messages may be long (configuration JSON), so no fixed-size buffer here.
void LogManager::logLine(const char* message) {
  std::string line(indent());
  line += message ? message : "";
  line += '\n';
  writeLine(line.c_str());
}

void LogManager::logLinef(const char* format, ...) {
  char msgbuf[256];
  va_list args;
  va_start(args, format);
  vsnprintf(msgbuf, sizeof(msgbuf), format, args);
  va_end(args);
  logLine(msgbuf);
}

void LogManager::logEnd(const char* message) {
  if (nestLevel > 0) {
    nestLevel--;
  } else {
    // Extra end() calls are ignored
    return;
  }

  uint64_t elapsed = 0;
  if (nestLevel < 3) {
    elapsed = monotonicMillis() - startTimes[nestLevel];
  }

  const char* msg = (message && strlen(message) > 0) ? message : "Done";
  char line[160];
  snprintf(line, sizeof(line), "%s%s (%llums)\n", indent(), msg, (unsigned long long)elapsed);
  writeLine(line);
}

void LogManager::logMessage(const char* module, const char* message) {
  std::string line(indent());
  line += '[';
  line += module;
  line += "] ";
  line += message ? message : "";
  line += '\n';
  writeLine(line.c_str());
}

void LogManager::logMessagef(const char* module, const char* format, ...) {
  char msgbuf[256];
  va_list args;
  va_start(args, format);
  vsnprintf(msgbuf, sizeof(msgbuf), format, args);
  va_end(args);
  logMessage(module, msgbuf);
}
