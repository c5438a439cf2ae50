#include "cpu_temp.h"

#include <errno.h>
#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include <sys/wait.h>

#include <regex>

static std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos) return std::string();
  size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

bool readThermalZone(const char* path, float& outC) {
  FILE* f = fopen(path, "r");
  if (!f) return false;
  char buf[32] = {0};
  size_t n = fread(buf, 1, sizeof(buf) - 1, f);
  fclose(f);

  std::string s = trim(std::string(buf, n));
  if (s.empty()) return false;

  errno = 0;
  char* end = nullptr;
  long milli = strtol(s.c_str(), &end, 10);
  if (errno != 0 || *end != '\0') return false;

  outC = (float)((double)milli / 1000.0);
  return true;
}

bool parseVcgencmdOutput(const std::string& text, float& outC) {
  static const std::regex pattern(R"(temp=([\d\.]+))");
  std::smatch m;
  if (!std::regex_search(text, m, pattern)) return false;

  std::string num = m[1].str();
  errno = 0;
  char* end = nullptr;
  double v = strtod(num.c_str(), &end);
  if (end == num.c_str() || *end != '\0' || errno != 0) return false;

  outC = (float)v;
  return true;
}

bool readVcgencmd(const char* command, float& outC) {
  FILE* p = popen(command, "r");
  if (!p) return false;

  std::string out;
  char buf[128];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), p)) > 0) {
    out.append(buf, n);
  }

  int status = pclose(p);
  if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) return false;
  return parseVcgencmdOutput(out, outC);
}

bool readCpuTempC(float& outC) {
  if (readThermalZone(THERMAL_ZONE_PATH, outC)) return true;
  return readVcgencmd(VCGENCMD_COMMAND, outC);
}

std::string formatTempC(bool haveReading, float tempC) {
  if (!haveReading || isnan(tempC)) return "--";

  double t = tempC;
  if (t < TEMP_MIN_C) t = TEMP_MIN_C;
  if (t > TEMP_MAX_C) t = TEMP_MAX_C;
  // default rounding mode: ties go to the even neighbour
  long v = lrint(t);
  return std::to_string(v);
}
