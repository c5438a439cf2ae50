#pragma once

#include <string>

#include "config.h"

// Millidegrees from a thermal zone file ("48312\n" -> 48.312).
bool readThermalZone(const char* path, float& outC);

// Parses `vcgencmd measure_temp` output ("temp=48.3'C").
bool parseVcgencmdOutput(const std::string& text, float& outC);

// Runs `command` and parses its output as above.
bool readVcgencmd(const char* command, float& outC);

// Thermal zone first, vcgencmd as fallback. False if neither works.
bool readCpuTempC(float& outC);

// Clamped to [TEMP_MIN_C, TEMP_MAX_C], rounded half to even, no decimal point.
// "--" when there is no reading.
std::string formatTempC(bool haveReading, float tempC);
