#include <stdio.h>
#include <string.h>

#include <exception>

#include "app_config.h"
#include "clock_app.h"
#include "config.h"
#include "log_manager.h"
#include "max7219.h"
#include "stop_token.h"
#include "timing.h"

// =========================
// Setup / Loop
// =========================
static Max7219Options deviceOptions(const AppConfig& cfg) {
  Max7219Options o;
  o.spiPort = cfg.spiPort;
  o.spiDevice = cfg.spiDevice;
  o.busHz = cfg.busHz;
  o.cascaded = cfg.cascaded;
  o.blockOrientation = cfg.blockOrientation;
  o.rotate = cfg.rotate;
  return o;
}

int main(int argc, char** argv) {
  Logger.begin();

  AppConfig cfg;
  loadConfigFromEnv(cfg);

  if (argc > 1 && strcmp(argv[1], "--print-config") == 0) {
    printf("%s\n", configToJson(cfg, true).c_str());
    return 0;
  }

  Logger.logMessagef("BOOT", "led-clock %s", FIRMWARE_VERSION);
  Logger.logMessage("CONFIG", configToJson(cfg).c_str());

  StopToken stop;
  if (!installStopSignals(stop)) {
    Logger.logMessage("ERROR", "Failed to install signal handlers");
    return 1;
  }

  Max7219 device(deviceOptions(cfg));
  if (!device.begin()) {
    Logger.logMessage("ERROR", "Display init failed");
    return 1;
  }

  SystemTiming timing;
  ClockApp app(device, cfg, timing, stop);
  try {
    app.run();
  } catch (const std::exception& e) {
    Logger.logMessagef("ERROR", "Clock loop failed: %s", e.what());
    return 1;
  }

  Logger.logMessage("BOOT", "Bye");
  return 0;
}
