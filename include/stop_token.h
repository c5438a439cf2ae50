#pragma once

#include <signal.h>

// Cooperative cancellation for the render loop and every animation sub-loop.
// Loops check stopRequested() once per frame.
class StopToken {
public:
  bool stopRequested() const { return flag != 0; }
  void requestStop() { flag = 1; }

private:
  volatile sig_atomic_t flag = 0;
};

// SIGINT and SIGTERM call token.requestStop(). The token must outlive the process loop.
bool installStopSignals(StopToken& token);
